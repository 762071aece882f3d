#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "MockShareSession.hpp"
#include "mailarchive/archive_exception.hpp"
#include "mailarchive/upload_engine.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class UploadEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() / "mailarchive_upload_test";
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);

        config = std::make_shared<ShareConfig>(nlohmann::json({
            {"host", "nas"},
            {"share", "backup"},
            {"username", "archiver"},
            {"password", "secret"},
            {"base_path", "/mail-archive"},
        }));
        session = std::make_shared<NiceMock<MockShareSession>>();
        engine = std::make_shared<UploadEngine>(session, config);

        ON_CALL(*session, stat(_)).WillByDefault(Invoke(session.get(), &MockShareSession::mock_stat));
        ON_CALL(*session, openForWrite(_)).WillByDefault(Invoke(session.get(), &MockShareSession::mock_openForWrite));
    }

    void TearDown() override {
        std::filesystem::remove_all(root);
    }

    void writeLocal(const std::string & relative, const std::string & contents) {
        std::filesystem::path path = root / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << contents;
    }

    // Three files in two message directories, 7 + 5 + 3 bytes.
    void writeArchive() {
        writeLocal("INBOX/msg1/email.raw", "raw one");
        writeLocal("INBOX/msg1/a.pdf", "a pdf");
        writeLocal("INBOX/msg2/email.raw", "two");
    }

    std::filesystem::path root;
    std::shared_ptr<ShareConfig> config;
    std::shared_ptr<NiceMock<MockShareSession>> session;
    std::shared_ptr<UploadEngine> engine;
};

TEST_F(UploadEngineTest, RemotePathsUseBackslashes) {
    EXPECT_EQ(engine->remoteBase(), "\\\\nas\\backup\\mail-archive");
    std::string remote = engine->remotePathFor(root.string(), (root / "INBOX" / "msg1" / "email.raw").string());
    EXPECT_EQ(remote, "\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\email.raw");
}

TEST_F(UploadEngineTest, RemotePathIgnoresTrailingSeparatorOnRoot) {
    std::string remote = engine->remotePathFor(root.string() + "/", (root / "INBOX" / "a.txt").string());
    EXPECT_EQ(remote, "\\\\nas\\backup\\mail-archive\\INBOX\\a.txt");
}

TEST_F(UploadEngineTest, UploadsEveryFileWithContents) {
    writeArchive();
    EXPECT_CALL(*session, registerSession("nas", "archiver", "secret")).Times(1);

    UploadResult result = engine->upload(root.string(), false, false);

    EXPECT_EQ(result.status, UploadStatus::Completed);
    EXPECT_EQ(result.totalFiles, 3u);
    EXPECT_EQ(result.uploaded, 3u);
    EXPECT_EQ(result.skipped, 0u);
    EXPECT_EQ(result.bytes, 15u);
    EXPECT_EQ(result.totalBytes, 15u);
    EXPECT_EQ(session->written["\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\email.raw"], "raw one");
    EXPECT_EQ(session->written["\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\a.pdf"], "a pdf");
    EXPECT_EQ(session->written["\\\\nas\\backup\\mail-archive\\INBOX\\msg2\\email.raw"], "two");
}

TEST_F(UploadEngineTest, ExistingFilesAreSkippedWithoutOverwrite) {
    writeArchive();
    session->existing = {
        "\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\email.raw",
        "\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\a.pdf",
        "\\\\nas\\backup\\mail-archive\\INBOX\\msg2\\email.raw",
    };
    EXPECT_CALL(*session, openForWrite(_)).Times(0);

    UploadResult result = engine->upload(root.string(), false, false);

    EXPECT_EQ(result.uploaded, 0u);
    EXPECT_EQ(result.skipped, 3u);
    EXPECT_EQ(result.bytes, 0u);
}

TEST_F(UploadEngineTest, OverwriteReplacesExistingFiles) {
    writeArchive();
    session->existing = {
        "\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\email.raw",
        "\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\a.pdf",
        "\\\\nas\\backup\\mail-archive\\INBOX\\msg2\\email.raw",
    };
    EXPECT_CALL(*session, stat(_)).Times(0);

    UploadResult result = engine->upload(root.string(), false, true);

    EXPECT_EQ(result.uploaded, 3u);
    EXPECT_EQ(result.skipped, 0u);
}

TEST_F(UploadEngineTest, DryRunMakesNoShareCalls) {
    writeArchive();
    EXPECT_CALL(*session, registerSession(_, _, _)).Times(0);
    EXPECT_CALL(*session, makeDirectories(_)).Times(0);
    EXPECT_CALL(*session, stat(_)).Times(0);
    EXPECT_CALL(*session, openForWrite(_)).Times(0);

    UploadResult result = engine->upload(root.string(), true, false);

    EXPECT_EQ(result.status, UploadStatus::DryRun);
    EXPECT_EQ(result.totalFiles, 3u);
    EXPECT_EQ(result.uploaded, 3u);
    EXPECT_EQ(result.bytes, 15u);
}

TEST_F(UploadEngineTest, RegisterFailureIsAConnectionError) {
    writeArchive();
    EXPECT_CALL(*session, registerSession(_, _, _))
        .WillOnce(Throw(ArchiveException(ErrorKind::Connection, "ErrorShareUnavailable", "Connection refused")));
    EXPECT_CALL(*session, makeDirectories(_)).Times(0);
    EXPECT_CALL(*session, openForWrite(_)).Times(0);

    UploadResult result = engine->upload(root.string(), false, false);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.error.kind, ErrorKind::Connection);
    EXPECT_EQ(result.uploaded, 0u);
    EXPECT_EQ(result.bytes, 0u);
}

TEST_F(UploadEngineTest, ParentDirectoriesAreCreatedOncePerDirectory) {
    writeArchive();
    EXPECT_CALL(*session, makeDirectories("\\\\nas\\backup\\mail-archive")).Times(1);
    EXPECT_CALL(*session, makeDirectories("\\\\nas\\backup\\mail-archive\\INBOX\\msg1")).Times(1);
    EXPECT_CALL(*session, makeDirectories("\\\\nas\\backup\\mail-archive\\INBOX\\msg2")).Times(1);

    UploadResult result = engine->upload(root.string(), false, false);

    EXPECT_EQ(result.uploaded, 3u);
}

TEST_F(UploadEngineTest, WriteFailureOnlyFailsThatFile) {
    writeArchive();
    EXPECT_CALL(*session, openForWrite(_)).WillRepeatedly(Invoke(session.get(), &MockShareSession::mock_openForWrite));
    EXPECT_CALL(*session, openForWrite("\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\a.pdf"))
        .WillOnce(Throw(ArchiveException(ErrorKind::PerItem, "ErrorShareWrite", "Permission denied")));

    UploadResult result = engine->upload(root.string(), false, false);

    EXPECT_EQ(result.status, UploadStatus::Completed);
    EXPECT_EQ(result.uploaded, 2u);
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.bytes, 10u);
    EXPECT_EQ(result.totalBytes, 15u);
    for (const auto & record : result.files) {
        if (record.outcome == FileOutcome::Failed) {
            EXPECT_EQ(record.remotePath, "\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\a.pdf");
            EXPECT_EQ(record.error.key, "ErrorShareWrite");
        }
    }
}

TEST_F(UploadEngineTest, EmptyFilesAreUploaded) {
    writeLocal("INBOX/msg1/empty.txt", "");

    UploadResult result = engine->upload(root.string(), false, false);

    EXPECT_EQ(result.uploaded, 1u);
    EXPECT_EQ(result.bytes, 0u);
    EXPECT_EQ(session->written.count("\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\empty.txt"), 1u);
}

TEST_F(UploadEngineTest, FallsBackToIncrementalCreateOnMissingParent) {
    InSequence seq;
    EXPECT_CALL(*session, makeDirectories("\\\\nas\\backup\\archive\\2024"))
        .WillOnce(Throw(ArchiveException(ErrorKind::FolderAccess, "ErrorShareMkdir", "No such file or directory")));
    EXPECT_CALL(*session, makeDirectories("\\\\nas\\backup\\archive")).Times(1);
    EXPECT_CALL(*session, makeDirectories("\\\\nas\\backup\\archive\\2024")).Times(1);

    engine->ensureDirectoryExists("\\\\nas\\backup\\archive\\2024");
}

TEST_F(UploadEngineTest, FallsBackOnObjectPathNotFoundStatus) {
    InSequence seq;
    EXPECT_CALL(*session, makeDirectories("\\\\nas\\backup\\a\\b"))
        .WillOnce(Throw(ArchiveException(ErrorKind::FolderAccess, "ErrorShareMkdir", "[NT Status 0xc000003a] path not found")));
    EXPECT_CALL(*session, makeDirectories("\\\\nas\\backup\\a"))
        .WillOnce(Throw(ArchiveException(ErrorKind::FolderAccess, "ErrorShareMkdir", "Object name collision")));
    EXPECT_CALL(*session, makeDirectories("\\\\nas\\backup\\a\\b")).Times(1);

    engine->ensureDirectoryExists("\\\\nas\\backup\\a\\b");
}

TEST_F(UploadEngineTest, OtherCreateErrorsAreOnlyWarnings) {
    EXPECT_CALL(*session, makeDirectories(_))
        .WillOnce(Throw(ArchiveException(ErrorKind::FolderAccess, "ErrorShareMkdir", "Access denied")));

    EXPECT_NO_THROW(engine->ensureDirectoryExists("\\\\nas\\backup\\a\\b"));
}

TEST_F(UploadEngineTest, ResultSerializesTotals) {
    writeArchive();

    nlohmann::json j = engine->upload(root.string(), true, false).toJSON();

    EXPECT_EQ(j["status"], "dry-run");
    EXPECT_EQ(j["totalFiles"], 3);
    EXPECT_EQ(j["totalBytes"], 15);
    EXPECT_THAT(j["destination"].get<std::string>(), HasSubstr("mail-archive"));
}

TEST_F(UploadEngineTest, BrokenLinksInTheTreeAreSkipped) {
    writeArchive();
    std::filesystem::create_symlink(root / "gone" / "attachment.pdf", root / "INBOX" / "msg1" / "old.pdf");

    UploadResult result;
    EXPECT_NO_THROW(result = engine->upload(root.string(), false, false));

    EXPECT_EQ(result.status, UploadStatus::Completed);
    EXPECT_EQ(result.totalFiles, 3u);
    EXPECT_EQ(result.uploaded, 3u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_EQ(result.totalBytes, 15u);
    EXPECT_EQ(session->written.count("\\\\nas\\backup\\mail-archive\\INBOX\\msg1\\old.pdf"), 0u);
}
