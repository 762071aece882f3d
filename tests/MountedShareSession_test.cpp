#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "mailarchive/archive_exception.hpp"
#include "mailarchive/mounted_share_session.hpp"

class MountedShareSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        mount = std::filesystem::temp_directory_path() / "mailarchive_mount_test";
        std::filesystem::remove_all(mount);
        std::filesystem::create_directories(mount);
    }

    void TearDown() override {
        std::filesystem::remove_all(mount);
    }

    std::filesystem::path mount;
};

TEST_F(MountedShareSessionTest, RegisterFailsWhenNotMounted) {
    MountedShareSession session((mount / "missing").string());
    try {
        session.registerSession("nas", "archiver", "secret");
        FAIL() << "expected an exception";
    } catch (ArchiveException & ex) {
        EXPECT_EQ(ex.kind, ErrorKind::Connection);
        EXPECT_EQ(ex.key, "ErrorShareUnavailable");
    }
}

TEST_F(MountedShareSessionTest, MapsUncPathsOntoTheMount) {
    MountedShareSession session(mount.string());
    EXPECT_EQ(session.localPathFor("\\\\nas\\backup\\a\\b.txt"), mount / "a" / "b.txt");
    EXPECT_EQ(session.localPathFor("\\\\nas\\backup"), mount);
    EXPECT_EQ(session.localPathFor("\\\\nas\\backup\\..\\..\\etc"), mount / "etc");
    EXPECT_THROW(session.localPathFor("relative\\path"), ArchiveException);
}

TEST_F(MountedShareSessionTest, CreatesWritesAndStats) {
    MountedShareSession session(mount.string());
    session.registerSession("nas", "archiver", "secret");

    session.makeDirectories("\\\\nas\\backup\\mail-archive\\INBOX");
    {
        std::unique_ptr<std::ostream> out = session.openForWrite("\\\\nas\\backup\\mail-archive\\INBOX\\email.raw");
        *out << "hello";
    }

    std::ifstream in(mount / "mail-archive" / "INBOX" / "email.raw");
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_EQ(contents.str(), "hello");

    ShareEntryInfo file = session.stat("\\\\nas\\backup\\mail-archive\\INBOX\\email.raw");
    EXPECT_FALSE(file.isDirectory);
    EXPECT_EQ(file.size, 5u);
    EXPECT_TRUE(session.stat("\\\\nas\\backup\\mail-archive").isDirectory);

    std::vector<std::string> names = session.listDirectory("\\\\nas\\backup\\mail-archive\\INBOX");
    EXPECT_EQ(names, std::vector<std::string>{"email.raw"});
}

TEST_F(MountedShareSessionTest, MakeDirectoriesSucceedsWhenPresent) {
    MountedShareSession session(mount.string());
    session.makeDirectories("\\\\nas\\backup\\a");
    EXPECT_NO_THROW(session.makeDirectories("\\\\nas\\backup\\a"));
}

TEST_F(MountedShareSessionTest, MissingEntriesAreNotFound) {
    MountedShareSession session(mount.string());
    try {
        session.stat("\\\\nas\\backup\\nothing");
        FAIL() << "expected an exception";
    } catch (ArchiveException & ex) {
        EXPECT_EQ(ex.key, "ErrorShareNotFound");
    }
    EXPECT_THROW(session.listDirectory("\\\\nas\\backup\\nothing"), ArchiveException);
}

TEST_F(MountedShareSessionTest, OpenForWriteFailsWithoutParent) {
    MountedShareSession session(mount.string());
    try {
        session.openForWrite("\\\\nas\\backup\\no\\such\\dir\\file.txt");
        FAIL() << "expected an exception";
    } catch (ArchiveException & ex) {
        EXPECT_EQ(ex.kind, ErrorKind::PerItem);
        EXPECT_EQ(ex.key, "ErrorShareWrite");
    }
}
