#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include <string>
#include <vector>

#include "MockConfirmer.hpp"
#include "MockMailboxSession.hpp"
#include "mailarchive/archive_exception.hpp"
#include "mailarchive/retention_engine.hpp"
#include "mailarchive/retention_filter.hpp"

using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class RetentionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        session = std::make_shared<NiceMock<MockMailboxSession>>();
        confirmer = std::make_shared<StrictMock<MockConfirmer>>();
        engine = std::make_shared<RetentionEngine>(session, confirmer);
    }

    std::shared_ptr<NiceMock<MockMailboxSession>> session;
    std::shared_ptr<StrictMock<MockConfirmer>> confirmer;
    std::shared_ptr<RetentionEngine> engine;
};

TEST_F(RetentionEngineTest, CutoffSearchesBeforeStartOfDay) {
    time_t cutoff = RetentionFilter::cutoffForExpression("30D", time(nullptr));
    time_t day = RetentionFilter::startOfLocalDay(cutoff);

    EXPECT_CALL(*session, selectFolder("INBOX", false)).WillOnce(Return(10));
    EXPECT_CALL(*session, search("INBOX", AllOf(Field(&SearchCriteria::all, false), Field(&SearchCriteria::before, day))))
        .WillOnce(Return(std::vector<uint32_t>{1, 2, 3}));

    RetentionResult result = engine->deleteMessages("INBOX", true, cutoff);

    EXPECT_EQ(result.status, RetentionStatus::DryRun);
    EXPECT_EQ(result.messageCount, 10u);
    EXPECT_EQ(result.matched, 3u);
    EXPECT_EQ(result.filterDescription, RetentionEngine::describeCutoff(cutoff));
}

TEST_F(RetentionEngineTest, NoCutoffSearchesEverything) {
    EXPECT_CALL(*session, selectFolder("INBOX", false)).WillOnce(Return(4));
    EXPECT_CALL(*session, search("INBOX", Field(&SearchCriteria::all, true)))
        .WillOnce(Return(std::vector<uint32_t>{1, 2, 3, 4}));

    RetentionResult result = engine->deleteMessages("INBOX", true);

    EXPECT_EQ(result.matched, 4u);
    EXPECT_EQ(result.filterDescription, "all messages");
}

TEST_F(RetentionEngineTest, DryRunNeverDeletesOrAsks) {
    ON_CALL(*session, selectFolder(_, _)).WillByDefault(Return(2));
    ON_CALL(*session, search(_, _)).WillByDefault(Return(std::vector<uint32_t>{7, 8}));
    EXPECT_CALL(*session, deleteMessages(_, _)).Times(0);
    EXPECT_CALL(*session, expunge(_)).Times(0);

    RetentionResult result = engine->deleteMessages("INBOX", true);

    EXPECT_EQ(result.status, RetentionStatus::DryRun);
    EXPECT_EQ(result.deleted, 0u);
}

TEST_F(RetentionEngineTest, EmptyFolderStopsEarly) {
    EXPECT_CALL(*session, selectFolder("Trash", false)).WillOnce(Return(0));
    EXPECT_CALL(*session, search(_, _)).Times(0);

    RetentionResult result = engine->deleteMessages("Trash", false);

    EXPECT_EQ(result.status, RetentionStatus::Empty);
    EXPECT_TRUE(result.succeeded());
}

TEST_F(RetentionEngineTest, NoMatchesStopsBeforeConfirming) {
    ON_CALL(*session, selectFolder(_, _)).WillByDefault(Return(5));
    ON_CALL(*session, search(_, _)).WillByDefault(Return(std::vector<uint32_t>{}));
    EXPECT_CALL(*session, deleteMessages(_, _)).Times(0);

    RetentionResult result = engine->deleteMessages("INBOX", false, time(nullptr));

    EXPECT_EQ(result.status, RetentionStatus::NoMatches);
    EXPECT_EQ(result.matched, 0u);
}

TEST_F(RetentionEngineTest, DecliningFirstPromptDeletesNothing) {
    ON_CALL(*session, selectFolder(_, _)).WillByDefault(Return(2));
    ON_CALL(*session, search(_, _)).WillByDefault(Return(std::vector<uint32_t>{1, 2}));
    EXPECT_CALL(*confirmer, confirm(HasSubstr("Are you sure"))).WillOnce(Return(false));
    EXPECT_CALL(*session, deleteMessages(_, _)).Times(0);
    EXPECT_CALL(*session, expunge(_)).Times(0);

    RetentionResult result = engine->deleteMessages("INBOX", false);

    EXPECT_EQ(result.status, RetentionStatus::Declined);
    EXPECT_EQ(result.deleted, 0u);
}

TEST_F(RetentionEngineTest, DecliningSecondPromptDeletesNothing) {
    ON_CALL(*session, selectFolder(_, _)).WillByDefault(Return(2));
    ON_CALL(*session, search(_, _)).WillByDefault(Return(std::vector<uint32_t>{1, 2}));
    {
        InSequence seq;
        EXPECT_CALL(*confirmer, confirm(HasSubstr("Are you sure"))).WillOnce(Return(true));
        EXPECT_CALL(*confirmer, confirm(HasSubstr("cannot be undone"))).WillOnce(Return(false));
    }
    EXPECT_CALL(*session, deleteMessages(_, _)).Times(0);
    EXPECT_CALL(*session, expunge(_)).Times(0);

    RetentionResult result = engine->deleteMessages("INBOX", false);

    EXPECT_EQ(result.status, RetentionStatus::Declined);
}

TEST_F(RetentionEngineTest, ConfirmedDeleteFlagsThenExpunges) {
    ON_CALL(*session, selectFolder(_, _)).WillByDefault(Return(3));
    ON_CALL(*session, search(_, _)).WillByDefault(Return(std::vector<uint32_t>{4, 5, 6}));
    EXPECT_CALL(*confirmer, confirm(_)).Times(2).WillRepeatedly(Return(true));
    {
        InSequence seq;
        EXPECT_CALL(*session, deleteMessages("INBOX", std::vector<uint32_t>{4, 5, 6})).Times(1);
        EXPECT_CALL(*session, expunge("INBOX")).Times(1);
    }

    RetentionResult result = engine->deleteMessages("INBOX", false);

    EXPECT_EQ(result.status, RetentionStatus::Completed);
    EXPECT_EQ(result.deleted, result.matched);
    EXPECT_EQ(result.deleted, 3u);
}

TEST_F(RetentionEngineTest, SelectFailureIsReported) {
    EXPECT_CALL(*session, selectFolder("Gone", false))
        .WillOnce(Throw(ArchiveException(ErrorKind::FolderAccess, "ErrorNonExistantFolder", "select Gone")));

    RetentionResult result = engine->deleteMessages("Gone", false);

    EXPECT_EQ(result.status, RetentionStatus::Failed);
    EXPECT_EQ(result.error.kind, ErrorKind::FolderAccess);
}

TEST_F(RetentionEngineTest, StoreFailureLeavesNothingDeleted) {
    ON_CALL(*session, selectFolder(_, _)).WillByDefault(Return(1));
    ON_CALL(*session, search(_, _)).WillByDefault(Return(std::vector<uint32_t>{9}));
    EXPECT_CALL(*confirmer, confirm(_)).Times(2).WillRepeatedly(Return(true));
    EXPECT_CALL(*session, deleteMessages(_, _))
        .WillOnce(Throw(ArchiveException(ErrorKind::FolderAccess, "ErrorStore", "storeFlagsByUID INBOX")));
    EXPECT_CALL(*session, expunge(_)).Times(0);

    RetentionResult result = engine->deleteMessages("INBOX", false);

    EXPECT_EQ(result.status, RetentionStatus::Failed);
    EXPECT_EQ(result.deleted, 0u);
    EXPECT_EQ(result.toJSON()["error"]["key"], "ErrorStore");
}

TEST_F(RetentionEngineTest, EpochCutoffStillFilters) {
    EXPECT_CALL(*session, selectFolder("INBOX", false)).WillOnce(Return(3));
    EXPECT_CALL(*session, search("INBOX", Field(&SearchCriteria::all, false))).WillOnce(Return(std::vector<uint32_t>{}));
    EXPECT_CALL(*session, deleteMessages(_, _)).Times(0);

    RetentionResult result = engine->deleteMessages("INBOX", false, (time_t)0);

    EXPECT_EQ(result.status, RetentionStatus::NoMatches);
    EXPECT_NE(result.filterDescription, "all messages");
}

TEST(RetentionEngineDescribe, CutoffDescription) {
    time_t cutoff = 1700000000;
    EXPECT_EQ(RetentionEngine::describeCutoff(std::nullopt), "all messages");
    EXPECT_THAT(RetentionEngine::describeCutoff(cutoff), HasSubstr("older than 2023-11-"));
}
