#include "mailarchive/retention_engine.hpp"
#include "mailarchive/mail_utils.hpp"
#include "mailarchive/retention_filter.hpp"

static std::string nameForRetentionStatus(RetentionStatus status) {
    switch (status) {
        case RetentionStatus::Completed:
            return "completed";
        case RetentionStatus::DryRun:
            return "dry-run";
        case RetentionStatus::Empty:
            return "empty";
        case RetentionStatus::NoMatches:
            return "no-matches";
        case RetentionStatus::Declined:
            return "declined";
        case RetentionStatus::Failed:
            return "failed";
    }
    return "unknown";
}

bool RetentionResult::succeeded() const {
    return status != RetentionStatus::Failed;
}

nlohmann::json RetentionResult::toJSON() const {
    nlohmann::json j = {
        {"status", nameForRetentionStatus(status)},
        {"folder", folder},
        {"filter", filterDescription},
        {"messageCount", messageCount},
        {"matched", matched},
        {"deleted", deleted},
        {"error", nullptr},
    };
    if (status == RetentionStatus::Failed) {
        j["error"] = error.toJSON();
    }
    return j;
}

RetentionEngine::RetentionEngine(std::shared_ptr<MailboxSession> session, std::shared_ptr<Confirmer> confirmer) :
    session(session), confirmer(confirmer), logger(spdlog::get("logger"))
{
}

std::string RetentionEngine::describeCutoff(std::optional<time_t> cutoff) {
    if (!cutoff) {
        return "all messages";
    }
    return "older than " + MailUtils::localDateForTime(*cutoff);
}

RetentionResult RetentionEngine::deleteMessages(const std::string & folder, bool dryRun, std::optional<time_t> cutoff) {
    RetentionResult result;
    result.folder = folder;
    result.filterDescription = describeCutoff(cutoff);

    std::vector<uint32_t> uids;
    try {
        result.messageCount = session->selectFolder(folder, false);
        if (result.messageCount == 0) {
            logger->info("No messages in folder '{}'", folder);
            result.status = RetentionStatus::Empty;
            return result;
        }

        SearchCriteria criteria = SearchCriteria::everything();
        if (cutoff) {
            criteria = SearchCriteria::receivedBefore(RetentionFilter::startOfLocalDay(*cutoff));
        }
        uids = session->search(folder, criteria);
    } catch (ArchiveException & ex) {
        logger->error("Error selecting folder '{}': {}", folder, ex.what());
        result.status = RetentionStatus::Failed;
        result.error = ex.toError();
        return result;
    }

    result.matched = (unsigned int)uids.size();
    if (result.matched == 0) {
        logger->info("No messages to delete ({}) in folder '{}'", result.filterDescription, folder);
        result.status = RetentionStatus::NoMatches;
        return result;
    }

    if (dryRun) {
        logger->info("[dry run] Would delete {} of {} messages in '{}' ({})", result.matched, result.messageCount, folder, result.filterDescription);
        result.status = RetentionStatus::DryRun;
        return result;
    }

    logger->warn("This will permanently delete {} of {} messages in '{}' ({})", result.matched, result.messageCount, folder, result.filterDescription);
    if (!confirmer->confirm("Are you sure you want to delete these messages?") ||
        !confirmer->confirm("This action cannot be undone. Type 'yes' to confirm deletion")) {
        logger->info("Deletion cancelled");
        result.status = RetentionStatus::Declined;
        return result;
    }

    try {
        session->deleteMessages(folder, uids);
        session->expunge(folder);
    } catch (ArchiveException & ex) {
        logger->error("Deleting messages from '{}' failed: {}", folder, ex.what());
        result.status = RetentionStatus::Failed;
        result.error = ex.toError();
        return result;
    }

    logger->info("Deleted {} messages from '{}'", result.matched, folder);
    result.deleted = result.matched;
    result.status = RetentionStatus::Completed;
    return result;
}
