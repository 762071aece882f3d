#include <filesystem>
#include <fstream>

#include "mailarchive/download_engine.hpp"
#include "mailarchive/constants.hpp"
#include "mailarchive/mail_utils.hpp"
#include "mailarchive/name_policy.hpp"

using namespace mailcore;

static std::string nameForMessageOutcome(MessageOutcome outcome) {
    switch (outcome) {
        case MessageOutcome::Downloaded:
            return "downloaded";
        case MessageOutcome::Skipped:
            return "skipped";
        case MessageOutcome::Failed:
            return "failed";
    }
    return "unknown";
}

static std::string nameForDownloadStatus(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Completed:
            return "completed";
        case DownloadStatus::DryRun:
            return "dry-run";
        case DownloadStatus::Empty:
            return "empty";
        case DownloadStatus::Failed:
            return "failed";
    }
    return "unknown";
}

static void writeFile(const std::filesystem::path & path, const char * bytes, size_t length) {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    out.write(bytes, length);
    out.close();
    if (out.fail()) {
        throw ArchiveException(ErrorKind::PerItem, "ErrorFile", "Could not write " + path.string());
    }
}

nlohmann::json MessageRecord::toJSON() const {
    nlohmann::json j = {
        {"uid", uid},
        {"outcome", nameForMessageOutcome(outcome)},
        {"directory", directory},
        {"attachments", attachments},
    };
    if (outcome == MessageOutcome::Failed) {
        j["error"] = error.toJSON();
    }
    return j;
}

bool DownloadResult::succeeded() const {
    return status != DownloadStatus::Failed;
}

nlohmann::json DownloadResult::toJSON() const {
    nlohmann::json j = {
        {"status", nameForDownloadStatus(status)},
        {"folder", folder},
        {"destination", destination},
        {"messageCount", messageCount},
        {"downloaded", downloaded},
        {"skipped", skipped},
        {"failed", failed},
        {"attachments", attachments},
        {"error", nullptr},
    };
    if (status == DownloadStatus::Failed) {
        j["error"] = error.toJSON();
    }
    return j;
}

DownloadEngine::DownloadEngine(std::shared_ptr<MailboxSession> session) :
    session(session), logger(spdlog::get("logger"))
{
}

std::string DownloadEngine::folderDirectoryName(const std::string & folder) {
    return NamePolicy::sanitize(folder);
}

std::string DownloadEngine::messageDirectoryName(time_t arrivedAt, uint32_t uid, const std::string & subject) {
    std::string safeSubject = NamePolicy::truncate(NamePolicy::sanitize(subject), MAX_SUBJECT_LENGTH);
    return MailUtils::localTimestampForTime(arrivedAt) + "_" + std::to_string(uid) + "_" + safeSubject;
}

DownloadResult DownloadEngine::download(const std::string & folder, const std::string & destinationRoot, bool dryRun) {
    DownloadResult result;
    result.folder = folder;
    result.destination = (std::filesystem::path(destinationRoot) / folderDirectoryName(folder)).string();

    std::vector<uint32_t> uids;
    try {
        result.messageCount = session->selectFolder(folder, true);
        if (result.messageCount == 0) {
            logger->info("Folder {} is empty", folder);
            result.status = DownloadStatus::Empty;
            return result;
        }
        if (dryRun) {
            logger->info("[dry run] {} messages in {} would be downloaded to {}", result.messageCount, folder, result.destination);
            result.downloaded = result.messageCount;
            result.status = DownloadStatus::DryRun;
            return result;
        }
        uids = session->search(folder, SearchCriteria::everything());
    } catch (ArchiveException & ex) {
        logger->error("Unable to open folder {}: {}", folder, ex.what());
        result.status = DownloadStatus::Failed;
        result.error = ex.toError();
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(result.destination, ec);
    if (ec) {
        logger->error("Unable to create {}: {}", result.destination, ec.message());
        result.status = DownloadStatus::Failed;
        result.error = {ErrorKind::FolderAccess, "ErrorFile", ec.message() + ": " + result.destination};
        return result;
    }

    logger->info("Downloading {} messages from {} to {}", uids.size(), folder, result.destination);

    for (uint32_t uid : uids) {
        MessageRecord record = downloadMessage(folder, uid, result.destination);
        if (record.outcome == MessageOutcome::Downloaded) {
            result.downloaded++;
            result.attachments += record.attachments;
        } else if (record.outcome == MessageOutcome::Skipped) {
            result.skipped++;
        } else {
            result.failed++;
        }
        result.messages.push_back(record);
    }

    logger->info("Downloaded {} messages and {} attachments from {} ({} skipped, {} failed)",
                 result.downloaded, result.attachments, folder, result.skipped, result.failed);
    result.status = DownloadStatus::Completed;
    return result;
}

MessageRecord DownloadEngine::downloadMessage(const std::string & folder, uint32_t uid, const std::string & folderOutput) {
    AutoreleasePool pool;
    MessageRecord record;
    record.uid = uid;

    try {
        std::map<uint32_t, FetchedMessage> fetched = session->fetch(folder, {uid});
        if (!fetched.count(uid)) {
            throw ArchiveException(ErrorKind::PerItem, "ErrorMessageNotFound", "UID " + std::to_string(uid) + " was not returned by the server");
        }
        FetchedMessage & message = fetched[uid];
        time_t arrivedAt = message.arrivedAt ? message.arrivedAt : time(nullptr);

        MessageParser * parser = MessageParser::messageParserWithData(Data::dataWithBytes(message.raw.data(), (unsigned int)message.raw.size()));
        std::string subject = DEFAULT_SUBJECT;
        if (parser->header()->subject() != nullptr) {
            subject = parser->header()->subject()->UTF8Characters();
        }

        std::filesystem::path dir = std::filesystem::path(folderOutput) / messageDirectoryName(arrivedAt, uid, subject);
        std::filesystem::path rawPath = dir / RAW_MESSAGE_FILENAME;
        record.directory = dir.string();

        std::error_code ec;
        if (std::filesystem::exists(rawPath, ec) && std::filesystem::file_size(rawPath, ec) == message.raw.size()) {
            logger->debug("Skipping UID {}, {} exists with the same size", uid, rawPath.string());
            record.outcome = MessageOutcome::Skipped;
            return record;
        }

        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw ArchiveException(ErrorKind::PerItem, "ErrorFile", ec.message() + ": " + dir.string());
        }
        writeFile(rawPath, message.raw.data(), message.raw.size());

        record.attachments = saveAttachments(parser, dir.string());
        record.outcome = MessageOutcome::Downloaded;
        logger->debug("Downloaded UID {} with {} attachments", uid, record.attachments);

    } catch (ArchiveException & ex) {
        logger->error("Error processing message {} in {}: {}", uid, folder, ex.what());
        record.outcome = MessageOutcome::Failed;
        record.error = ex.toError();
        record.error.kind = ErrorKind::PerItem;
    } catch (std::filesystem::filesystem_error & ex) {
        logger->error("Error processing message {} in {}: {}", uid, folder, ex.what());
        record.outcome = MessageOutcome::Failed;
        record.error = {ErrorKind::PerItem, "ErrorFile", ex.what()};
    }
    return record;
}

unsigned int DownloadEngine::saveAttachments(MessageParser * parser, const std::string & dir) {
    AbstractPart * main = parser->mainPart();
    if (main == nullptr || main->partType() == PartTypeSingle) {
        return 0;
    }
    return saveAttachmentsInPart(main, dir);
}

unsigned int DownloadEngine::saveAttachmentsInPart(AbstractPart * part, const std::string & dir) {
    unsigned int count = 0;

    switch (part->partType()) {
        case PartTypeSingle:
            if (saveAttachment((Attachment *)part, dir)) {
                count++;
            }
            break;

        case PartTypeMessage: {
            AbstractPart * inner = ((AbstractMessagePart *)part)->mainPart();
            if (inner != nullptr) {
                count += saveAttachmentsInPart(inner, dir);
            }
            break;
        }

        case PartTypeMultipartMixed:
        case PartTypeMultipartRelated:
        case PartTypeMultipartAlternative:
        case PartTypeMultipartSigned: {
            Array * parts = ((AbstractMultipart *)part)->parts();
            for (unsigned int ii = 0; ii < parts->count(); ii ++) {
                count += saveAttachmentsInPart((AbstractPart *)parts->objectAtIndex(ii), dir);
            }
            break;
        }
    }
    return count;
}

bool DownloadEngine::saveAttachment(Attachment * part, const std::string & dir) {
    std::shared_ptr<spdlog::logger> logger = spdlog::get("logger");

    if (!part->isAttachment() && !part->isInlineAttachment()) {
        return false;
    }
    if (part->filename() == nullptr || part->filename()->length() == 0) {
        return false;
    }

    std::string filename = NamePolicy::sanitize(part->filename()->UTF8Characters());
    if (filename == "") {
        filename = UNNAMED_ATTACHMENT;
    }
    filename = NamePolicy::limitBytes(filename, MAX_ATTACHMENT_NAME_BYTES);

    Data * data = part->data();
    if (data == nullptr || data->length() == 0) {
        return false;
    }

    // a part that cannot be written is left out of the count, the message still counts as downloaded
    std::string path = NamePolicy::resolveCollision(dir, filename);
    try {
        writeFile(path, data->bytes(), data->length());
    } catch (ArchiveException & ex) {
        logger->error("Skipping attachment {}: {}", filename, ex.what());
        return false;
    }
    return true;
}
