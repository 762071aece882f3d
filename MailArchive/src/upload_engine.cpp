#include <filesystem>
#include <fstream>

#include "mailarchive/upload_engine.hpp"
#include "mailarchive/constants.hpp"
#include "mailarchive/share_path.hpp"

static std::string nameForFileOutcome(FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::Uploaded:
            return "uploaded";
        case FileOutcome::Skipped:
            return "skipped";
        case FileOutcome::Failed:
            return "failed";
    }
    return "unknown";
}

static std::string nameForUploadStatus(UploadStatus status) {
    switch (status) {
        case UploadStatus::Completed:
            return "completed";
        case UploadStatus::DryRun:
            return "dry-run";
        case UploadStatus::Failed:
            return "failed";
    }
    return "unknown";
}

nlohmann::json FileRecord::toJSON() const {
    nlohmann::json j = {
        {"localPath", localPath},
        {"remotePath", remotePath},
        {"size", size},
        {"outcome", nameForFileOutcome(outcome)},
    };
    if (outcome == FileOutcome::Failed) {
        j["error"] = error.toJSON();
    }
    return j;
}

bool UploadResult::succeeded() const {
    return status != UploadStatus::Failed;
}

nlohmann::json UploadResult::toJSON() const {
    nlohmann::json j = {
        {"status", nameForUploadStatus(status)},
        {"source", source},
        {"destination", destination},
        {"totalFiles", totalFiles},
        {"totalBytes", totalBytes},
        {"uploaded", uploaded},
        {"skipped", skipped},
        {"failed", failed},
        {"bytes", bytes},
        {"error", nullptr},
    };
    if (status == UploadStatus::Failed) {
        j["error"] = error.toJSON();
    }
    return j;
}

UploadEngine::UploadEngine(std::shared_ptr<ShareSession> session, std::shared_ptr<ShareConfig> config) :
    session(session), config(config), logger(spdlog::get("logger"))
{
}

std::string UploadEngine::remoteBase() {
    return SharePath::unc(config->host(), config->share(), SharePath::normalizeBasePath(config->basePath()));
}

std::string UploadEngine::remotePathFor(const std::string & localRoot, const std::string & localFile) {
    std::filesystem::path root(localRoot);
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    std::string relative = std::filesystem::path(localFile).lexically_relative(root).generic_string();
    return SharePath::join(remoteBase(), relative);
}

UploadResult UploadEngine::upload(const std::string & localRoot, bool dryRun, bool overwrite) {
    UploadResult result;
    result.source = localRoot;
    result.destination = remoteBase();

    // the file list is fixed before anything touches the network
    std::vector<std::pair<std::string, uint64_t>> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(localRoot, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entryError;
        if (!it->is_regular_file(entryError)) {
            continue;
        }
        uint64_t size = it->file_size(entryError);
        if (entryError) {
            // removed or unreadable since it was listed
            logger->warn("Skipping {}: {}", it->path().string(), entryError.message());
            continue;
        }
        files.push_back({it->path().string(), size});
        result.totalBytes += size;
    }
    if (ec) {
        logger->warn("Stopped scanning {}: {}", localRoot, ec.message());
    }
    result.totalFiles = (unsigned int)files.size();

    if (dryRun) {
        logger->info("[dry run] {} files ({:.2f} MB) would be uploaded to {}, overwrite existing: {}",
                     result.totalFiles, result.totalBytes / (1024.0 * 1024.0), result.destination, overwrite ? "yes" : "no");
        result.uploaded = result.totalFiles;
        result.bytes = result.totalBytes;
        result.status = UploadStatus::DryRun;
        return result;
    }

    try {
        session->registerSession(config->host(), config->username(), config->password());
    } catch (ArchiveException & ex) {
        logger->error("Share connection failed: {}", ex.what());
        result.status = UploadStatus::Failed;
        result.error = ex.toError();
        result.error.kind = ErrorKind::Connection;
        return result;
    }

    logger->debug("Creating base directory: {}", result.destination);
    ensureDirectoryExists(result.destination);

    std::set<std::string> createdDirs;
    for (const auto & file : files) {
        FileRecord record = uploadFile(localRoot, file.first, file.second, overwrite, createdDirs);
        if (record.outcome == FileOutcome::Uploaded) {
            result.uploaded++;
            result.bytes += record.size;
        } else if (record.outcome == FileOutcome::Skipped) {
            result.skipped++;
        } else {
            result.failed++;
        }
        result.files.push_back(record);
    }

    logger->info("Uploaded {} files to {} ({} skipped, {} failed)", result.uploaded, result.destination, result.skipped, result.failed);
    if (result.skipped > 0) {
        logger->info("Skipped {} existing files (use --overwrite to replace)", result.skipped);
    }
    result.status = UploadStatus::Completed;
    return result;
}

FileRecord UploadEngine::uploadFile(const std::string & localRoot, const std::string & localFile, uint64_t size, bool overwrite, std::set<std::string> & createdDirs) {
    FileRecord record;
    record.localPath = localFile;
    record.remotePath = remotePathFor(localRoot, localFile);
    record.size = size;

    std::string remoteDir = SharePath::parent(record.remotePath);
    if (!createdDirs.count(remoteDir)) {
        ensureDirectoryExists(remoteDir);
        createdDirs.insert(remoteDir);
    }

    if (!overwrite && existsOnShare(record.remotePath)) {
        logger->debug("Skipping {}, it already exists", record.remotePath);
        record.outcome = FileOutcome::Skipped;
        return record;
    }

    try {
        writeFile(localFile, record.remotePath);
        record.outcome = FileOutcome::Uploaded;
    } catch (ArchiveException & ex) {
        logger->error("Failed to upload {}: {}", localFile, ex.what());
        record.outcome = FileOutcome::Failed;
        record.error = ex.toError();
        record.error.kind = ErrorKind::PerItem;
    }
    return record;
}

bool UploadEngine::existsOnShare(const std::string & remotePath) {
    try {
        session->stat(remotePath);
        return true;
    } catch (ArchiveException & ex) {
        return false;
    }
}

void UploadEngine::writeFile(const std::string & localFile, const std::string & remotePath) {
    std::ifstream in(localFile, std::ios::in | std::ios::binary);
    if (!in.good()) {
        throw ArchiveException(ErrorKind::PerItem, "ErrorFile", "Could not read " + localFile);
    }

    std::unique_ptr<std::ostream> out = session->openForWrite(remotePath);
    if (in.peek() != std::ifstream::traits_type::eof()) {
        *out << in.rdbuf();
    }
    out->flush();
    if (out->fail()) {
        throw ArchiveException(ErrorKind::PerItem, "ErrorShareWrite", "Write failed: " + remotePath);
    }
}

void UploadEngine::ensureDirectoryExists(const std::string & remoteDir) {
    try {
        session->makeDirectories(remoteDir);
    } catch (ArchiveException & ex) {
        std::string message = ex.what();
        if (message.find(SHARE_NO_SUCH_FILE) != std::string::npos || message.find(SHARE_PATH_NOT_FOUND_STATUS) != std::string::npos) {
            createDirectoriesIncrementally(remoteDir);
        } else {
            logger->warn("Could not create {}: {}", remoteDir, message);
        }
    }
}

void UploadEngine::createDirectoriesIncrementally(const std::string & remoteDir) {
    std::vector<std::string> parts = SharePath::segments(remoteDir);
    // parts[0] and parts[1] are the empty strings before \\, then host and share
    if (parts.size() <= 4) {
        return;
    }
    std::string current = SharePath::unc(parts[2], parts[3]);
    for (size_t i = 4; i < parts.size(); i ++) {
        if (parts[i] == "") {
            continue;
        }
        current = current + SHARE_PATH_SEP + parts[i];
        try {
            session->makeDirectories(current);
        } catch (ArchiveException & ex) {
            // the segment may exist from an earlier or concurrent run
            logger->debug("Ignoring {} for {}", ex.what(), current);
        }
    }
}
