#include "mailarchive/folder_catalog.hpp"
#include "mailarchive/archive_exception.hpp"

nlohmann::json FolderSummary::toJSON() const {
    return {
        {"path", path},
        {"flags", flags},
        {"messageCount", messageCount < 0 ? nlohmann::json(nullptr) : nlohmann::json(messageCount)},
    };
}

FolderCatalog::FolderCatalog(std::shared_ptr<MailboxSession> session) :
    session(session), logger(spdlog::get("logger"))
{
}

std::vector<FolderSummary> FolderCatalog::load() {
    folders.clear();
    for (const auto & remote : session->listFolders()) {
        FolderSummary summary;
        summary.path = remote.path;
        summary.flags = remote.flags;
        try {
            summary.messageCount = (int)session->selectFolder(remote.path, true);
        } catch (ArchiveException & ex) {
            logger->debug("Could not examine {}: {}", remote.path, ex.what());
            summary.messageCount = -1;
        }
        folders.push_back(summary);
    }
    return folders;
}

bool FolderCatalog::contains(const std::string & path) {
    for (const auto & folder : folders) {
        if (folder.path == path) {
            return true;
        }
    }
    return false;
}

nlohmann::json FolderCatalog::toJSON() {
    nlohmann::json j = nlohmann::json::array();
    for (const auto & folder : folders) {
        j.push_back(folder.toJSON());
    }
    return j;
}
