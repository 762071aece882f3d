#include <cerrno>
#include <cstring>
#include <fstream>

#include "mailarchive/mounted_share_session.hpp"
#include "mailarchive/archive_exception.hpp"
#include "mailarchive/share_path.hpp"

MountedShareSession::MountedShareSession(std::string mountRoot) :
    mountRoot(mountRoot), logger(spdlog::get("logger"))
{
}

void MountedShareSession::registerSession(const std::string & host, const std::string & username, const std::string & password) {
    std::error_code ec;
    if (!std::filesystem::is_directory(mountRoot, ec)) {
        std::string reason = ec ? ec.message() : "not a directory";
        throw ArchiveException(ErrorKind::Connection, "ErrorShareUnavailable",
            "Share for " + host + " is not mounted at " + mountRoot + " (" + reason + ")");
    }
    this->host = host;
    logger->debug("Using share mounted at {} for {}@{}", mountRoot, username, host);
}

bool MountedShareSession::acceptsAnyCredentials() const {
    return true;
}

std::filesystem::path MountedShareSession::localPathFor(const std::string & path) {
    std::vector<std::string> parts = SharePath::segments(path);
    if (parts.size() < 4 || parts[0] != "" || parts[1] != "") {
        throw ArchiveException(ErrorKind::FolderAccess, "ErrorInvalidPath", "Not a UNC path: " + path);
    }
    std::filesystem::path local(mountRoot);
    for (size_t i = 4; i < parts.size(); i ++) {
        if (parts[i] == "" || parts[i] == "." || parts[i] == "..") {
            continue;
        }
        local /= parts[i];
    }
    return local;
}

std::vector<std::string> MountedShareSession::listDirectory(const std::string & path) {
    std::filesystem::path local = localPathFor(path);
    std::vector<std::string> names;
    std::error_code ec;
    std::filesystem::directory_iterator it(local, ec);
    if (ec) {
        throw ArchiveException(ErrorKind::FolderAccess, "ErrorShareListing", ec.message() + ": " + path);
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        throw ArchiveException(ErrorKind::FolderAccess, "ErrorShareListing", ec.message() + ": " + path);
    }
    return names;
}

ShareEntryInfo MountedShareSession::stat(const std::string & path) {
    std::filesystem::path local = localPathFor(path);
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(local, ec);
    if (!std::filesystem::exists(status)) {
        throw ArchiveException(ErrorKind::FolderAccess, "ErrorShareNotFound", "No such file or directory: " + path);
    }
    ShareEntryInfo info;
    info.isDirectory = std::filesystem::is_directory(status);
    if (!info.isDirectory) {
        info.size = std::filesystem::file_size(local, ec);
    }
    return info;
}

void MountedShareSession::makeDirectories(const std::string & path) {
    std::filesystem::path local = localPathFor(path);
    std::error_code ec;
    std::filesystem::create_directories(local, ec);
    if (ec) {
        throw ArchiveException(ErrorKind::FolderAccess, "ErrorShareMkdir", ec.message() + ": " + path);
    }
}

std::unique_ptr<std::ostream> MountedShareSession::openForWrite(const std::string & path) {
    std::filesystem::path local = localPathFor(path);
    std::unique_ptr<std::ofstream> stream(new std::ofstream(local, std::ios::out | std::ios::binary | std::ios::trunc));
    if (!stream->good()) {
        throw ArchiveException(ErrorKind::PerItem, "ErrorShareWrite", std::string(strerror(errno)) + ": " + path);
    }
    return std::unique_ptr<std::ostream>(stream.release());
}
