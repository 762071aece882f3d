/** UploadEngine [MailArchive]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef UploadEngine_hpp
#define UploadEngine_hpp

#include <stdio.h>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailarchive/archive_exception.hpp"
#include "mailarchive/share_session.hpp"
#include "mailarchive/models/share_config.hpp"

enum class UploadStatus {
    Completed,
    DryRun,
    Failed,
};

enum class FileOutcome {
    Uploaded,
    Skipped,
    Failed,
};

struct FileRecord {
    std::string localPath;
    std::string remotePath;
    uint64_t size = 0;
    FileOutcome outcome = FileOutcome::Failed;
    ArchiveError error;

    nlohmann::json toJSON() const;
};

struct UploadResult {
    UploadStatus status = UploadStatus::Completed;
    std::string source;
    std::string destination;

    // Everything found under the local root, whether or not it was sent.
    unsigned int totalFiles = 0;
    uint64_t totalBytes = 0;

    unsigned int uploaded = 0;
    unsigned int skipped = 0;
    unsigned int failed = 0;

    // Sum of the sizes of uploaded files only. A dry run reports every file
    // found as uploaded.
    uint64_t bytes = 0;

    std::vector<FileRecord> files;
    ArchiveError error;

    bool succeeded() const;
    nlohmann::json toJSON() const;
};

/*
 Copies a local directory tree to {share}\{base path}\..., preserving the
 relative layout. Existing remote files are skipped unless overwrite is set.
 */
class UploadEngine {
    std::shared_ptr<ShareSession> session;
    std::shared_ptr<ShareConfig> config;
    std::shared_ptr<spdlog::logger> logger;

public:
    UploadEngine(std::shared_ptr<ShareSession> session, std::shared_ptr<ShareConfig> config);

    UploadResult upload(const std::string & localRoot, bool dryRun, bool overwrite);

    // \\host\share\base
    std::string remoteBase();
    std::string remotePathFor(const std::string & localRoot, const std::string & localFile);

    // Creates remoteDir and its parents. Some servers refuse a multi-level create
    // with "no such file" / STATUS_OBJECT_NAME_NOT_FOUND, in which case each
    // segment after \\host\share is created in turn. Never throws.
    void ensureDirectoryExists(const std::string & remoteDir);

private:
    void createDirectoriesIncrementally(const std::string & remoteDir);
    bool existsOnShare(const std::string & remotePath);
    FileRecord uploadFile(const std::string & localRoot, const std::string & localFile, uint64_t size, bool overwrite, std::set<std::string> & createdDirs);
    void writeFile(const std::string & localFile, const std::string & remotePath);
};

#endif /* UploadEngine_hpp */
