/** DownloadEngine [MailArchive]
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

#ifndef DownloadEngine_hpp
#define DownloadEngine_hpp

#include <stdio.h>
#include <cstdint>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailarchive/archive_exception.hpp"
#include "mailarchive/mailbox_session.hpp"

enum class DownloadStatus {
    Completed,
    DryRun,
    Empty,
    Failed,
};

enum class MessageOutcome {
    Downloaded,
    Skipped,
    Failed,
};

struct MessageRecord {
    uint32_t uid = 0;
    MessageOutcome outcome = MessageOutcome::Failed;
    std::string directory;
    unsigned int attachments = 0;
    ArchiveError error;

    nlohmann::json toJSON() const;
};

struct DownloadResult {
    DownloadStatus status = DownloadStatus::Completed;
    std::string folder;
    std::string destination;

    // In a dry run, downloaded is the folder's message count: what would be
    // fetched, before any dedup against existing files.
    unsigned int messageCount = 0;
    unsigned int downloaded = 0;
    unsigned int skipped = 0;
    unsigned int failed = 0;
    unsigned int attachments = 0;

    std::vector<MessageRecord> messages;
    ArchiveError error;

    bool succeeded() const;
    nlohmann::json toJSON() const;
};

/*
 Mirrors one mailbox folder into {destinationRoot}/{folder}/, one directory
 per message:

   {YYYYmmdd_HHMMSS}_{uid}_{subject}/email.raw
   {YYYYmmdd_HHMMSS}_{uid}_{subject}/{attachment}...

 Every run re-enumerates the whole folder. A message whose email.raw already
 exists with the same byte length is skipped, so interrupted runs can be
 repeated safely.
 */
class DownloadEngine {
    std::shared_ptr<MailboxSession> session;
    std::shared_ptr<spdlog::logger> logger;

public:
    DownloadEngine(std::shared_ptr<MailboxSession> session);

    DownloadResult download(const std::string & folder, const std::string & destinationRoot, bool dryRun);

    static std::string folderDirectoryName(const std::string & folder);
    static std::string messageDirectoryName(time_t arrivedAt, uint32_t uid, const std::string & subject);

    // Writes every attachment of a multipart message into dir. Returns the number written.
    static unsigned int saveAttachments(mailcore::MessageParser * parser, const std::string & dir);

private:
    MessageRecord downloadMessage(const std::string & folder, uint32_t uid, const std::string & folderOutput);
    static unsigned int saveAttachmentsInPart(mailcore::AbstractPart * part, const std::string & dir);
    static bool saveAttachment(mailcore::Attachment * part, const std::string & dir);
};

#endif /* DownloadEngine_hpp */
