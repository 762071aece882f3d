/** FolderCatalog [MailArchive]
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

#ifndef FolderCatalog_hpp
#define FolderCatalog_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailarchive/mailbox_session.hpp"

struct FolderSummary {
    std::string path;
    std::vector<std::string> flags;
    int messageCount = -1; // -1 when the folder could not be examined

    nlohmann::json toJSON() const;
};

class FolderCatalog {
    std::shared_ptr<MailboxSession> session;
    std::shared_ptr<spdlog::logger> logger;
    std::vector<FolderSummary> folders;

public:
    FolderCatalog(std::shared_ptr<MailboxSession> session);

    // Lists every folder and reads its message count. Throws if the listing
    // itself fails; a folder that cannot be examined is kept with a count of -1.
    std::vector<FolderSummary> load();

    bool contains(const std::string & path);
    nlohmann::json toJSON();
};

#endif /* FolderCatalog_hpp */
