/** RetentionEngine [MailArchive]
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

#ifndef RetentionEngine_hpp
#define RetentionEngine_hpp

#include <stdio.h>
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailarchive/archive_exception.hpp"
#include "mailarchive/confirmer.hpp"
#include "mailarchive/mailbox_session.hpp"

enum class RetentionStatus {
    Completed,
    DryRun,
    Empty,
    NoMatches,
    Declined,
    Failed,
};

struct RetentionResult {
    RetentionStatus status = RetentionStatus::Completed;
    std::string folder;
    std::string filterDescription;

    unsigned int messageCount = 0;
    unsigned int matched = 0;

    // Number of matched messages that were flagged and expunged. Zero unless Completed.
    unsigned int deleted = 0;

    ArchiveError error;

    bool succeeded() const;
    nlohmann::json toJSON() const;
};

class RetentionEngine {
    std::shared_ptr<MailboxSession> session;
    std::shared_ptr<Confirmer> confirmer;
    std::shared_ptr<spdlog::logger> logger;

public:
    RetentionEngine(std::shared_ptr<MailboxSession> session, std::shared_ptr<Confirmer> confirmer);

    // Deletes every message in folder, or with a cutoff only those that arrived
    // on a day before the day containing cutoff. Asks the confirmer twice before
    // anything is changed.
    RetentionResult deleteMessages(const std::string & folder, bool dryRun, std::optional<time_t> cutoff = std::nullopt);

    static std::string describeCutoff(std::optional<time_t> cutoff);
};

#endif /* RetentionEngine_hpp */
