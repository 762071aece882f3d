/** ConnectionProbe [MailArchive]
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

#ifndef ConnectionProbe_hpp
#define ConnectionProbe_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailarchive/archive_exception.hpp"
#include "mailarchive/mailbox_session.hpp"
#include "mailarchive/share_session.hpp"
#include "mailarchive/models/account.hpp"
#include "mailarchive/models/share_config.hpp"

enum class ProbeStepOutcome {
    Passed,
    Warning,
    Failed,
};

struct ProbeStep {
    std::string name;
    ProbeStepOutcome outcome = ProbeStepOutcome::Passed;
    std::string detail;

    nlohmann::json toJSON() const;
};

struct ProbeResult {
    std::string target;
    bool passed = false;
    std::vector<ProbeStep> steps;
    ArchiveError error;

    nlohmann::json toJSON() const;
};

/*
 Read-only walk over a capability to check the configuration before any
 real work: log in, list, open the default location, report identity. The
 first failing step ends the probe. Nothing is created or modified.
 */
class ConnectionProbe {
    std::shared_ptr<spdlog::logger> logger;

    void record(ProbeResult & result, std::string name, ProbeStepOutcome outcome, std::string detail);

public:
    ConnectionProbe();

    ProbeResult probeMailbox(std::shared_ptr<MailboxSession> session, std::shared_ptr<Account> account);

    // With dryRun, nothing is contacted and the probe passes.
    ProbeResult probeShare(std::shared_ptr<ShareSession> session, std::shared_ptr<ShareConfig> config, bool dryRun);
};

#endif /* ConnectionProbe_hpp */
