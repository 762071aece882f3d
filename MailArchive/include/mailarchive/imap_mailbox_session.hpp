/** IMAPMailboxSession [MailArchive]
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

#ifndef IMAPMailboxSession_hpp
#define IMAPMailboxSession_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "spdlog/spdlog.h"

#include "mailarchive/mailbox_session.hpp"
#include "mailarchive/models/account.hpp"

class IMAPProgress : public mailcore::IMAPProgressCallback {
    std::shared_ptr<spdlog::logger> logger;

public:
    IMAPProgress();
    void bodyProgress(mailcore::IMAPSession * session, unsigned int current, unsigned int maximum);
    void itemsProgress(mailcore::IMAPSession * session, unsigned int current, unsigned int maximum);
};

class IMAPMailboxSession : public MailboxSession {
    mailcore::IMAPSession session;
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;

public:
    IMAPMailboxSession(std::shared_ptr<Account> account);
    ~IMAPMailboxSession();

    void login(const std::string & address, const std::string & password) override;
    void logout() override;

    std::vector<std::string> capabilities() override;
    std::vector<RemoteFolder> listFolders() override;

    unsigned int selectFolder(const std::string & folder, bool readonly) override;
    std::vector<uint32_t> search(const std::string & folder, const SearchCriteria & criteria) override;
    std::map<uint32_t, FetchedMessage> fetch(const std::string & folder, const std::vector<uint32_t> & uids) override;

    void deleteMessages(const std::string & folder, const std::vector<uint32_t> & uids) override;
    void expunge(const std::string & folder) override;
};

#endif /* IMAPMailboxSession_hpp */
