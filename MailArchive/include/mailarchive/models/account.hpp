/** Account [MailArchive]
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

#ifndef Account_hpp
#define Account_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "mailarchive/models/config_model.hpp"

/*
 The mailbox side of the configuration: who we log in as, and where.

 {"provider": "gmx", "emailAddress": "...", "settings": {"name": "GMX Mail",
  "imap_host": "imap.gmx.net", "imap_port": 993, "ssl": true, "imap_password": "..."}}
 */
class Account : public ConfigModel {

public:
    Account(nlohmann::json json);

    // Reads MAIL_EMAIL / MAIL_PASSWORD. Returns nullptr if either is missing.
    static std::shared_ptr<Account> fromEnvironment(const std::string & provider, const nlohmann::json & providerConfig);

    std::string valid();

    std::string provider();
    std::string emailAddress();
    std::string password();

    // The local part of the address, used to namespace the share layout.
    std::string accountName();

    std::string displayName();
    std::string IMAPHost();
    unsigned int IMAPPort();
    bool IMAPSSL();
};

#endif /* Account_hpp */
