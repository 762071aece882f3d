/** MailUtils [MailArchive]
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

#ifndef MailUtils_hpp
#define MailUtils_hpp

#include <cstdint>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

#include <stdio.h>
#include "MailCore/MailCore.h"

class Account;

class MailUtils {

public:
    static std::string getEnvUTF8(std::string key);

    // 20240131_094502, local time
    static std::string localTimestampForTime(time_t time);

    // 2024-01-31, local time
    static std::string localDateForTime(time_t time);

    static std::vector<uint32_t> uidsOfIndexSet(mailcore::IndexSet * set);
    static mailcore::IndexSet * indexSetForUIDs(const std::vector<uint32_t> & uids);

    static std::vector<std::string> namesForFolderFlags(mailcore::IMAPFolderFlag flags);
    static std::string tokenForCapability(mailcore::IMAPCapability capability);

    static void configureSessionForAccount(mailcore::IMAPSession & session, std::shared_ptr<Account> account);

    static void enableVerboseLogging();

    // Removes a local directory tree. False if it did not exist or could not be removed.
    static bool deleteDirectory(const std::string & path);
};

#endif /* MailUtils_hpp */
