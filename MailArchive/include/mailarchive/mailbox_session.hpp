/** MailboxSession [MailArchive]
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

#ifndef MailboxSession_hpp
#define MailboxSession_hpp

#include <stdio.h>
#include <cstdint>
#include <ctime>
#include <map>
#include <string>
#include <vector>

struct RemoteFolder {
    std::string path;
    std::vector<std::string> flags;
};

struct FetchedMessage {
    std::string raw;
    time_t arrivedAt = 0;
};

struct SearchCriteria {
    bool all = true;
    time_t before = 0; // only when !all: messages whose arrival date is strictly before this day

    static SearchCriteria everything();
    static SearchCriteria receivedBefore(time_t day);
};

/*
 The mailbox protocol, consumed by the engines. Implementations throw
 ArchiveException: Connection for session failures, FolderAccess for
 select / search failures on a folder, PerItem for a single fetch.
 */
class MailboxSession {
public:
    virtual ~MailboxSession() {}

    virtual void login(const std::string & address, const std::string & password) = 0;
    virtual void logout() = 0;

    virtual std::vector<std::string> capabilities() = 0;
    virtual std::vector<RemoteFolder> listFolders() = 0;

    // Returns the number of messages in the folder.
    virtual unsigned int selectFolder(const std::string & folder, bool readonly) = 0;

    virtual std::vector<uint32_t> search(const std::string & folder, const SearchCriteria & criteria) = 0;

    // Raw RFC822 bytes and INTERNALDATE for each uid. UIDs the server did not
    // return are absent from the map.
    virtual std::map<uint32_t, FetchedMessage> fetch(const std::string & folder, const std::vector<uint32_t> & uids) = 0;

    // Marks messages \Deleted. Nothing is removed until expunge().
    virtual void deleteMessages(const std::string & folder, const std::vector<uint32_t> & uids) = 0;
    virtual void expunge(const std::string & folder) = 0;
};

#endif /* MailboxSession_hpp */
