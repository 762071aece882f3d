/** ShareSession [MailArchive]
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

#ifndef ShareSession_hpp
#define ShareSession_hpp

#include <stdio.h>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

struct ShareEntryInfo {
    bool isDirectory = false;
    uint64_t size = 0;
};

/*
 The remote file share protocol, consumed by UploadEngine and ConnectionProbe.
 Paths are UNC-style (\\host\share\dir\file). Implementations throw
 ArchiveException: Connection from registerSession, FolderAccess from the
 directory calls, PerItem from openForWrite. The exception's debuginfo keeps
 the server or OS message verbatim.
 */
class ShareSession {
public:
    virtual ~ShareSession() {}

    virtual void registerSession(const std::string & host, const std::string & username, const std::string & password) = 0;

    // True when registerSession succeeds without checking username / password,
    // e.g. because the operating system authenticated the share earlier.
    virtual bool acceptsAnyCredentials() const {
        return false;
    }

    virtual std::vector<std::string> listDirectory(const std::string & path) = 0;

    // Throws ArchiveException with key "ErrorShareNotFound" if nothing exists at path.
    virtual ShareEntryInfo stat(const std::string & path) = 0;

    // Creates path and any missing parents. Succeeds if it already exists.
    virtual void makeDirectories(const std::string & path) = 0;

    virtual std::unique_ptr<std::ostream> openForWrite(const std::string & path) = 0;
};

#endif /* ShareSession_hpp */
