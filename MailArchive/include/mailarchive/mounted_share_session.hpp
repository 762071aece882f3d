/** MountedShareSession [MailArchive]
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

#ifndef MountedShareSession_hpp
#define MountedShareSession_hpp

#include <stdio.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"
#include "mailarchive/share_session.hpp"

/*
 A share that the operating system has already mounted (mount -t cifs, or a
 Windows drive mapping). \\host\share\a\b resolves to <mountRoot>/a/b.
 Credentials are owned by the mount, registerSession only checks that the
 mount is reachable.
 */
class MountedShareSession : public ShareSession {
    std::string mountRoot;
    std::string host;
    std::shared_ptr<spdlog::logger> logger;

public:
    MountedShareSession(std::string mountRoot);

    void registerSession(const std::string & host, const std::string & username, const std::string & password) override;
    bool acceptsAnyCredentials() const override;
    std::vector<std::string> listDirectory(const std::string & path) override;
    ShareEntryInfo stat(const std::string & path) override;
    void makeDirectories(const std::string & path) override;
    std::unique_ptr<std::ostream> openForWrite(const std::string & path) override;

    std::filesystem::path localPathFor(const std::string & path);
};

#endif /* MountedShareSession_hpp */
