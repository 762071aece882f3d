/** ShareConfig [MailArchive]
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

#ifndef ShareConfig_hpp
#define ShareConfig_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "mailarchive/models/config_model.hpp"

/*
 The remote file share the archive is mirrored to.

 {"host": "nas.local", "share": "backup", "username": "...", "password": "...",
  "base_path": "/mail-archive", "mount_root": "/mnt/backup"}
 */
class ShareConfig : public ConfigModel {

public:
    ShareConfig(nlohmann::json json);

    // Reads NAS_HOST, NAS_SHARE, NAS_USERNAME, NAS_PASSWORD (required) and
    // NAS_PATH, NAS_MOUNT (optional). Returns nullptr if a required value is missing.
    static std::shared_ptr<ShareConfig> fromEnvironment();

    std::string valid();

    std::string host();
    std::string share();
    std::string username();
    std::string password();
    std::string basePath();
    std::string mountRoot();

    // {base}/{account}/{folder}
    std::string folderPath(const std::string & accountName, const std::string & folderName);

    // A copy of this config rooted at another base path.
    std::shared_ptr<ShareConfig> withBasePath(const std::string & basePath);
};

#endif /* ShareConfig_hpp */
