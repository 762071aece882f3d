/** SharePath [MailArchive]
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

#ifndef SharePath_hpp
#define SharePath_hpp

#include <stdio.h>
#include <string>
#include <vector>

class SharePath {

public:
    // "/mail-archive/a/" => "mail-archive\a". Both separators are accepted.
    static std::string normalizeBasePath(const std::string & basePath);

    // \\host\share or \\host\share\relative
    static std::string unc(const std::string & host, const std::string & share, const std::string & relative = "");

    // Appends `relative` using backslashes, whatever separators it was given with.
    static std::string join(const std::string & base, const std::string & relative);

    // \\host\share\a\b => \\host\share\a. Never climbs above \\host\share.
    static std::string parent(const std::string & path);

    // \\host\share\a\b => {"", "", "host", "share", "a", "b"}
    static std::vector<std::string> segments(const std::string & path);
};

#endif /* SharePath_hpp */
