/** ConfigModel [MailArchive]
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

#ifndef ConfigModel_hpp
#define ConfigModel_hpp

#include <stdio.h>
#include <string>

#include "nlohmann/json.hpp"

/*
 Base for the JSON-backed configuration objects. Values are resolved before
 any engine runs; engines only read them.
 */
class ConfigModel {
public:
    nlohmann::json _data;

    ConfigModel(nlohmann::json json);
    virtual ~ConfigModel() {}

    // Returns the name of the first missing / malformed field, or "" if usable.
    virtual std::string valid() = 0;

    // Secrets are never included.
    virtual nlohmann::json toJSON();

protected:
    std::string stringValue(const std::string & key, const std::string & fallback = "");
};

#endif /* ConfigModel_hpp */
