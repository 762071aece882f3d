/** ProviderRegistry [MailArchive]
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

#ifndef ProviderRegistry_hpp
#define ProviderRegistry_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

/*
 Known mail providers and their IMAP settings, loaded from providers.json:

 {"default": "gmx", "providers": {"gmx": {"name": "GMX Mail",
  "imap_host": "imap.gmx.net", "imap_port": 993, "ssl": true}}}

 Without a file, a built-in set (gmx, gmail, outlook) is used.
 */
class ProviderRegistry {
    nlohmann::json _document;
    std::string _source;

public:
    ProviderRegistry(nlohmann::json document, std::string source);

    static ProviderRegistry builtin();

    // Loads the first existing file of `explicitPath` (when given) or the default
    // search paths. Falls back to builtin(). A malformed file is a ConfigurationError.
    static ProviderRegistry load(const std::string & explicitPath = "");
    static ProviderRegistry loadFile(const std::string & path);

    bool isBuiltin();
    std::string source();
    std::string defaultProvider();
    std::vector<std::string> providerNames();

    // Throws ArchiveException (Configuration, "UnknownProvider") for names not in
    // the registry. "custom" is overridden by IMAP_HOST, IMAP_PORT and IMAP_SSL.
    nlohmann::json configForProvider(const std::string & provider);
};

#endif /* ProviderRegistry_hpp */
