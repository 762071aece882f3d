/** ArchiveException [MailArchive]
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

#ifndef ArchiveException_hpp
#define ArchiveException_hpp

#include <stdio.h>
#include <exception>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"
#include "StanfordCPPLib/stacktrace/call_stack.h"

// Failure taxonomy shared by the capability adapters and the engines.
// Connection and Configuration errors end the whole run, FolderAccess ends
// one engine invocation, PerItem is recorded and processing continues.
enum class ErrorKind {
    Connection,
    FolderAccess,
    PerItem,
    Configuration,
};

std::string ErrorKindName(ErrorKind kind);

// Value form of a failure, stored in engine results.
struct ArchiveError {
    ErrorKind kind = ErrorKind::PerItem;
    std::string key;
    std::string debuginfo;

    std::string describe() const;
    nlohmann::json toJSON() const;
};

class ArchiveException : public std::exception {
    std::vector<stacktrace::entry> _stackentries;
    std::string _message;

public:
    ArchiveException(ErrorKind kind, std::string key, std::string di);
    ArchiveException(ErrorKind kind, mailcore::ErrorCode c, std::string di);

    ErrorKind kind;
    std::string key;
    std::string debuginfo;

    const char * what() const noexcept override;
    void printStackTrace();

    ArchiveError toError() const;
    nlohmann::json toJSON();
};


#endif /* ArchiveException_hpp */
