/** NamePolicy [MailArchive]
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

#ifndef NamePolicy_hpp
#define NamePolicy_hpp

#include <stdio.h>
#include <string>
#include <utility>

class NamePolicy {

public:
    // Strips characters that are invalid in a filesystem or SMB path segment:
    // control characters (NUL, CR, LF, TAB...), DEL and : / \ " < > | ? *.
    // Leading spaces and trailing spaces / dots are trimmed. Every other
    // code point, including non-ASCII UTF-8, is kept unchanged. Idempotent.
    static std::string sanitize(const std::string & raw);

    // Keeps at most `maxCodePoints` UTF-8 code points, never splitting a sequence.
    static std::string truncate(const std::string & value, size_t maxCodePoints);

    // ("report.final.pdf") => ("report.final", ".pdf"). Names without a dot,
    // or whose only dot is the first character, have no extension.
    static std::pair<std::string, std::string> splitExtension(const std::string & filename);

    // Shortens the stem so the whole name fits in `maxBytes` bytes, keeping the
    // extension when it fits and never splitting a UTF-8 sequence.
    static std::string limitBytes(const std::string & filename, size_t maxBytes);

    // Returns dir/desiredName if nothing exists there, otherwise the first of
    // dir/{stem}_1{ext}, dir/{stem}_2{ext}... that does not exist. Never throws;
    // a candidate that cannot be examined counts as free.
    static std::string resolveCollision(const std::string & dir, const std::string & desiredName);
};

#endif /* NamePolicy_hpp */
