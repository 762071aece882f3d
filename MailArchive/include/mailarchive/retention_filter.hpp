/** RetentionFilter [MailArchive]
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

#ifndef RetentionFilter_hpp
#define RetentionFilter_hpp

#include <stdio.h>
#include <chrono>
#include <ctime>
#include <ratio>
#include <string>

class RetentionFilter {

public:
    typedef std::chrono::duration<long long, std::ratio<86400>> Days;

    // Parses "<digits><unit>" with unit D (days), W (weeks), M (30 days) or
    // Y (365 days), case-insensitive, surrounding whitespace ignored. Throws an
    // ArchiveException (Configuration, "InvalidFormat") for anything else.
    static Days parse(const std::string & expr);

    // now - parse(expr)
    static time_t cutoffForExpression(const std::string & expr, time_t now);

    // Local midnight of the day containing `t`.
    static time_t startOfLocalDay(time_t t);
};

#endif /* RetentionFilter_hpp */
