/** Confirmer [MailArchive]
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

#ifndef Confirmer_hpp
#define Confirmer_hpp

#include <stdio.h>
#include <iostream>
#include <string>

// Asks the operator a yes / no question before an irreversible step.
class Confirmer {
public:
    virtual ~Confirmer() {}
    virtual bool confirm(const std::string & prompt) = 0;
};

class ConsoleConfirmer : public Confirmer {
    std::istream & in;
    std::ostream & out;

public:
    ConsoleConfirmer(std::istream & in = std::cin, std::ostream & out = std::cout);

    // Accepts y, yes (any case). Anything else, including end of input, is a no.
    bool confirm(const std::string & prompt) override;

    // Reads one trimmed line after printing `prompt`. Empty when input has ended.
    std::string ask(const std::string & prompt);
};

#endif /* Confirmer_hpp */
