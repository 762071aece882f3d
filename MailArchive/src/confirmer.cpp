#include <algorithm>
#include <cctype>

#include "mailarchive/confirmer.hpp"

ConsoleConfirmer::ConsoleConfirmer(std::istream & in, std::ostream & out) :
    in(in), out(out)
{
}

std::string ConsoleConfirmer::ask(const std::string & prompt) {
    out << prompt << " ";
    out.flush();

    std::string line;
    if (!std::getline(in, line)) {
        return "";
    }
    size_t start = line.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = line.find_last_not_of(" \t\r");
    return line.substr(start, end - start + 1);
}

bool ConsoleConfirmer::confirm(const std::string & prompt) {
    std::string answer = ask(prompt + " [y/N]:");
    std::transform(answer.begin(), answer.end(), answer.begin(), ::tolower);
    return answer == "y" || answer == "yes";
}
