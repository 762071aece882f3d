#include "mailarchive/share_path.hpp"
#include "mailarchive/constants.hpp"

static std::vector<std::string> nonEmptyParts(const std::string & path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (current != "") {
                parts.push_back(current);
            }
            current = "";
        } else {
            current.push_back(c);
        }
    }
    if (current != "") {
        parts.push_back(current);
    }
    return parts;
}

std::string SharePath::normalizeBasePath(const std::string & basePath) {
    std::string result;
    for (const auto & part : nonEmptyParts(basePath)) {
        if (result != "") {
            result += SHARE_PATH_SEP;
        }
        result += part;
    }
    return result;
}

std::string SharePath::unc(const std::string & host, const std::string & share, const std::string & relative) {
    return join(SHARE_PATH_SEP SHARE_PATH_SEP + host + SHARE_PATH_SEP + share, relative);
}

std::string SharePath::join(const std::string & base, const std::string & relative) {
    std::string rel = normalizeBasePath(relative);
    if (rel == "") {
        return base;
    }
    std::string result = base;
    while (result.size() > 0 && result.back() == '\\') {
        result.pop_back();
    }
    return result + SHARE_PATH_SEP + rel;
}

std::string SharePath::parent(const std::string & path) {
    std::vector<std::string> parts = segments(path);
    if (parts.size() <= 4) {
        return path;
    }
    return path.substr(0, path.find_last_of('\\'));
}

std::vector<std::string> SharePath::segments(const std::string & path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t sep = path.find('\\', start);
        if (sep == std::string::npos) {
            parts.push_back(path.substr(start));
            return parts;
        }
        parts.push_back(path.substr(start, sep - start));
        start = sep + 1;
    }
}
