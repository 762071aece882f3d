#include <filesystem>

#include "mailarchive/name_policy.hpp"

static bool isForbiddenByte(unsigned char c) {
    if (c < 32 || c == 127) {
        return true;
    }
    switch (c) {
        case ':':
        case '/':
        case '\\':
        case '"':
        case '<':
        case '>':
        case '|':
        case '?':
        case '*':
            return true;
        default:
            return false;
    }
}

std::string NamePolicy::sanitize(const std::string & raw) {
    // Every byte we drop is ASCII, so multi-byte UTF-8 sequences (all bytes >= 0x80)
    // pass through untouched.
    std::string result;
    result.reserve(raw.size());
    for (char ch : raw) {
        if (!isForbiddenByte((unsigned char)ch)) {
            result.push_back(ch);
        }
    }

    size_t start = result.find_first_not_of(' ');
    if (start == std::string::npos) {
        return "";
    }
    size_t end = result.find_last_not_of(" .");
    if (end == std::string::npos || end < start) {
        return "";
    }
    return result.substr(start, end - start + 1);
}

std::string NamePolicy::truncate(const std::string & value, size_t maxCodePoints) {
    size_t count = 0;
    for (size_t i = 0; i < value.size(); i ++) {
        unsigned char c = (unsigned char)value[i];
        // continuation bytes (10xxxxxx) belong to the previous code point
        if ((c & 0xC0) == 0x80) {
            continue;
        }
        if (count == maxCodePoints) {
            return value.substr(0, i);
        }
        count++;
    }
    return value;
}

std::pair<std::string, std::string> NamePolicy::splitExtension(const std::string & filename) {
    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos || filename.find_first_not_of('.') > dot) {
        return {filename, ""};
    }
    return {filename.substr(0, dot), filename.substr(dot)};
}

static std::string utf8Prefix(const std::string & value, size_t maxBytes) {
    if (value.size() <= maxBytes) {
        return value;
    }
    size_t end = maxBytes;
    while (end > 0 && ((unsigned char)value[end] & 0xC0) == 0x80) {
        end--;
    }
    return value.substr(0, end);
}

std::string NamePolicy::limitBytes(const std::string & filename, size_t maxBytes) {
    if (filename.size() <= maxBytes) {
        return filename;
    }
    auto parts = splitExtension(filename);
    if (parts.second.size() >= maxBytes) {
        return utf8Prefix(filename, maxBytes);
    }
    return utf8Prefix(parts.first, maxBytes - parts.second.size()) + parts.second;
}

std::string NamePolicy::resolveCollision(const std::string & dir, const std::string & desiredName) {
    std::filesystem::path base(dir);
    std::filesystem::path candidate = base / desiredName;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate.string();
    }

    auto parts = splitExtension(desiredName);
    unsigned long counter = 1;
    while (true) {
        candidate = base / (parts.first + "_" + std::to_string(counter) + parts.second);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate.string();
        }
        counter++;
    }
}
