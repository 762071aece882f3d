#include <cctype>
#include <limits>
#include <regex>
#include <stdexcept>

#include "mailarchive/retention_filter.hpp"
#include "mailarchive/archive_exception.hpp"

static std::string trimWhitespace(const std::string & s) {
    const char * ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static ArchiveException invalidFormat(const std::string & expr) {
    return ArchiveException(ErrorKind::Configuration, "InvalidFormat",
        "Invalid time range format: '" + expr + "'. Use formats like: 30D (days), 6M (months), 1Y (years), 2W (weeks)");
}

RetentionFilter::Days RetentionFilter::parse(const std::string & expr) {
    std::regex e ("^([0-9]+)([DdWwMmYy])$");
    std::smatch match;
    std::string trimmed = trimWhitespace(expr);

    if (!std::regex_match(trimmed, match, e)) {
        throw invalidFormat(expr);
    }

    long long value = 0;
    try {
        value = std::stoll(match[1].str());
    } catch (std::out_of_range & ex) {
        throw invalidFormat(expr);
    }

    long long multiplier = 1;
    switch (toupper(match[2].str()[0])) {
        case 'W':
            multiplier = 7;
            break;
        case 'M':
            multiplier = 30;
            break;
        case 'Y':
            multiplier = 365;
            break;
    }

    // the span in seconds has to fit in time_t
    long long maxDays = (long long)(std::numeric_limits<time_t>::max() / 86400);
    if (value > maxDays / multiplier) {
        throw invalidFormat(expr);
    }
    return Days(value * multiplier);
}

time_t RetentionFilter::cutoffForExpression(const std::string & expr, time_t now) {
    time_t span = (time_t)std::chrono::duration_cast<std::chrono::seconds>(parse(expr)).count();
    if (span > now) {
        // nothing arrived before the epoch
        return 0;
    }
    return now - span;
}

time_t RetentionFilter::startOfLocalDay(time_t t) {
    tm parts;
#if defined(_MSC_VER)
    localtime_s(&parts, &t);
#else
    localtime_r(&t, &parts);
#endif
    parts.tm_hour = 0;
    parts.tm_min = 0;
    parts.tm_sec = 0;
    parts.tm_isdst = -1;
    return mktime(&parts);
}
