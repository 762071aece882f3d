#include "mailarchive/archive_exception.hpp"
#include "mailarchive/constants.hpp"
#include "StanfordCPPLib/exceptions.h"

std::string ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection:
            return "ConnectionError";
        case ErrorKind::FolderAccess:
            return "FolderAccessError";
        case ErrorKind::PerItem:
            return "PerItemError";
        case ErrorKind::Configuration:
            return "ConfigurationError";
    }
    return "UnknownError";
}

std::string ArchiveError::describe() const {
    if (debuginfo == "") {
        return key;
    }
    return key + ": " + debuginfo;
}

nlohmann::json ArchiveError::toJSON() const {
    return {
        {"kind", ErrorKindName(kind)},
        {"key", key},
        {"debuginfo", debuginfo},
    };
}

ArchiveException::ArchiveException(ErrorKind kind, std::string key, std::string di) :
    kind(kind), key(key), debuginfo(di)
{
    stacktrace::call_stack trace;
    _stackentries = trace.stack;
    _message = toError().describe();
}

ArchiveException::ArchiveException(ErrorKind kind, mailcore::ErrorCode c, std::string di) :
    kind(kind), key("Unknown"), debuginfo(di)
{
    stacktrace::call_stack trace;
    _stackentries = trace.stack;

    if (ErrorCodeToTypeMap.count(c)) {
        key = ErrorCodeToTypeMap[c];
    }
    _message = toError().describe();
}

const char * ArchiveException::what() const noexcept {
    return _message.c_str();
}

void ArchiveException::printStackTrace() {
    exceptions::printStackTrace(_stackentries);
}

ArchiveError ArchiveException::toError() const {
    ArchiveError err;
    err.kind = kind;
    err.key = key;
    err.debuginfo = debuginfo;
    return err;
}

nlohmann::json ArchiveException::toJSON() {
    nlohmann::json j = toError().toJSON();
    j["what"] = what();
    return j;
}
