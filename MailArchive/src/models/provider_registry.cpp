#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include "mailarchive/models/provider_registry.hpp"
#include "mailarchive/archive_exception.hpp"
#include "mailarchive/constants.hpp"
#include "mailarchive/mail_utils.hpp"
#include "spdlog/spdlog.h"

static std::string expandHome(const std::string & path) {
    if (path.substr(0, 2) != "~/") {
        return path;
    }
    return MailUtils::getEnvUTF8("HOME") + path.substr(1);
}

ProviderRegistry::ProviderRegistry(nlohmann::json document, std::string source) :
    _document(document), _source(source)
{
    if (!_document.count("providers") || !_document["providers"].is_object()) {
        _document["providers"] = nlohmann::json::object();
    }
}

ProviderRegistry ProviderRegistry::builtin() {
    nlohmann::json document = {
        {"default", DEFAULT_PROVIDER},
        {"providers", {
            {"gmx", {
                {"name", "GMX Mail"},
                {"imap_host", "imap.gmx.net"},
                {"imap_port", 993},
                {"ssl", true},
            }},
            {"gmail", {
                {"name", "Gmail"},
                {"imap_host", "imap.gmail.com"},
                {"imap_port", 993},
                {"ssl", true},
            }},
            {"outlook", {
                {"name", "Outlook"},
                {"imap_host", "outlook.office365.com"},
                {"imap_port", 993},
                {"ssl", true},
            }},
        }},
    };
    return ProviderRegistry(document, "");
}

ProviderRegistry ProviderRegistry::loadFile(const std::string & path) {
    std::ifstream input(path);
    if (!input.good()) {
        throw ArchiveException(ErrorKind::Configuration, "ErrorConfigFile", "Could not read " + path);
    }
    try {
        return ProviderRegistry(nlohmann::json::parse(input), path);
    } catch (nlohmann::json::parse_error & ex) {
        throw ArchiveException(ErrorKind::Configuration, "ErrorConfigFile", path + ": " + ex.what());
    }
}

ProviderRegistry ProviderRegistry::load(const std::string & explicitPath) {
    std::vector<std::string> candidates;
    if (explicitPath != "") {
        candidates.push_back(explicitPath);
    } else {
        candidates = PROVIDER_CONFIG_PATHS;
    }

    for (const auto & candidate : candidates) {
        std::string path = expandHome(candidate);
        if (std::filesystem::exists(path)) {
            return loadFile(path);
        }
    }
    return builtin();
}

bool ProviderRegistry::isBuiltin() {
    return _source == "";
}

std::string ProviderRegistry::source() {
    return _source;
}

std::string ProviderRegistry::defaultProvider() {
    if (_document.count("default") && _document["default"].is_string()) {
        return _document["default"].get<std::string>();
    }
    return DEFAULT_PROVIDER;
}

std::vector<std::string> ProviderRegistry::providerNames() {
    std::vector<std::string> names;
    for (auto it = _document["providers"].begin(); it != _document["providers"].end(); ++it) {
        names.push_back(it.key());
    }
    return names;
}

nlohmann::json ProviderRegistry::configForProvider(const std::string & provider) {
    nlohmann::json & providers = _document["providers"];

    if (!providers.count(provider)) {
        if (isBuiltin()) {
            throw ArchiveException(ErrorKind::Configuration, "UnknownProvider",
                "Unknown provider '" + provider + "' and no config file found");
        }
        std::string available;
        for (const auto & name : providerNames()) {
            available += (available == "" ? "" : ", ") + name;
        }
        throw ArchiveException(ErrorKind::Configuration, "UnknownProvider",
            "Unknown provider '" + provider + "'. Available: " + available);
    }

    nlohmann::json config = providers[provider];

    if (provider == "custom") {
        std::string host = MailUtils::getEnvUTF8("IMAP_HOST");
        std::string port = MailUtils::getEnvUTF8("IMAP_PORT");
        std::string ssl = MailUtils::getEnvUTF8("IMAP_SSL");
        if (host != "") {
            config["imap_host"] = host;
        }
        if (port != "") {
            try {
                config["imap_port"] = (unsigned int)std::stoul(port);
            } catch (std::exception & ex) {
                throw ArchiveException(ErrorKind::Configuration, "InvalidFormat", "IMAP_PORT is not a number: " + port);
            }
        }
        if (ssl != "") {
            std::transform(ssl.begin(), ssl.end(), ssl.begin(), ::tolower);
            config["ssl"] = (ssl == "true" || ssl == "1" || ssl == "yes");
        }
    }

    if (config.count("imap_port") && config["imap_port"].is_string()) {
        config["imap_port"] = (unsigned int)std::stoul(config["imap_port"].get<std::string>());
    }
    if (!config.count("imap_port")) {
        config["imap_port"] = DEFAULT_IMAP_PORT;
    }
    if (!config.count("ssl")) {
        config["ssl"] = true;
    }

    spdlog::get("logger")->debug("Provider config: {} ({})", config.value("name", provider), isBuiltin() ? "built-in" : _source);
    return config;
}
