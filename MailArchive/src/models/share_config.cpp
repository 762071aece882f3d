#include "mailarchive/models/share_config.hpp"
#include "mailarchive/mail_utils.hpp"
#include "mailarchive/constants.hpp"

ShareConfig::ShareConfig(nlohmann::json json) : ConfigModel(json) {

}

std::shared_ptr<ShareConfig> ShareConfig::fromEnvironment() {
    std::string host = MailUtils::getEnvUTF8("NAS_HOST");
    std::string share = MailUtils::getEnvUTF8("NAS_SHARE");
    std::string username = MailUtils::getEnvUTF8("NAS_USERNAME");
    std::string password = MailUtils::getEnvUTF8("NAS_PASSWORD");

    if (host == "" || share == "" || username == "" || password == "") {
        return nullptr;
    }

    nlohmann::json data = {
        {"host", host},
        {"share", share},
        {"username", username},
        {"password", password},
        {"base_path", DEFAULT_SHARE_BASE_PATH},
    };
    std::string basePath = MailUtils::getEnvUTF8("NAS_PATH");
    if (basePath != "") {
        data["base_path"] = basePath;
    }
    std::string mountRoot = MailUtils::getEnvUTF8("NAS_MOUNT");
    if (mountRoot != "") {
        data["mount_root"] = mountRoot;
    }
    return std::make_shared<ShareConfig>(data);
}

std::string ShareConfig::valid() {
    for (std::string key : {"host", "share", "username", "password"}) {
        if (stringValue(key) == "") {
            return key;
        }
    }
    return "";
}

std::string ShareConfig::host() {
    return stringValue("host");
}

std::string ShareConfig::share() {
    return stringValue("share");
}

std::string ShareConfig::username() {
    return stringValue("username");
}

std::string ShareConfig::password() {
    return stringValue("password");
}

std::string ShareConfig::basePath() {
    return stringValue("base_path", DEFAULT_SHARE_BASE_PATH);
}

std::string ShareConfig::mountRoot() {
    return stringValue("mount_root", "/mnt/" + share());
}

std::string ShareConfig::folderPath(const std::string & accountName, const std::string & folderName) {
    return basePath() + "/" + accountName + "/" + folderName;
}

std::shared_ptr<ShareConfig> ShareConfig::withBasePath(const std::string & basePath) {
    nlohmann::json data = _data;
    data["base_path"] = basePath;
    return std::make_shared<ShareConfig>(data);
}
