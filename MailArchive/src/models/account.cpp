#include "mailarchive/models/account.hpp"
#include "mailarchive/mail_utils.hpp"
#include "mailarchive/constants.hpp"

Account::Account(nlohmann::json json) : ConfigModel(json) {

}

std::shared_ptr<Account> Account::fromEnvironment(const std::string & provider, const nlohmann::json & providerConfig) {
    std::string email = MailUtils::getEnvUTF8("MAIL_EMAIL");
    std::string password = MailUtils::getEnvUTF8("MAIL_PASSWORD");
    if (email == "" || password == "") {
        return nullptr;
    }

    nlohmann::json settings = {
        {"name", providerConfig.value("name", std::string("Mail Server"))},
        {"imap_host", providerConfig.value("imap_host", std::string(""))},
        {"imap_port", providerConfig.value("imap_port", DEFAULT_IMAP_PORT)},
        {"ssl", providerConfig.value("ssl", true)},
        {"imap_password", password},
    };
    return std::make_shared<Account>(nlohmann::json{
        {"provider", provider},
        {"emailAddress", email},
        {"settings", settings},
    });
}

std::string Account::valid() {
    if (!_data.count("emailAddress") || !_data["emailAddress"].is_string() || emailAddress() == "") {
        return "emailAddress";
    }
    if (!_data.count("settings")) {
        return "settings";
    }
    nlohmann::json & s = _data["settings"];
    if (!s.count("imap_password")) {
        return "imap_password";
    }
    if (!s.count("imap_host") || !s["imap_host"].is_string() || s["imap_host"].get<std::string>() == "") {
        return "imap_host";
    }
    if (!s.count("imap_port")) {
        return "imap_port";
    }
    return "";
}

std::string Account::provider() {
    return stringValue("provider");
}

std::string Account::emailAddress() {
    return _data["emailAddress"].get<std::string>();
}

std::string Account::password() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_password") ? s["imap_password"].get<std::string>() : "";
}

std::string Account::accountName() {
    std::string email = emailAddress();
    return email.substr(0, email.find('@'));
}

std::string Account::displayName() {
    nlohmann::json & s = _data["settings"];
    return s.count("name") ? s["name"].get<std::string>() : "Mail Server";
}

std::string Account::IMAPHost() {
    return _data["settings"]["imap_host"].get<std::string>();
}

unsigned int Account::IMAPPort() {
    nlohmann::json & val = _data["settings"]["imap_port"];
    return val.is_string() ? std::stoi(val.get<std::string>()) : val.get<unsigned int>();
}

bool Account::IMAPSSL() {
    nlohmann::json & s = _data["settings"];
    return s.count("ssl") ? s["ssl"].get<bool>() : true;
}
