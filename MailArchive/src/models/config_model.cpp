#include "mailarchive/models/config_model.hpp"

ConfigModel::ConfigModel(nlohmann::json json) : _data(json) {

}

nlohmann::json ConfigModel::toJSON() {
    nlohmann::json copy = _data;
    copy.erase("password");
    if (copy.count("settings")) {
        copy["settings"].erase("imap_password");
    }
    return copy;
}

std::string ConfigModel::stringValue(const std::string & key, const std::string & fallback) {
    if (!_data.count(key) || !_data[key].is_string()) {
        return fallback;
    }
    return _data[key].get<std::string>();
}
