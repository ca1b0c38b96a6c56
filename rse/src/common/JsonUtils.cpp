#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace RSE {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

bool JsonUtils::isEncodable(const json &value) {
    try {
        (void)value.dump();
        return true;
    } catch (const json::type_error &e) {
        LOG_DEBUG("Value is not encodable: {}", e.what());
        return false;
    }
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_string()) {
        return defaultValue;
    }

    return value.get<std::string>();
}

int JsonUtils::getInt(const json &object, const std::string &key, int defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_number_integer()) {
        return defaultValue;
    }

    return value.get<int>();
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    if (!object.is_object() || !object.contains(key) || !object[key].is_boolean()) {
        return defaultValue;
    }
    return object[key].get<bool>();
}

std::vector<int> JsonUtils::getIntArray(const json &object, const std::string &key) {
    std::vector<int> result;
    if (!object.is_object() || !object.contains(key) || !object[key].is_array()) {
        return result;
    }

    for (const auto &item : object[key]) {
        if (item.is_number_integer()) {
            result.push_back(item.get<int>());
        }
    }
    return result;
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

}  // namespace RSE
