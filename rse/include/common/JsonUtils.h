#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace RSE {

using json = nlohmann::json;

/**
 * @brief JSON helpers shared by the result encoder, the CLI and the tests
 *
 * All dumps use the replacing UTF-8 error handler, so text that reached a
 * json value without validation can never make serialization throw.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into json object with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);
    static std::string toPrettyString(const json &value);

    /**
     * @brief Check that a json value dumps without encoding errors
     *
     * nlohmann/json only validates UTF-8 while dumping; snapshot capture uses
     * this to detect strings that need the display-string fallback.
     */
    static bool isEncodable(const json &value);

    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");
    static int getInt(const json &object, const std::string &key, int defaultValue = 0);
    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief Collect the integer members of an array field, skipping anything else
     */
    static std::vector<int> getIntArray(const json &object, const std::string &key);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);
};

}  // namespace RSE
