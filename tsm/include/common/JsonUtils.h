#pragma once

#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace TSM {

/**
 * @brief JSON helpers shared by the table serializer and the table runtime
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into Json::Value with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed Json::Value or nullopt on failure
     */
    static std::optional<Json::Value> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toPrettyString(const Json::Value &value);

    /**
     * @brief Safely get string value from JSON object
     * @param object JSON object
     * @param key Key to lookup
     * @param defaultValue Default value if key doesn't exist or is not a string
     */
    static std::string getString(const Json::Value &object, const std::string &key,
                                 const std::string &defaultValue = "");

    static int getInt(const Json::Value &object, const std::string &key, int defaultValue = 0);

    /**
     * @brief Read an array of strings
     * @return nullopt if the key is missing, not an array, or holds a non-string element
     */
    static std::optional<std::vector<std::string>> getStringArray(const Json::Value &object, const std::string &key);

    static Json::Value toStringArray(const std::vector<std::string> &values);

private:
    static Json::StreamWriterBuilder createPrettyWriterBuilder();
    static Json::CharReaderBuilder createReaderBuilder();
};

}  // namespace TSM
