#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <sstream>

namespace TSM {

std::optional<Json::Value> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    Json::Value root;
    Json::CharReaderBuilder readerBuilder = createReaderBuilder();
    std::string parseErrors;
    std::istringstream jsonStream(jsonString);

    if (!Json::parseFromStream(readerBuilder, jsonStream, &root, &parseErrors)) {
        if (errorOut) {
            *errorOut = parseErrors;
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", parseErrors);
        return std::nullopt;
    }

    return root;
}

std::string JsonUtils::toPrettyString(const Json::Value &value) {
    Json::StreamWriterBuilder writerBuilder = createPrettyWriterBuilder();
    return Json::writeString(writerBuilder, value);
}

std::string JsonUtils::getString(const Json::Value &object, const std::string &key, const std::string &defaultValue) {
    if (!object.isObject() || !object.isMember(key)) {
        return defaultValue;
    }

    const Json::Value &value = object[key];
    if (!value.isString()) {
        return defaultValue;
    }

    return value.asString();
}

int JsonUtils::getInt(const Json::Value &object, const std::string &key, int defaultValue) {
    if (!object.isObject() || !object.isMember(key)) {
        return defaultValue;
    }

    const Json::Value &value = object[key];
    if (!value.isInt()) {
        return defaultValue;
    }

    return value.asInt();
}

std::optional<std::vector<std::string>> JsonUtils::getStringArray(const Json::Value &object, const std::string &key) {
    if (!object.isObject() || !object.isMember(key) || !object[key].isArray()) {
        return std::nullopt;
    }

    std::vector<std::string> result;
    for (const auto &element : object[key]) {
        if (!element.isString()) {
            return std::nullopt;
        }
        result.push_back(element.asString());
    }
    return result;
}

Json::Value JsonUtils::toStringArray(const std::vector<std::string> &values) {
    Json::Value array(Json::arrayValue);
    for (const auto &value : values) {
        array.append(value);
    }
    return array;
}

Json::StreamWriterBuilder JsonUtils::createPrettyWriterBuilder() {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return builder;
}

Json::CharReaderBuilder JsonUtils::createReaderBuilder() {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["rejectDupKeys"] = true;
    return builder;
}

}  // namespace TSM
