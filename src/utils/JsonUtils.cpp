/**
 * JsonUtils.cpp
 * 
 * JSON parsing helpers.
 */

#include "JsonUtils.hpp"

namespace soulsync::utils {

// -- Parsing --

std::optional<json> JsonUtils::parse(const std::string& str) {
    try { return json::parse(str); }
    catch (const json::exception&) { return std::nullopt; }
}

// -- Safe accessors --

std::string JsonUtils::getString(const json& j, const std::string& key, const std::string& defaultValue) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return defaultValue;
}

int64_t JsonUtils::getLong(const json& j, const std::string& key, int64_t defaultValue) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return defaultValue;
}

double JsonUtils::getDouble(const json& j, const std::string& key, double defaultValue) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return defaultValue;
}

json JsonUtils::getArray(const json& j, const std::string& key, const json& defaultValue) {
    if (j.contains(key) && j[key].is_array()) return j[key];
    return defaultValue;
}

std::string JsonUtils::getIdString(const json& j, const std::string& key) {
    if (!j.contains(key)) return "";
    const auto& value = j[key];
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    return "";
}

} // namespace soulsync::utils
