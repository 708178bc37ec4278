// SoulSync Queue - JSON Utilities
// JSON parsing helpers for remote API payloads

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace soulsync::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parse(const std::string& str);

    // Safe accessors
    static std::string getString(const json& j, const std::string& key, const std::string& defaultValue = "");
    static int64_t getLong(const json& j, const std::string& key, int64_t defaultValue = 0);
    static double getDouble(const json& j, const std::string& key, double defaultValue = 0.0);
    static json getArray(const json& j, const std::string& key, const json& defaultValue = json::array());

    // Identifiers arrive as strings from some daemons and as numbers from others
    static std::string getIdString(const json& j, const std::string& key);
};

} // namespace soulsync::utils
