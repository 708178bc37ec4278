// SoulSync Queue - String Utilities
// String helpers for matching and path handling

#pragma once

#include <string>
#include <vector>

namespace soulsync::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    // Splitting
    static std::vector<std::string> split(const std::string& str, char delimiter);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);

    // Tokenizing for fuzzy filename matching (lower-cased, alphanumeric runs)
    static std::vector<std::string> tokenize(const std::string& str, size_t minLength = 1);

    // Remote paths use either separator depending on the peer's platform
    static std::string baseName(const std::string& path);
    static std::string sanitizeFileName(const std::string& name);

    // UUID
    static std::string generateUUID();
};

} // namespace soulsync::utils
