// SoulSync Queue - String Utilities Implementation

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>

namespace soulsync::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// -- Splitting --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

// -- Search --

bool StringUtils::contains(const std::string& str, const std::string& substr) {
    return str.find(substr) != std::string::npos;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> StringUtils::tokenize(const std::string& str, size_t minLength) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (current.size() >= minLength && !current.empty()) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || uc >= 0x80) {
            current += static_cast<char>(std::tolower(uc));
        } else {
            flush();
        }
    }
    flush();

    return tokens;
}

// -- Paths --

std::string StringUtils::baseName(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string StringUtils::sanitizeFileName(const std::string& name) {
    static const std::string forbidden = "<>:\"/\\|?*";

    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || forbidden.find(c) != std::string::npos) result += '_';
        else result += c;
    }

    result = trim(result);
    while (!result.empty() && result.back() == '.') result.pop_back();
    return result.empty() ? "_" : result;
}

// -- UUID --

std::string StringUtils::generateUUID() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    static const char hex[] = "0123456789abcdef";

    std::string uuid(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex[dis(gen)];
    }
    uuid[14] = '4'; // version 4
    uuid[19] = hex[(dis(gen) & 0x3) | 0x8]; // variant
    return uuid;
}

} // namespace soulsync::utils
