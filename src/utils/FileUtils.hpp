// SoulSync Queue - File Utilities
// File system operations used by post-processing

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace soulsync::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool copyFile(const fs::path& source, const fs::path& destination, bool overwrite = false);
    static bool moveFile(const fs::path& source, const fs::path& destination);
    static bool deleteFile(const fs::path& path);

    // Appends " (n)" before the extension until the path is free
    static fs::path uniquePath(const fs::path& path);

    // Searches a directory tree for a file with the given name
    static std::vector<fs::path> findByName(const fs::path& root, const std::string& fileName);
};

} // namespace soulsync::utils
