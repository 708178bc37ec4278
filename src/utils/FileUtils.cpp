/**
 * FileUtils.cpp
 * 
 * File system helpers built on std::filesystem.
 */

#include "FileUtils.hpp"

namespace soulsync::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::copyFile(const fs::path& source, const fs::path& destination, bool overwrite) {
    std::error_code ec;
    auto opts = overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none;
    return fs::copy_file(source, destination, opts, ec);
}

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) return true;

    // rename() fails across file systems; fall back to copy + delete
    if (!copyFile(source, destination, false)) return false;
    return deleteFile(source);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

fs::path FileUtils::uniquePath(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return path;

    const auto stem = path.stem().string();
    const auto ext = path.extension().string();
    for (int n = 1; n < 1000; ++n) {
        fs::path candidate = path.parent_path() / (stem + " (" + std::to_string(n) + ")" + ext);
        if (!fs::exists(candidate, ec)) return candidate;
    }
    return path;
}

std::vector<fs::path> FileUtils::findByName(const fs::path& root, const std::string& fileName) {
    std::vector<fs::path> matches;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return matches;

    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().filename() == fileName) {
            matches.push_back(it->path());
        }
    }
    return matches;
}

} // namespace soulsync::utils
