/**
 * FileOrganizer.cpp
 */

#include "FileOrganizer.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <cstdio>

namespace soulsync::core::completion {

using utils::FileUtils;
using utils::StringUtils;

FileOrganizer::FileOrganizer(fs::path downloadDir, fs::path transferDir)
    : m_downloadDir(std::move(downloadDir))
    , m_transferDir(std::move(transferDir)) {
}

PostProcessResult FileOrganizer::organize(const queue::DownloadItem& item) {
    const std::string remotePath = item.filePath();
    const fs::path source = locateSource(remotePath);

    if (source.empty()) {
        return PostProcessResult::failure("Downloaded file not found for " + remotePath);
    }

    const fs::path target = FileUtils::uniquePath(
        m_transferDir / relativeTarget(item, source.extension().string()));

    if (!FileUtils::createDirectories(target.parent_path())) {
        return PostProcessResult::failure("Cannot create " + target.parent_path().string());
    }

    if (!FileUtils::moveFile(source, target)) {
        return PostProcessResult::failure("Cannot move " + source.string() + " to " + target.string());
    }

    Logger::instance().debug("Moved {} -> {}", source.string(), target.string());
    return PostProcessResult::success(target.string());
}

fs::path FileOrganizer::relativeTarget(const queue::DownloadItem& item, const std::string& extension) {
    const std::string artist = item.artist().empty() ? "Unknown Artist" : item.artist();
    const std::string album = item.album() && !item.album()->empty() ? *item.album() : "Unknown Album";

    std::string title = item.title();
    if (title.empty()) {
        title = fs::path(StringUtils::baseName(item.filePath())).stem().string();
    }

    std::string fileName = title;
    if (item.trackNumber() && *item.trackNumber() > 0) {
        char prefix[16];
        std::snprintf(prefix, sizeof(prefix), "%02d - ", *item.trackNumber());
        fileName = prefix + title;
    }

    return fs::path(StringUtils::sanitizeFileName(artist))
         / StringUtils::sanitizeFileName(album)
         / (StringUtils::sanitizeFileName(fileName) + extension);
}

fs::path FileOrganizer::locateSource(const std::string& remotePath) const {
    const std::string name = StringUtils::baseName(remotePath);
    if (name.empty()) return {};

    fs::path direct = m_downloadDir / name;
    if (FileUtils::fileExists(direct)) {
        return direct;
    }

    // Daemons commonly keep the remote parent directory
    auto found = FileUtils::findByName(m_downloadDir, name);
    if (!found.empty()) {
        return found.front();
    }
    return {};
}

} // namespace soulsync::core::completion
