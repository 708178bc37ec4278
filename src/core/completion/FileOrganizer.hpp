#pragma once

/**
 * FileOrganizer.hpp
 *
 * Default post-processor: moves a finished download into the library tree.
 */

#include "PostProcessor.hpp"

#include <filesystem>

namespace soulsync::core::completion {

namespace fs = std::filesystem;

/**
 * FileOrganizer - <transferDir>/<Artist>/<Album>/<NN - Title><ext>
 *
 * The source is looked up as <downloadDir>/<basename of the remote path>,
 * then anywhere below downloadDir. Existing targets are never overwritten;
 * a " (n)" suffix is added instead.
 */
class FileOrganizer : public PostProcessor {
public:
    FileOrganizer(fs::path downloadDir, fs::path transferDir);

    PostProcessResult organize(const queue::DownloadItem& item) override;

    /**
     * Library path for an item, relative to the transfer directory
     */
    static fs::path relativeTarget(const queue::DownloadItem& item, const std::string& extension);

    const fs::path& downloadDir() const { return m_downloadDir; }
    const fs::path& transferDir() const { return m_transferDir; }

private:
    fs::path locateSource(const std::string& remotePath) const;

private:
    fs::path m_downloadDir;
    fs::path m_transferDir;
};

} // namespace soulsync::core::completion
