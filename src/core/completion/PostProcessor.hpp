#pragma once

/**
 * PostProcessor.hpp
 *
 * Interface to the post-processing pipeline (file organization and tagging)
 * run once a download is confirmed complete.
 */

#include "../queue/DownloadItem.hpp"

#include <string>

namespace soulsync::core::completion {

/**
 * Outcome of organizing one downloaded file
 */
struct PostProcessResult {
    bool ok{false};
    std::string finalPath;
    std::string error;

    static PostProcessResult success(std::string path) {
        return {true, std::move(path), {}};
    }

    static PostProcessResult failure(std::string message) {
        return {false, {}, std::move(message)};
    }
};

/**
 * PostProcessor - black-box organize step
 *
 * Called on a worker thread once per completed item. Implementations may
 * throw; the dispatcher treats an exception like a failure result.
 */
class PostProcessor {
public:
    virtual ~PostProcessor() = default;

    virtual PostProcessResult organize(const queue::DownloadItem& item) = 0;
};

} // namespace soulsync::core::completion
