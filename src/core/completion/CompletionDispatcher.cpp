/**
 * CompletionDispatcher.cpp
 */

#include "CompletionDispatcher.hpp"
#include "../Logger.hpp"

namespace soulsync::core::completion {

using queue::DownloadItemPtr;
using queue::DownloadStatus;

CompletionDispatcher::CompletionDispatcher(std::shared_ptr<PostProcessor> processor,
                                           EventBus& bus,
                                           size_t workers)
    : m_processor(std::move(processor))
    , m_bus(bus)
    , m_pool(std::make_unique<ThreadPool>(workers == 0 ? 1 : workers, "completion")) {
}

CompletionDispatcher::~CompletionDispatcher() {
    shutdown();
}

bool CompletionDispatcher::dispatch(const DownloadItemPtr& item) {
    if (!item) return false;

    if (item->status() != DownloadStatus::Completed) {
        Logger::instance().warn("Refusing to post-process {} in state {}",
            item->id(), queue::toString(item->status()));
        return false;
    }

    if (!item->markCompletionProcessed()) {
        Logger::instance().debug("Completion for {} already processed", item->id());
        return false;
    }

    if (!m_processor) {
        Logger::instance().debug("No post-processor configured; {} left as downloaded", item->id());
        return false;
    }

    try {
        m_pool->post([this, item]() { process(item); });
    } catch (const std::runtime_error& e) {
        Logger::instance().warn("Post-processing for {} not queued: {}", item->id(), e.what());
        return false;
    }

    ++m_dispatched;
    Logger::instance().debug("Queued post-processing for '{}' ({})", item->title(), item->id());
    return true;
}

void CompletionDispatcher::waitIdle() {
    m_pool->waitAll();
}

void CompletionDispatcher::shutdown() {
    m_pool->shutdown();
}

void CompletionDispatcher::process(const DownloadItemPtr& item) {
    PostProcessResult result;

    try {
        result = m_processor->organize(*item);
    } catch (const std::exception& e) {
        result = PostProcessResult::failure(e.what());
    }

    if (!result.ok) {
        ++m_failed;
        Logger::instance().error("Post-processing failed for '{}' ({}): {}",
            item->title(), item->id(), result.error);
        return;
    }

    if (!result.finalPath.empty()) {
        item->setFilePath(result.finalPath);
    }
    ++m_succeeded;

    Logger::instance().info("Organized '{}' -> {}", item->title(), result.finalPath);

    m_bus.emit(events::DownloadOrganized, {
        {"id", item->id()},
        {"path", item->filePath()}
    });
}

} // namespace soulsync::core::completion
