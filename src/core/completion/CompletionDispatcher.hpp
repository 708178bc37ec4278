#pragma once

/**
 * CompletionDispatcher.hpp
 *
 * Runs post-processing for completed downloads off the reconciliation thread.
 */

#include "PostProcessor.hpp"
#include "../EventBus.hpp"
#include "../ThreadPool.hpp"
#include "../queue/DownloadItem.hpp"

#include <atomic>
#include <memory>

namespace soulsync::core::completion {

/**
 * CompletionDispatcher - at-most-once post-processing
 *
 * dispatch() claims the item's completion slot; only the caller that wins
 * it submits work. A failed organize step is logged and leaves the item
 * completed with its original path.
 */
class CompletionDispatcher {
public:
    /**
     * @param processor Pipeline to run (may be null: completions are then only claimed)
     * @param bus Bus receiving download.organized events
     * @param workers Worker count for the pipeline pool
     */
    CompletionDispatcher(std::shared_ptr<PostProcessor> processor,
                         EventBus& bus,
                         size_t workers = 2);
    ~CompletionDispatcher();

    CompletionDispatcher(const CompletionDispatcher&) = delete;
    CompletionDispatcher& operator=(const CompletionDispatcher&) = delete;

    /**
     * Submit a completed item for post-processing
     * @return true if this call claimed the item and queued the work
     */
    bool dispatch(const queue::DownloadItemPtr& item);

    /**
     * Block until every queued post-processing job finished
     */
    void waitIdle();

    /**
     * Finish queued jobs and stop the workers
     */
    void shutdown();

    size_t dispatchedCount() const { return m_dispatched.load(); }
    size_t succeededCount() const { return m_succeeded.load(); }
    size_t failedCount() const { return m_failed.load(); }

private:
    void process(const queue::DownloadItemPtr& item);

private:
    std::shared_ptr<PostProcessor> m_processor;
    EventBus& m_bus;
    std::unique_ptr<ThreadPool> m_pool;

    std::atomic<size_t> m_dispatched{0};
    std::atomic<size_t> m_succeeded{0};
    std::atomic<size_t> m_failed{0};
};

} // namespace soulsync::core::completion
