/**
 * QueueStore.cpp
 *
 * Implementation of the active/finished download collections.
 */

#include "QueueStore.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace soulsync::core::queue {

bool QueueStore::addActive(const DownloadItemPtr& item) {
    if (!item) return false;

    size_t activeCount = 0;
    size_t finishedCount = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (containsItem(m_active, item) || containsItem(m_finished, item)) {
            return false;
        }
        m_active.push_back(item);
        activeCount = m_active.size();
        finishedCount = m_finished.size();
    }

    notifySizeChanged(activeCount, finishedCount);
    return true;
}

bool QueueStore::removeActive(const DownloadItemPtr& item) {
    size_t activeCount = 0;
    size_t finishedCount = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!eraseItem(m_active, item)) {
            return false;
        }
        activeCount = m_active.size();
        finishedCount = m_finished.size();
    }

    notifySizeChanged(activeCount, finishedCount);
    return true;
}

bool QueueStore::removeFinished(const DownloadItemPtr& item) {
    size_t activeCount = 0;
    size_t finishedCount = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!eraseItem(m_finished, item)) {
            return false;
        }
        activeCount = m_active.size();
        finishedCount = m_finished.size();
    }

    notifySizeChanged(activeCount, finishedCount);
    return true;
}

bool QueueStore::moveToFinished(const DownloadItemPtr& item) {
    size_t activeCount = 0;
    size_t finishedCount = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!eraseItem(m_active, item)) {
            return false;
        }
        m_finished.push_back(item);
        activeCount = m_active.size();
        finishedCount = m_finished.size();
    }

    notifySizeChanged(activeCount, finishedCount);
    return true;
}

std::vector<DownloadItemPtr> QueueStore::clearFinished() {
    std::vector<DownloadItemPtr> removed;
    size_t activeCount = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        removed.swap(m_finished);
        activeCount = m_active.size();
    }

    if (!removed.empty()) {
        notifySizeChanged(activeCount, 0);
    }
    return removed;
}

bool QueueStore::atomicTransition(const DownloadItemPtr& item,
                                  DownloadStatus newStatus,
                                  const TransitionCallback& onTransition) {
    if (!item) return false;

    std::lock_guard<std::mutex> lock(m_transitionMutex);

    DownloadStatus oldStatus = DownloadStatus::Queued;
    if (!item->applyStatus(newStatus, oldStatus)) {
        if (oldStatus != newStatus) {
            Logger::instance().debug("Rejected transition {} -> {} for {}",
                toString(oldStatus), toString(newStatus), item->id());
        }
        return false;
    }

    Logger::instance().debug("Download {} transitioned {} -> {}",
        item->id(), toString(oldStatus), toString(newStatus));

    if (onTransition) {
        try {
            onTransition(item, oldStatus, newStatus);
        } catch (const std::exception& e) {
            Logger::instance().error("Transition callback for {} threw: {}", item->id(), e.what());
        }
    }

    return true;
}

std::vector<DownloadItemPtr> QueueStore::snapshotActive() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

std::vector<DownloadItemPtr> QueueStore::snapshotFinished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_finished;
}

DownloadItemPtr QueueStore::findById(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto matches = [&id](const DownloadItemPtr& item) { return item->id() == id; };

    auto it = std::find_if(m_active.begin(), m_active.end(), matches);
    if (it != m_active.end()) return *it;

    it = std::find_if(m_finished.begin(), m_finished.end(), matches);
    if (it != m_finished.end()) return *it;

    return nullptr;
}

bool QueueStore::isActive(const DownloadItemPtr& item) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return containsItem(m_active, item);
}

bool QueueStore::isFinished(const DownloadItemPtr& item) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return containsItem(m_finished, item);
}

size_t QueueStore::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}

size_t QueueStore::finishedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_finished.size();
}

void QueueStore::setSizeChangedCallback(SizeChangedCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_sizeChangedCallback = std::move(callback);
}

void QueueStore::notifySizeChanged(size_t activeCount, size_t finishedCount) {
    SizeChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        if (m_batchDepth > 0) {
            m_batchPending = true;
            return;
        }
        callback = m_sizeChangedCallback;
    }

    if (!callback) return;

    try {
        callback(activeCount, finishedCount);
    } catch (const std::exception& e) {
        Logger::instance().error("Size-changed callback threw: {}", e.what());
    }
}

void QueueStore::beginBatch() {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    ++m_batchDepth;
}

void QueueStore::endBatch() {
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        if (--m_batchDepth > 0 || !m_batchPending) {
            return;
        }
        m_batchPending = false;
    }

    size_t activeCount = 0;
    size_t finishedCount = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        activeCount = m_active.size();
        finishedCount = m_finished.size();
    }
    notifySizeChanged(activeCount, finishedCount);
}

bool QueueStore::eraseItem(std::vector<DownloadItemPtr>& items, const DownloadItemPtr& item) {
    auto it = std::find(items.begin(), items.end(), item);
    if (it == items.end()) {
        return false;
    }
    items.erase(it);
    return true;
}

bool QueueStore::containsItem(const std::vector<DownloadItemPtr>& items, const DownloadItemPtr& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

} // namespace soulsync::core::queue
