#pragma once

/**
 * QueueStore.hpp
 *
 * Owner of the active and finished download collections.
 * All mutation of either collection goes through this class.
 */

#include "DownloadItem.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace soulsync::core::queue {

/**
 * Called after a status write, with the status before and after
 */
using TransitionCallback = std::function<void(
    const DownloadItemPtr& item,
    DownloadStatus oldStatus,
    DownloadStatus newStatus
)>;

/**
 * Called after a collection's size changed
 */
using SizeChangedCallback = std::function<void(size_t activeCount, size_t finishedCount)>;

/**
 * QueueStore - thread-safe active/finished collections
 *
 * Operations never throw on a missing item; they return false, since a
 * cancel racing a reconciliation cycle is expected.
 */
class QueueStore {
public:
    /**
     * Coalesces size-changed notifications while alive. When the outermost
     * batch closes, one notification with the current counts is fired if
     * any size change happened inside it.
     */
    class NotificationBatch {
    public:
        explicit NotificationBatch(QueueStore& store) : m_store(store) { m_store.beginBatch(); }
        ~NotificationBatch() { m_store.endBatch(); }

        NotificationBatch(const NotificationBatch&) = delete;
        NotificationBatch& operator=(const NotificationBatch&) = delete;

    private:
        QueueStore& m_store;
    };

    QueueStore() = default;

    QueueStore(const QueueStore&) = delete;
    QueueStore& operator=(const QueueStore&) = delete;

    /**
     * Append an item to the active collection
     * @return false if the item is null or already tracked
     */
    bool addActive(const DownloadItemPtr& item);

    /**
     * Remove an item from the active collection by identity
     * @return true if the item was present
     */
    bool removeActive(const DownloadItemPtr& item);

    /**
     * Remove an item from the finished collection by identity
     * @return true if the item was present
     */
    bool removeFinished(const DownloadItemPtr& item);

    /**
     * Move an item from active to finished under one lock
     * @return true if the item was active
     */
    bool moveToFinished(const DownloadItemPtr& item);

    /**
     * Remove and return every finished item
     */
    std::vector<DownloadItemPtr> clearFinished();

    /**
     * Write a status in one critical section and fire the callback only if
     * the status actually changed. The callback runs inside that section:
     * it may use the item and the collection operations, but must not start
     * another transition.
     * @param item Item to transition
     * @param newStatus Target status
     * @param onTransition Optional callback (item, oldStatus, newStatus)
     * @return true if the status changed
     */
    bool atomicTransition(const DownloadItemPtr& item,
                          DownloadStatus newStatus,
                          const TransitionCallback& onTransition = nullptr);

    // Independent copies; safe to iterate without any lock held
    std::vector<DownloadItemPtr> snapshotActive() const;
    std::vector<DownloadItemPtr> snapshotFinished() const;

    /**
     * Find an item by id in either collection
     * @return nullptr if unknown
     */
    DownloadItemPtr findById(const std::string& id) const;

    bool isActive(const DownloadItemPtr& item) const;
    bool isFinished(const DownloadItemPtr& item) const;

    size_t activeCount() const;
    size_t finishedCount() const;

    void setSizeChangedCallback(SizeChangedCallback callback);

private:
    void notifySizeChanged(size_t activeCount, size_t finishedCount);

    void beginBatch();
    void endBatch();

    static bool eraseItem(std::vector<DownloadItemPtr>& items, const DownloadItemPtr& item);
    static bool containsItem(const std::vector<DownloadItemPtr>& items, const DownloadItemPtr& item);

private:
    mutable std::mutex m_mutex;
    std::vector<DownloadItemPtr> m_active;
    std::vector<DownloadItemPtr> m_finished;

    // Serializes status writes together with their callbacks
    std::mutex m_transitionMutex;

    std::mutex m_callbackMutex;
    SizeChangedCallback m_sizeChangedCallback;
    int m_batchDepth{0};
    bool m_batchPending{false};
};

} // namespace soulsync::core::queue
