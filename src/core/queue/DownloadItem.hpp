#pragma once

/**
 * DownloadItem.hpp
 *
 * One requested download and its lifecycle state.
 * The transfer itself runs in the external daemon; this is the local model.
 */

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace soulsync::core::queue {

/**
 * Download lifecycle status
 *
 * Legal edges: Queued -> Downloading -> {Completed, Failed, Cancelled}
 * and Queued -> {Failed, Cancelled}. Terminal states never change.
 */
enum class DownloadStatus {
    Queued,
    Downloading,
    Completed,
    Failed,
    Cancelled
};

const char* toString(DownloadStatus status);
bool isTerminal(DownloadStatus status);
bool isLegalTransition(DownloadStatus from, DownloadStatus to);

/**
 * Parameters for a new download, as supplied by the requesting layer
 */
struct DownloadRequest {
    std::string title;
    std::string artist;
    std::optional<std::string> album;
    std::optional<int> trackNumber;

    // Remote peer serving the file
    std::string username;

    // Remote path of the file on the peer
    std::string filePath;

    // Set for matched (metadata-enhanced) downloads
    bool runPostProcessing{false};

    // Known when the daemon already answered the enqueue call with an id
    std::optional<std::string> remoteTransferId;
};

/**
 * Value copy of an item, safe to hand to another thread
 */
struct DownloadItemView {
    std::string id;
    std::optional<std::string> remoteTransferId;
    std::string title;
    std::string artist;
    std::optional<std::string> album;
    std::optional<int> trackNumber;
    std::string username;
    std::string filePath;
    DownloadStatus status{DownloadStatus::Downloading};
    int progress{0};
    double speed{0.0};
    int apiMissingCount{0};
    bool completionProcessed{false};
    bool runPostProcessing{false};
    std::string errorMessage;
};

class QueueStore;

/**
 * DownloadItem - shared, internally synchronized download record
 *
 * Items are handled through shared_ptr (DownloadItemPtr). Identity fields are
 * immutable; every mutable field is guarded by the item's own mutex. Status
 * is only written through QueueStore::atomicTransition.
 */
class DownloadItem {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * Create an item with status Downloading and progress 0
     * @param request Download parameters
     * @throws std::invalid_argument if username is empty, or both filePath and title are empty
     */
    explicit DownloadItem(const DownloadRequest& request);

    DownloadItem(const DownloadItem&) = delete;
    DownloadItem& operator=(const DownloadItem&) = delete;

    // Immutable identity
    const std::string& id() const { return m_id; }
    const std::string& title() const { return m_title; }
    const std::string& artist() const { return m_artist; }
    const std::optional<std::string>& album() const { return m_album; }
    const std::optional<int>& trackNumber() const { return m_trackNumber; }
    const std::string& username() const { return m_username; }
    bool runPostProcessing() const { return m_runPostProcessing; }

    DownloadStatus status() const;
    bool isTerminal() const;

    std::optional<std::string> remoteTransferId() const;
    void setRemoteTransferId(const std::string& remoteId);

    std::string filePath() const;
    void setFilePath(const std::string& path);

    int progress() const;

    /**
     * Record remote progress. Clamped to 0-100 and never decreases.
     * @return true if the stored value changed
     */
    bool updateProgress(int percent);

    double speed() const;
    void setSpeed(double bytesPerSecond);

    std::optional<Clock::time_point> queueEnteredAt() const;
    void setQueueEnteredAt(std::optional<Clock::time_point> when);

    int apiMissingCount() const;
    int incrementMissingCount();
    void resetMissingCount();

    std::string errorMessage() const;
    void setErrorMessage(const std::string& message);

    /**
     * Claim the one-time post-processing slot
     * @return true for exactly one caller over the item's lifetime
     */
    bool markCompletionProcessed();
    bool completionProcessed() const;

    /**
     * Rebuild the request this item was created from, with the current
     * file path and without the remote id (used to retry a failed item)
     */
    DownloadRequest toRetryRequest() const;

    DownloadItemView view() const;

private:
    friend class QueueStore;

    /**
     * Write a new status if the edge is legal and changes something
     * @param newStatus Target status
     * @param oldStatus Receives the status before the write
     * @return true if the status changed
     */
    bool applyStatus(DownloadStatus newStatus, DownloadStatus& oldStatus);

private:
    const std::string m_id;
    const std::string m_title;
    const std::string m_artist;
    const std::optional<std::string> m_album;
    const std::optional<int> m_trackNumber;
    const std::string m_username;
    const bool m_runPostProcessing;

    mutable std::mutex m_mutex;
    DownloadStatus m_status{DownloadStatus::Downloading};
    std::optional<std::string> m_remoteTransferId;
    std::string m_filePath;
    int m_progress{0};
    double m_speed{0.0};
    std::optional<Clock::time_point> m_queueEnteredAt;
    int m_apiMissingCount{0};
    std::string m_errorMessage;
    bool m_completionProcessed{false};
};

using DownloadItemPtr = std::shared_ptr<DownloadItem>;

} // namespace soulsync::core::queue
