/**
 * DownloadItem.cpp
 *
 * Download record state and the status transition graph.
 */

#include "DownloadItem.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <stdexcept>

namespace soulsync::core::queue {

const char* toString(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Queued:      return "queued";
        case DownloadStatus::Downloading: return "downloading";
        case DownloadStatus::Completed:   return "completed";
        case DownloadStatus::Failed:      return "failed";
        case DownloadStatus::Cancelled:   return "cancelled";
    }
    return "unknown";
}

bool isTerminal(DownloadStatus status) {
    return status == DownloadStatus::Completed ||
           status == DownloadStatus::Failed ||
           status == DownloadStatus::Cancelled;
}

bool isLegalTransition(DownloadStatus from, DownloadStatus to) {
    switch (from) {
        case DownloadStatus::Queued:
            return to == DownloadStatus::Downloading ||
                   to == DownloadStatus::Failed ||
                   to == DownloadStatus::Cancelled;
        case DownloadStatus::Downloading:
            return to == DownloadStatus::Completed ||
                   to == DownloadStatus::Failed ||
                   to == DownloadStatus::Cancelled;
        default:
            return false;
    }
}

// -- DownloadItem --

DownloadItem::DownloadItem(const DownloadRequest& request)
    : m_id(utils::StringUtils::generateUUID())
    , m_title(request.title)
    , m_artist(request.artist)
    , m_album(request.album)
    , m_trackNumber(request.trackNumber)
    , m_username(request.username)
    , m_runPostProcessing(request.runPostProcessing)
    , m_filePath(request.filePath) {

    if (utils::StringUtils::trim(request.username).empty()) {
        throw std::invalid_argument("Download request has no username");
    }
    if (request.filePath.empty() && request.title.empty()) {
        throw std::invalid_argument("Download request needs a file path or a title");
    }
    if (request.remoteTransferId && !request.remoteTransferId->empty()) {
        m_remoteTransferId = request.remoteTransferId;
    }
}

DownloadStatus DownloadItem::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

bool DownloadItem::isTerminal() const {
    return queue::isTerminal(status());
}

std::optional<std::string> DownloadItem::remoteTransferId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_remoteTransferId;
}

void DownloadItem::setRemoteTransferId(const std::string& remoteId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (remoteId.empty()) {
        m_remoteTransferId.reset();
    } else {
        m_remoteTransferId = remoteId;
    }
}

std::string DownloadItem::filePath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_filePath;
}

void DownloadItem::setFilePath(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_filePath = path;
}

int DownloadItem::progress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_progress;
}

bool DownloadItem::updateProgress(int percent) {
    percent = std::clamp(percent, 0, 100);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (queue::isTerminal(m_status) || percent <= m_progress) {
        return false;
    }
    m_progress = percent;
    return true;
}

double DownloadItem::speed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_speed;
}

void DownloadItem::setSpeed(double bytesPerSecond) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_speed = std::max(0.0, bytesPerSecond);
}

std::optional<DownloadItem::Clock::time_point> DownloadItem::queueEnteredAt() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queueEnteredAt;
}

void DownloadItem::setQueueEnteredAt(std::optional<Clock::time_point> when) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queueEnteredAt = when;
}

int DownloadItem::apiMissingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_apiMissingCount;
}

int DownloadItem::incrementMissingCount() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return ++m_apiMissingCount;
}

void DownloadItem::resetMissingCount() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_apiMissingCount = 0;
}

std::string DownloadItem::errorMessage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errorMessage;
}

void DownloadItem::setErrorMessage(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorMessage = message;
}

bool DownloadItem::markCompletionProcessed() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_completionProcessed) {
        return false;
    }
    m_completionProcessed = true;
    return true;
}

bool DownloadItem::completionProcessed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_completionProcessed;
}

DownloadRequest DownloadItem::toRetryRequest() const {
    DownloadRequest request;
    request.title = m_title;
    request.artist = m_artist;
    request.album = m_album;
    request.trackNumber = m_trackNumber;
    request.username = m_username;
    request.filePath = filePath();
    request.runPostProcessing = m_runPostProcessing;
    return request;
}

DownloadItemView DownloadItem::view() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    DownloadItemView v;
    v.id = m_id;
    v.remoteTransferId = m_remoteTransferId;
    v.title = m_title;
    v.artist = m_artist;
    v.album = m_album;
    v.trackNumber = m_trackNumber;
    v.username = m_username;
    v.filePath = m_filePath;
    v.status = m_status;
    v.progress = m_progress;
    v.speed = m_speed;
    v.apiMissingCount = m_apiMissingCount;
    v.completionProcessed = m_completionProcessed;
    v.runPostProcessing = m_runPostProcessing;
    v.errorMessage = m_errorMessage;
    return v;
}

bool DownloadItem::applyStatus(DownloadStatus newStatus, DownloadStatus& oldStatus) {
    std::lock_guard<std::mutex> lock(m_mutex);

    oldStatus = m_status;
    if (m_status == newStatus || !isLegalTransition(m_status, newStatus)) {
        return false;
    }

    m_status = newStatus;
    if (newStatus == DownloadStatus::Completed) {
        m_progress = 100;
    }
    if (queue::isTerminal(newStatus)) {
        m_speed = 0.0;
        m_queueEnteredAt.reset();
    }
    return true;
}

} // namespace soulsync::core::queue
