#pragma once

/**
 * StatusMapper.hpp
 *
 * Maps the transfer daemon's free-text states onto DownloadStatus.
 */

#include "../queue/DownloadItem.hpp"

#include <string>

namespace soulsync::core::reconcile {

/**
 * StatusMapper - ordered substring rules
 *
 * Precedence: cancelled, failed, completed, in progress, otherwise queued.
 * Compound daemon states such as "Completed, Cancelled" embed the word
 * "Completed", so the terminal failure families are checked first.
 */
class StatusMapper {
public:
    static queue::DownloadStatus map(const std::string& remoteState);

    /**
     * True for statuses in the queued/initializing group, whose dwell time
     * is tracked for the queue timeout
     */
    static bool isQueuedGroup(queue::DownloadStatus status);
};

} // namespace soulsync::core::reconcile
