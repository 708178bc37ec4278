/**
 * StatusMapper.cpp
 */

#include "StatusMapper.hpp"
#include "../../utils/StringUtils.hpp"

#include <array>

namespace soulsync::core::reconcile {

using queue::DownloadStatus;
using utils::StringUtils;

namespace {

constexpr std::array<const char*, 2> kCancelledTerms{"cancel", "abort"};
constexpr std::array<const char*, 5> kFailedTerms{"error", "fail", "reject", "timedout", "timed out"};
constexpr std::array<const char*, 2> kCompletedTerms{"complete", "succeed"};
constexpr std::array<const char*, 4> kInProgressTerms{"inprogress", "in progress", "downloading", "transferring"};

template<size_t N>
bool containsAny(const std::string& haystack, const std::array<const char*, N>& terms) {
    for (const char* term : terms) {
        if (StringUtils::contains(haystack, term)) return true;
    }
    return false;
}

} // namespace

DownloadStatus StatusMapper::map(const std::string& remoteState) {
    const std::string state = StringUtils::toLower(remoteState);

    if (containsAny(state, kCancelledTerms)) return DownloadStatus::Cancelled;
    if (containsAny(state, kFailedTerms)) return DownloadStatus::Failed;
    if (containsAny(state, kCompletedTerms)) return DownloadStatus::Completed;
    if (containsAny(state, kInProgressTerms)) return DownloadStatus::Downloading;

    // "Requested", "Queued, Locally", "Queued, Remotely", "Initializing", unknown
    return DownloadStatus::Queued;
}

bool StatusMapper::isQueuedGroup(DownloadStatus status) {
    return status == DownloadStatus::Queued;
}

} // namespace soulsync::core::reconcile
