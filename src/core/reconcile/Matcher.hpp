#pragma once

/**
 * Matcher.hpp
 *
 * Pairs a local download with the daemon record describing it.
 */

#include "../queue/DownloadItem.hpp"
#include "../transfer/TransferRecord.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace soulsync::core::reconcile {

/**
 * How a record was paired with an item
 */
enum class MatchKind {
    RemoteId,
    UserAndFilename,
    TitleTokens
};

const char* toString(MatchKind kind);

struct MatchResult {
    const transfer::TransferRecord* record{nullptr};
    MatchKind kind{MatchKind::RemoteId};
};

/**
 * Key under which a record is claimed during one cycle
 */
std::string claimKey(const transfer::TransferRecord& record);

/**
 * Matcher - first rule that yields an unclaimed record wins
 *
 * 1. remote transfer id, once the item has one
 * 2. username + file basename, case-insensitive
 * 3. every title token of at least minTitleTokenLength chars appears in the
 *    record's basename; only for items not yet paired with a remote id
 */
class Matcher {
public:
    explicit Matcher(size_t minTitleTokenLength = 4)
        : m_minTitleTokenLength(minTitleTokenLength) {}

    /**
     * @param item Local download
     * @param records Daemon records for this cycle
     * @param claimed Claim keys already attributed this cycle
     * @return Best unclaimed record, or std::nullopt
     */
    std::optional<MatchResult> match(const queue::DownloadItem& item,
                                     const std::vector<transfer::TransferRecord>& records,
                                     const std::unordered_set<std::string>& claimed) const;

private:
    size_t m_minTitleTokenLength;
};

} // namespace soulsync::core::reconcile
