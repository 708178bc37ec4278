/**
 * Matcher.cpp
 */

#include "Matcher.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace soulsync::core::reconcile {

using transfer::TransferRecord;
using utils::StringUtils;

const char* toString(MatchKind kind) {
    switch (kind) {
        case MatchKind::RemoteId:        return "remote id";
        case MatchKind::UserAndFilename: return "user and filename";
        case MatchKind::TitleTokens:     return "title tokens";
    }
    return "unknown";
}

std::string claimKey(const TransferRecord& record) {
    if (!record.id.empty()) {
        return record.id;
    }
    // Records without an id are claimed by peer and path
    return "\x1f" + StringUtils::toLower(record.username) + "\x1f" + StringUtils::toLower(record.filename);
}

std::optional<MatchResult> Matcher::match(const queue::DownloadItem& item,
                                          const std::vector<TransferRecord>& records,
                                          const std::unordered_set<std::string>& claimed) const {
    auto isClaimed = [&claimed](const TransferRecord& record) {
        return claimed.count(claimKey(record)) > 0;
    };

    // 1. Remote id
    const auto remoteId = item.remoteTransferId();
    if (remoteId) {
        for (const auto& record : records) {
            if (record.id == *remoteId && !isClaimed(record)) {
                return MatchResult{&record, MatchKind::RemoteId};
            }
        }
    }

    // 2. Username + basename
    const std::string itemBase = StringUtils::baseName(item.filePath());
    if (!itemBase.empty()) {
        for (const auto& record : records) {
            if (isClaimed(record)) continue;
            if (!StringUtils::equalsIgnoreCase(record.username, item.username())) continue;
            if (StringUtils::equalsIgnoreCase(StringUtils::baseName(record.filename), itemBase)) {
                return MatchResult{&record, MatchKind::UserAndFilename};
            }
        }
    }

    // A paired item whose record is absent waits out the grace period
    // instead of taking a loosely similar record
    if (remoteId) {
        return std::nullopt;
    }

    // 3. Title tokens, long ones only
    const auto tokens = StringUtils::tokenize(item.title(), m_minTitleTokenLength);
    if (!tokens.empty()) {
        for (const auto& record : records) {
            if (isClaimed(record)) continue;
            const std::string base = StringUtils::toLower(StringUtils::baseName(record.filename));
            bool all = std::all_of(tokens.begin(), tokens.end(), [&base](const std::string& token) {
                return StringUtils::contains(base, token);
            });
            if (all) {
                return MatchResult{&record, MatchKind::TitleTokens};
            }
        }
    }

    return std::nullopt;
}

} // namespace soulsync::core::reconcile
