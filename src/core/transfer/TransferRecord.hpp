#pragma once

/**
 * TransferRecord.hpp
 *
 * One row of the transfer daemon's download list.
 */

#include <cstdint>
#include <string>

namespace soulsync::core::transfer {

/**
 * TransferRecord - remote view of a single file transfer
 *
 * Read-only for the duration of a reconciliation cycle.
 */
struct TransferRecord {
    std::string id;
    std::string username;

    // Remote path as reported by the peer (either separator)
    std::string filename;

    // Free-text daemon vocabulary, e.g. "InProgress", "Completed, Succeeded"
    std::string state;

    double percentComplete{0.0};
    double averageSpeed{0.0};
    int64_t size{0};
    int64_t bytesTransferred{0};
};

} // namespace soulsync::core::transfer
