#pragma once

/**
 * TransferService.hpp
 *
 * Interface to the external transfer daemon.
 */

#include "TransferRecord.hpp"

#include <optional>
#include <string>
#include <vector>

namespace soulsync::core::transfer {

/**
 * TransferService - the operations the engine needs from the daemon
 *
 * Implementations report failures through return values and never throw.
 * All methods may block on the network and must be safe to call from
 * several threads at once.
 */
class TransferService {
public:
    virtual ~TransferService() = default;

    /**
     * List every transfer the daemon currently knows, flattened
     * @return std::nullopt when the poll failed (network, timeout, bad payload)
     */
    virtual std::optional<std::vector<TransferRecord>> listTransfers() = 0;

    /**
     * Cancel a transfer, optionally removing it from the daemon's list
     * @param id Remote transfer id
     * @param username Peer serving the file
     * @param remove true to also forget the record
     * @return true if the daemon accepted the request
     */
    virtual bool cancelTransfer(const std::string& id, const std::string& username, bool remove) = 0;

    /**
     * Remove every completed, cancelled and failed transfer from the daemon's list
     * @return true if the daemon accepted the request
     */
    virtual bool clearCompleted() = 0;
};

} // namespace soulsync::core::transfer
