#pragma once

/**
 * CleanupAgent.hpp
 *
 * Best-effort removal of finished transfers from the daemon's own list.
 */

#include "../ThreadPool.hpp"
#include "../queue/DownloadItem.hpp"
#include "../transfer/TransferService.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace soulsync::core::cleanup {

struct CleanupSettings {
    // Delay before each retry; the first attempt runs immediately
    std::vector<std::chrono::milliseconds> retryDelays{
        std::chrono::milliseconds(2000),
        std::chrono::milliseconds(5000),
        std::chrono::milliseconds(10000)
    };

    std::chrono::milliseconds sweepDelay{30000};
    size_t sweepBatch{5};
    size_t workers{2};
};

struct CleanupStats {
    size_t scheduled{0};
    size_t attempts{0};
    size_t succeeded{0};
    size_t abandoned{0};
    size_t sweeps{0};
    size_t sweptRecords{0};
};

/**
 * CleanupAgent - remote hygiene for terminal downloads
 *
 * Every scheduled cleanup runs on a worker: one attempt, then one retry per
 * configured delay. Scheduling also arms a single delayed sweep that removes
 * a bounded batch of failed or cancelled records the daemon still lists.
 * Nothing here ever touches local item state.
 */
class CleanupAgent {
public:
    CleanupAgent(transfer::TransferService& service, CleanupSettings settings = {});
    ~CleanupAgent();

    CleanupAgent(const CleanupAgent&) = delete;
    CleanupAgent& operator=(const CleanupAgent&) = delete;

    /**
     * Schedule removal of the item's remote record
     * @return false if the item has no remote id yet
     */
    bool schedule(const queue::DownloadItem& item, bool remove = true);

    /**
     * Schedule a cancel call for a remote transfer
     * @param remoteId Remote transfer id
     * @param username Peer serving the file
     * @param remove true to also drop the record from the daemon's list
     * @return false if the id is empty or the agent is shut down
     */
    bool schedule(const std::string& remoteId, const std::string& username, bool remove = true);

    /**
     * Ask the daemon, once and in the background, to drop all finished transfers
     * @return false after shutdown
     */
    bool scheduleClearCompleted();

    /**
     * Arm the delayed sweep unless one is already pending
     */
    void armSweep();

    /**
     * Run one sweep on the calling thread
     * @return Number of records the daemon accepted for removal
     */
    size_t sweepNow();

    bool sweepArmed() const;

    /**
     * Block until every scheduled cleanup finished (sweeps excluded)
     */
    void waitIdle();

    /**
     * Abandon pending retries, drain the workers and stop the sweeper
     */
    void shutdown();

    CleanupStats stats() const;

private:
    void runCleanup(const std::string& remoteId, const std::string& username, bool remove);
    void sweeperLoop();

    // Sleeps unless shutdown starts; returns false if it did
    bool waitFor(std::chrono::milliseconds delay);

private:
    transfer::TransferService& m_service;
    const CleanupSettings m_settings;

    std::unique_ptr<ThreadPool> m_pool;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopping{false};
    bool m_sweepArmed{false};
    std::chrono::steady_clock::time_point m_sweepDue;
    std::thread m_sweeper;

    std::atomic<size_t> m_scheduled{0};
    std::atomic<size_t> m_attempts{0};
    std::atomic<size_t> m_succeeded{0};
    std::atomic<size_t> m_abandoned{0};
    std::atomic<size_t> m_sweeps{0};
    std::atomic<size_t> m_sweptRecords{0};
};

} // namespace soulsync::core::cleanup
