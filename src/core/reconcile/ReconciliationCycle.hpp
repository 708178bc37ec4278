#pragma once

/**
 * ReconciliationCycle.hpp
 *
 * One pass of pulling the daemon's transfer list and folding it into the
 * local queue.
 */

#include "Matcher.hpp"
#include "../EventBus.hpp"
#include "../queue/QueueStore.hpp"
#include "../transfer/TransferService.hpp"

#include <chrono>
#include <string>
#include <unordered_set>

namespace soulsync::core::completion {
class CompletionDispatcher;
}

namespace soulsync::core::cleanup {
class CleanupAgent;
}

namespace soulsync::core::reconcile {

struct ReconcileSettings {
    // Longest time an item may sit in the remote queue unseen
    std::chrono::seconds queueTimeout{180};

    // Consecutive cycles without a record before an item fails
    int missingCycleLimit{3};
};

/**
 * Summary of one cycle, returned to the polling controller and tests
 */
struct CycleReport {
    size_t activeBefore{0};
    size_t matched{0};
    size_t missing{0};
    size_t transitioned{0};
    size_t failedMissing{0};
    size_t failedTimeout{0};
    size_t activeAfter{0};
    size_t finishedAfter{0};
    bool idle{false};
    bool pollFailed{false};
};

/**
 * ReconciliationCycle - applies remote ground truth to active items
 *
 * Runs on whichever thread calls run(); the polling controller makes sure
 * two runs never overlap. The daemon is polled without any queue lock held
 * and every status write goes through QueueStore::atomicTransition.
 * Completed items are handed to the dispatcher, and terminal items with a
 * remote id to the cleanup agent; both may be null.
 */
class ReconciliationCycle {
public:
    ReconciliationCycle(queue::QueueStore& store,
                        transfer::TransferService& service,
                        EventBus& bus,
                        ReconcileSettings settings = {},
                        completion::CompletionDispatcher* dispatcher = nullptr,
                        cleanup::CleanupAgent* cleanup = nullptr);

    CycleReport run();

    const ReconcileSettings& settings() const { return m_settings; }

private:
    void applyMatch(const queue::DownloadItemPtr& item,
                    const MatchResult& match,
                    CycleReport& report,
                    json& changes);

    void handleMissing(const queue::DownloadItemPtr& item,
                       CycleReport& report,
                       json& changes);

    /**
     * Transition an item; the caller whose transition wins a terminal
     * status also moves it to finished
     * @return true if the status changed
     */
    bool transition(const queue::DownloadItemPtr& item,
                    queue::DownloadStatus newStatus,
                    json& changes,
                    const std::string& errorMessage = {});

    void route(const queue::DownloadItemPtr& item);

private:
    queue::QueueStore& m_store;
    transfer::TransferService& m_service;
    EventBus& m_bus;
    const ReconcileSettings m_settings;
    completion::CompletionDispatcher* m_dispatcher;
    cleanup::CleanupAgent* m_cleanup;
    Matcher m_matcher;
};

} // namespace soulsync::core::reconcile
