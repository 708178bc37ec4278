#pragma once

/**
 * Engine.hpp
 *
 * Owner of the download queue and every worker that touches it.
 * Constructed once by the host application and passed by reference.
 */

#include "Config.hpp"
#include "EventBus.hpp"
#include "cleanup/CleanupAgent.hpp"
#include "completion/CompletionDispatcher.hpp"
#include "completion/PostProcessor.hpp"
#include "queue/QueueStore.hpp"
#include "reconcile/PollingController.hpp"
#include "reconcile/ReconciliationCycle.hpp"
#include "transfer/TransferService.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace soulsync::core {

/**
 * Engine state enum
 */
enum class EngineState {
    Stopped,
    Running,
    ShuttingDown
};

/**
 * Settings for every engine component, normally read from Config
 */
struct EngineSettings {
    reconcile::ReconcileSettings reconcile;
    reconcile::PollingSettings polling;
    cleanup::CleanupSettings cleanup;
    size_t completionWorkers{2};

    static EngineSettings fromConfig(const Config& config = Config::instance());
};

/**
 * Read-only copy of the queue for the presentation layer
 */
struct QueueSnapshot {
    std::vector<queue::DownloadItemView> active;
    std::vector<queue::DownloadItemView> finished;

    size_t activeCount() const { return active.size(); }
    size_t finishedCount() const { return finished.size(); }

    json toJson() const;
};

/**
 * Engine - queue store, reconciliation, polling and background workers
 *
 * Nothing here throws to the caller: invalid requests and races are
 * reported through return values and logged. Events are published on the
 * engine's own bus; see events:: for the names.
 */
class Engine {
public:
    /**
     * @param settings Component settings
     * @param service Transfer daemon client
     * @param processor Post-processing pipeline (may be null)
     */
    Engine(EngineSettings settings,
           std::shared_ptr<transfer::TransferService> service,
           std::shared_ptr<completion::PostProcessor> processor);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /**
     * Start the polling timer
     * @return false if already running or shut down
     */
    bool start();

    /**
     * Stop polling and drain the worker pools; idempotent
     */
    void shutdown();

    EngineState getState() const { return m_state.load(); }
    bool isRunning() const { return m_state == EngineState::Running; }

    /**
     * Track a new download; it enters the active collection as downloading
     * @return The new item, or nullptr if the request is invalid
     */
    queue::DownloadItemPtr addDownload(const queue::DownloadRequest& request);

    /**
     * Cancel an active download. The daemon is told in the background.
     * @return true if this call cancelled it
     */
    bool cancelDownload(const std::string& id);

    /**
     * Re-request a failed or cancelled download as a new item
     * @return The new active item, or nullptr if the id is not retryable
     */
    queue::DownloadItemPtr retryDownload(const std::string& id);

    /**
     * Forget every finished item and ask the daemon to do the same
     * @return Number of items removed
     */
    size_t clearCompleted();

    void setBulkOperation(bool inProgress);
    bool bulkOperation() const;

    /**
     * Run a reconciliation cycle on the calling thread
     * @return This cycle's report, or std::nullopt if a cycle was already
     *         running or this one threw
     */
    std::optional<reconcile::CycleReport> runCycleNow();

    std::optional<reconcile::CycleReport> lastReport() const;

    QueueSnapshot snapshot() const;

    queue::DownloadItemPtr findDownload(const std::string& id) const;

    SubscriptionPtr subscribe(const std::string& event, EventCallback callback);
    void unsubscribe(const SubscriptionPtr& subscription);

    EventBus& events() { return m_bus; }
    queue::QueueStore& store() { return m_store; }
    reconcile::PollingController& polling() { return *m_polling; }
    completion::CompletionDispatcher& dispatcher() { return *m_dispatcher; }
    cleanup::CleanupAgent& cleanupAgent() { return *m_cleanup; }

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "SoulSync Queue"; }

private:
    reconcile::CycleReport runCycle();

private:
    std::atomic<EngineState> m_state{EngineState::Stopped};

    const EngineSettings m_settings;
    std::shared_ptr<transfer::TransferService> m_service;

    EventBus m_bus;
    queue::QueueStore m_store;

    std::unique_ptr<completion::CompletionDispatcher> m_dispatcher;
    std::unique_ptr<cleanup::CleanupAgent> m_cleanup;
    std::unique_ptr<reconcile::ReconciliationCycle> m_cycle;

    mutable std::mutex m_reportMutex;
    std::optional<reconcile::CycleReport> m_lastReport;

    // Declared last: its timer thread calls into everything above
    std::unique_ptr<reconcile::PollingController> m_polling;
};

} // namespace soulsync::core
