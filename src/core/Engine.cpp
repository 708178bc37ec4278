/**
 * Engine.cpp
 *
 * Implementation of the queue engine.
 */

#include "Engine.hpp"
#include "Logger.hpp"

#include <algorithm>

namespace soulsync::core {

using queue::DownloadItem;
using queue::DownloadItemPtr;
using queue::DownloadItemView;
using queue::DownloadRequest;
using queue::DownloadStatus;

namespace {

std::chrono::milliseconds millisFromConfig(const Config& config, const std::string& key, int fallback) {
    return std::chrono::milliseconds(std::max(1, config.get<int>(key, fallback)));
}

json viewToJson(const DownloadItemView& v) {
    json j = {
        {"id", v.id},
        {"title", v.title},
        {"artist", v.artist},
        {"username", v.username},
        {"filePath", v.filePath},
        {"status", queue::toString(v.status)},
        {"progress", v.progress},
        {"speed", v.speed},
        {"missingCycles", v.apiMissingCount}
    };
    j["remoteTransferId"] = v.remoteTransferId ? json(*v.remoteTransferId) : json(nullptr);
    j["album"] = v.album ? json(*v.album) : json(nullptr);
    j["trackNumber"] = v.trackNumber ? json(*v.trackNumber) : json(nullptr);
    if (!v.errorMessage.empty()) {
        j["error"] = v.errorMessage;
    }
    return j;
}

} // namespace

// -- EngineSettings --

EngineSettings EngineSettings::fromConfig(const Config& config) {
    EngineSettings s;

    s.reconcile.queueTimeout = std::chrono::seconds(
        std::max(1, config.get<int>("reconcile.queueTimeoutSeconds", 180)));
    s.reconcile.missingCycleLimit = std::max(1, config.get<int>("reconcile.missingCycleLimit", 3));

    s.polling.activeInterval = millisFromConfig(config, "polling.activeIntervalMs", 2000);
    s.polling.idleInterval = millisFromConfig(config, "polling.idleIntervalMs", 10000);
    s.polling.bulkInterval = millisFromConfig(config, "polling.bulkIntervalMs", 15000);

    auto delays = config.get<std::vector<int>>("cleanup.retryDelaysMs", {2000, 5000, 10000});
    s.cleanup.retryDelays.clear();
    for (int delay : delays) {
        s.cleanup.retryDelays.emplace_back(std::max(0, delay));
    }
    s.cleanup.sweepDelay = millisFromConfig(config, "cleanup.sweepDelayMs", 30000);
    s.cleanup.sweepBatch = static_cast<size_t>(std::max(1, config.get<int>("cleanup.sweepBatch", 5)));
    s.cleanup.workers = static_cast<size_t>(std::max(1, config.get<int>("cleanup.workers", 2)));

    s.completionWorkers = static_cast<size_t>(std::max(1, config.get<int>("completion.workers", 2)));
    return s;
}

// -- QueueSnapshot --

json QueueSnapshot::toJson() const {
    json activeItems = json::array();
    for (const auto& v : active) activeItems.push_back(viewToJson(v));

    json finishedItems = json::array();
    for (const auto& v : finished) finishedItems.push_back(viewToJson(v));

    return {
        {"activeCount", activeCount()},
        {"finishedCount", finishedCount()},
        {"active", activeItems},
        {"finished", finishedItems}
    };
}

// -- Engine --

Engine::Engine(EngineSettings settings,
               std::shared_ptr<transfer::TransferService> service,
               std::shared_ptr<completion::PostProcessor> processor)
    : m_settings(std::move(settings))
    , m_service(std::move(service)) {

    if (!m_service) {
        throw std::invalid_argument("Engine requires a transfer service");
    }

    m_store.setSizeChangedCallback([this](size_t activeCount, size_t finishedCount) {
        m_bus.emit(events::QueueSizeChanged, {
            {"active", activeCount},
            {"finished", finishedCount}
        });
    });

    m_dispatcher = std::make_unique<completion::CompletionDispatcher>(
        std::move(processor), m_bus, m_settings.completionWorkers);
    m_cleanup = std::make_unique<cleanup::CleanupAgent>(*m_service, m_settings.cleanup);
    m_cycle = std::make_unique<reconcile::ReconciliationCycle>(
        m_store, *m_service, m_bus, m_settings.reconcile, m_dispatcher.get(), m_cleanup.get());
    m_polling = std::make_unique<reconcile::PollingController>(
        [this]() { return runCycle().activeAfter; }, m_settings.polling);

    Logger::instance().debug("Engine created");
}

Engine::~Engine() {
    shutdown();
    m_store.setSizeChangedCallback(nullptr);
    Logger::instance().debug("Engine destroyed");
}

bool Engine::start() {
    EngineState expected = EngineState::Stopped;
    if (!m_state.compare_exchange_strong(expected, EngineState::Running)) {
        Logger::instance().warn("Engine already started");
        return false;
    }

    m_polling->recompute(m_store.activeCount());
    m_polling->start();

    Logger::instance().info("{} {} started", getName(), getVersion());
    return true;
}

void Engine::shutdown() {
    EngineState state = m_state.exchange(EngineState::ShuttingDown);
    if (state == EngineState::ShuttingDown) {
        return;
    }

    if (state == EngineState::Running) {
        Logger::instance().info("Shutting down engine...");
    }

    // Stop producing work before draining the consumers
    m_polling->stop();
    m_dispatcher->shutdown();
    m_cleanup->shutdown();

    if (state == EngineState::Running) {
        Logger::instance().info("Engine shutdown complete ({} active, {} finished)",
            m_store.activeCount(), m_store.finishedCount());
    }
}

DownloadItemPtr Engine::addDownload(const DownloadRequest& request) {
    DownloadItemPtr item;
    try {
        item = std::make_shared<DownloadItem>(request);
    } catch (const std::invalid_argument& e) {
        Logger::instance().warn("Rejected download request: {}", e.what());
        return nullptr;
    }

    m_store.addActive(item);
    m_polling->recompute(m_store.activeCount());

    Logger::instance().info("Queued download '{}' from {} ({})",
        item->title().empty() ? item->filePath() : item->title(), item->username(), item->id());
    return item;
}

bool Engine::cancelDownload(const std::string& id) {
    auto item = m_store.findById(id);
    if (!item) {
        Logger::instance().debug("Cancel for unknown download {}", id);
        return false;
    }

    if (!m_store.atomicTransition(item, DownloadStatus::Cancelled)) {
        Logger::instance().debug("Download {} is already {}", id, queue::toString(item->status()));
        return false;
    }

    m_store.moveToFinished(item);

    // Remote cancel and removal run in the background
    if (item->remoteTransferId()) {
        m_cleanup->schedule(*item, true);
    }

    Logger::instance().info("Cancelled download '{}' ({})", item->title(), id);

    m_bus.emit(events::DownloadCancelled, {{"id", id}});
    m_polling->recompute(m_store.activeCount());
    return true;
}

DownloadItemPtr Engine::retryDownload(const std::string& id) {
    auto old = m_store.findById(id);
    if (!old) {
        Logger::instance().debug("Retry for unknown download {}", id);
        return nullptr;
    }

    const auto status = old->status();
    if (status != DownloadStatus::Failed && status != DownloadStatus::Cancelled) {
        Logger::instance().warn("Cannot retry download {} in state {}", id, queue::toString(status));
        return nullptr;
    }

    // Lost a race with clearCompleted or another retry
    if (!m_store.removeFinished(old)) {
        return nullptr;
    }

    DownloadItemPtr item;
    try {
        item = std::make_shared<DownloadItem>(old->toRetryRequest());
    } catch (const std::invalid_argument& e) {
        Logger::instance().error("Cannot rebuild download {}: {}", id, e.what());
        return nullptr;
    }

    m_store.addActive(item);

    Logger::instance().info("Retrying '{}' as {} (was {})", item->title(), item->id(), id);

    m_bus.emit(events::DownloadRetried, {
        {"id", item->id()},
        {"previousId", id}
    });
    m_polling->recompute(m_store.activeCount());
    return item;
}

size_t Engine::clearCompleted() {
    auto removed = m_store.clearFinished();

    m_cleanup->scheduleClearCompleted();

    Logger::instance().info("Cleared {} finished downloads", removed.size());
    m_bus.emit(events::QueueCleared, {{"removed", removed.size()}});
    return removed.size();
}

void Engine::setBulkOperation(bool inProgress) {
    m_polling->setBulkOperation(inProgress);
}

bool Engine::bulkOperation() const {
    return m_polling->bulkOperation();
}

std::optional<reconcile::CycleReport> Engine::runCycleNow() {
    std::optional<reconcile::CycleReport> report;
    const bool ran = m_polling->tryRunCycle([this, &report]() {
        report = runCycle();
        return report->activeAfter;
    });

    if (!ran) {
        return std::nullopt;
    }
    return report;
}

std::optional<reconcile::CycleReport> Engine::lastReport() const {
    std::lock_guard<std::mutex> lock(m_reportMutex);
    return m_lastReport;
}

QueueSnapshot Engine::snapshot() const {
    QueueSnapshot snap;

    for (const auto& item : m_store.snapshotActive()) {
        snap.active.push_back(item->view());
    }
    for (const auto& item : m_store.snapshotFinished()) {
        snap.finished.push_back(item->view());
    }
    return snap;
}

DownloadItemPtr Engine::findDownload(const std::string& id) const {
    return m_store.findById(id);
}

SubscriptionPtr Engine::subscribe(const std::string& event, EventCallback callback) {
    return m_bus.subscribe(event, std::move(callback));
}

void Engine::unsubscribe(const SubscriptionPtr& subscription) {
    m_bus.unsubscribe(subscription);
}

reconcile::CycleReport Engine::runCycle() {
    auto report = m_cycle->run();

    std::lock_guard<std::mutex> lock(m_reportMutex);
    m_lastReport = report;
    return report;
}

} // namespace soulsync::core
