/**
 * CleanupAgent.cpp
 */

#include "CleanupAgent.hpp"
#include "../Logger.hpp"
#include "../reconcile/StatusMapper.hpp"

namespace soulsync::core::cleanup {

using Clock = std::chrono::steady_clock;
using queue::DownloadStatus;

CleanupAgent::CleanupAgent(transfer::TransferService& service, CleanupSettings settings)
    : m_service(service)
    , m_settings(std::move(settings))
    , m_pool(std::make_unique<ThreadPool>(m_settings.workers == 0 ? 1 : m_settings.workers, "cleanup")) {

    m_sweeper = std::thread([this]() { sweeperLoop(); });
}

CleanupAgent::~CleanupAgent() {
    shutdown();
}

bool CleanupAgent::schedule(const queue::DownloadItem& item, bool remove) {
    auto remoteId = item.remoteTransferId();
    if (!remoteId) {
        Logger::instance().debug("No remote id for {}; nothing to clean up", item.id());
        return false;
    }
    return schedule(*remoteId, item.username(), remove);
}

bool CleanupAgent::schedule(const std::string& remoteId, const std::string& username, bool remove) {
    if (remoteId.empty()) return false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) return false;
    }

    try {
        m_pool->post([this, remoteId, username, remove]() {
            runCleanup(remoteId, username, remove);
        });
    } catch (const std::runtime_error& e) {
        Logger::instance().warn("Cleanup for transfer {} not scheduled: {}", remoteId, e.what());
        return false;
    }

    ++m_scheduled;
    armSweep();
    return true;
}

bool CleanupAgent::scheduleClearCompleted() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) return false;
    }

    try {
        m_pool->post([this]() {
            if (m_service.clearCompleted()) {
                Logger::instance().info("Daemon cleared its finished transfers");
            } else {
                Logger::instance().warn("Daemon rejected clearing finished transfers");
            }
        });
    } catch (const std::runtime_error& e) {
        Logger::instance().warn("Clear of finished transfers not scheduled: {}", e.what());
        return false;
    }
    return true;
}

void CleanupAgent::armSweep() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping || m_sweepArmed) return;
        m_sweepArmed = true;
        m_sweepDue = Clock::now() + m_settings.sweepDelay;
    }
    m_cv.notify_all();
}

bool CleanupAgent::sweepArmed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sweepArmed;
}

size_t CleanupAgent::sweepNow() {
    ++m_sweeps;

    auto records = m_service.listTransfers();
    if (!records) {
        Logger::instance().warn("Cleanup sweep skipped: transfer list unavailable");
        return 0;
    }

    size_t candidates = 0;
    size_t removed = 0;

    for (const auto& record : *records) {
        const auto status = reconcile::StatusMapper::map(record.state);
        if (status != DownloadStatus::Failed && status != DownloadStatus::Cancelled) {
            continue;
        }
        if (record.id.empty()) continue;

        ++candidates;
        if (candidates > m_settings.sweepBatch) {
            continue;
        }

        if (m_service.cancelTransfer(record.id, record.username, true)) {
            ++removed;
        } else {
            Logger::instance().debug("Sweep could not remove transfer {} ({})", record.id, record.state);
        }
    }

    m_sweptRecords += removed;

    if (candidates > 0) {
        Logger::instance().info("Cleanup sweep removed {} of {} stale transfers", removed, candidates);
    }

    // Stragglers beyond the batch get the next sweep
    if (candidates > m_settings.sweepBatch) {
        armSweep();
    }

    return removed;
}

void CleanupAgent::waitIdle() {
    m_pool->waitAll();
}

void CleanupAgent::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping && !m_sweeper.joinable()) return;
        m_stopping = true;
        m_sweepArmed = false;
    }
    m_cv.notify_all();

    m_pool->shutdown();

    if (m_sweeper.joinable()) {
        m_sweeper.join();
    }
}

CleanupStats CleanupAgent::stats() const {
    CleanupStats s;
    s.scheduled = m_scheduled.load();
    s.attempts = m_attempts.load();
    s.succeeded = m_succeeded.load();
    s.abandoned = m_abandoned.load();
    s.sweeps = m_sweeps.load();
    s.sweptRecords = m_sweptRecords.load();
    return s;
}

void CleanupAgent::runCleanup(const std::string& remoteId, const std::string& username, bool remove) {
    const size_t maxAttempts = m_settings.retryDelays.size() + 1;

    for (size_t attempt = 0; attempt < maxAttempts; ++attempt) {
        if (attempt > 0 && !waitFor(m_settings.retryDelays[attempt - 1])) {
            break;
        }

        ++m_attempts;
        if (m_service.cancelTransfer(remoteId, username, remove)) {
            ++m_succeeded;
            Logger::instance().debug("Remote cleanup of {} accepted (attempt {})", remoteId, attempt + 1);
            return;
        }

        Logger::instance().debug("Remote cleanup of {} rejected (attempt {}/{})",
            remoteId, attempt + 1, maxAttempts);
    }

    ++m_abandoned;
    Logger::instance().warn("Giving up remote cleanup of transfer {} for {}", remoteId, username);
}

void CleanupAgent::sweeperLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (!m_stopping) {
        if (!m_sweepArmed) {
            m_cv.wait(lock, [this] { return m_stopping || m_sweepArmed; });
            continue;
        }

        if (Clock::now() < m_sweepDue) {
            m_cv.wait_until(lock, m_sweepDue);
            continue;
        }

        m_sweepArmed = false;
        lock.unlock();
        try {
            sweepNow();
        } catch (const std::exception& e) {
            Logger::instance().error("Cleanup sweep failed: {}", e.what());
        }
        lock.lock();
    }
}

bool CleanupAgent::waitFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return !m_cv.wait_for(lock, delay, [this] { return m_stopping; });
}

} // namespace soulsync::core::cleanup
