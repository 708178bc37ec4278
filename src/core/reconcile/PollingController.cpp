/**
 * PollingController.cpp
 */

#include "PollingController.hpp"
#include "../Logger.hpp"

namespace soulsync::core::reconcile {

const char* toString(PollingMode mode) {
    switch (mode) {
        case PollingMode::Active:    return "active";
        case PollingMode::Idle:      return "idle";
        case PollingMode::BulkPause: return "bulk-pause";
    }
    return "unknown";
}

PollingController::PollingController(CycleFunction cycle, PollingSettings settings)
    : m_cycle(std::move(cycle))
    , m_settings(settings) {
}

PollingController::~PollingController() {
    stop();
}

void PollingController::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;

    m_running = true;
    m_stopRequested = false;
    m_deadline = Clock::now() + intervalFor(m_mode);
    m_thread = std::thread([this]() { timerLoop(); });

    Logger::instance().info("Polling started in {} mode ({} ms)",
        toString(m_mode), intervalFor(m_mode).count());
}

void PollingController::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_stopRequested = true;
    }
    m_cv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_running = false;
    Logger::instance().debug("Polling stopped after {} cycles", m_cyclesRun.load());
}

bool PollingController::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

bool PollingController::tryRunCycle() {
    return tryRunCycle(m_cycle);
}

bool PollingController::tryRunCycle(const CycleFunction& cycle) {
    if (m_cycleInFlight.exchange(true)) {
        ++m_cyclesSkipped;
        Logger::instance().debug("Previous cycle still running; tick skipped");
        return false;
    }

    size_t activeAfter = 0;
    bool completed = false;
    try {
        activeAfter = cycle();
        completed = true;
    } catch (const std::exception& e) {
        Logger::instance().error("Reconciliation cycle threw: {}", e.what());
    }

    m_cycleInFlight = false;
    ++m_cyclesRun;

    if (completed) {
        recompute(activeAfter);
    }
    return true;
}

void PollingController::triggerNow() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_triggered = true;
    }
    m_cv.notify_all();
}

void PollingController::recompute(size_t activeCount) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastActiveCount = activeCount;
        applyModeLocked(selectMode(activeCount, m_bulk));
    }
    m_cv.notify_all();
}

void PollingController::setBulkOperation(bool inProgress) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_bulk == inProgress) return;
        m_bulk = inProgress;
        applyModeLocked(selectMode(m_lastActiveCount, m_bulk));
    }
    m_cv.notify_all();
}

bool PollingController::bulkOperation() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bulk;
}

PollingMode PollingController::selectMode(size_t activeCount, bool bulkOperation) {
    if (bulkOperation) return PollingMode::BulkPause;
    return activeCount > 0 ? PollingMode::Active : PollingMode::Idle;
}

PollingMode PollingController::mode() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_mode;
}

std::chrono::milliseconds PollingController::interval() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return intervalFor(m_mode);
}

std::chrono::milliseconds PollingController::intervalFor(PollingMode mode) const {
    switch (mode) {
        case PollingMode::Active:    return m_settings.activeInterval;
        case PollingMode::Idle:      return m_settings.idleInterval;
        case PollingMode::BulkPause: return m_settings.bulkInterval;
    }
    return m_settings.idleInterval;
}

void PollingController::applyModeLocked(PollingMode mode) {
    if (mode == m_mode) return;

    Logger::instance().info("Polling mode {} -> {} ({} ms)",
        toString(m_mode), toString(mode), intervalFor(mode).count());

    m_mode = mode;
    m_deadline = Clock::now() + intervalFor(mode);
}

void PollingController::timerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (!m_stopRequested) {
        if (m_triggered || Clock::now() >= m_deadline) {
            m_triggered = false;

            lock.unlock();
            tryRunCycle();
            lock.lock();

            m_deadline = Clock::now() + intervalFor(m_mode);
            continue;
        }

        m_cv.wait_until(lock, m_deadline);
    }
}

} // namespace soulsync::core::reconcile
