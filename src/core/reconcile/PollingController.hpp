#pragma once

/**
 * PollingController.hpp
 *
 * Timer that drives reconciliation cycles at a load-dependent interval.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace soulsync::core::reconcile {

enum class PollingMode {
    Active,
    Idle,
    BulkPause
};

const char* toString(PollingMode mode);

struct PollingSettings {
    std::chrono::milliseconds activeInterval{2000};
    std::chrono::milliseconds idleInterval{10000};
    std::chrono::milliseconds bulkInterval{15000};
};

/**
 * PollingController - single timer thread, non-overlapping cycles
 *
 * The cycle function returns the active item count after it ran; the mode
 * is recomputed from it. A mode change reprograms the pending deadline
 * right away. Cycles requested while one is running are skipped.
 */
class PollingController {
public:
    using CycleFunction = std::function<size_t()>;
    using Clock = std::chrono::steady_clock;

    PollingController(CycleFunction cycle, PollingSettings settings = {});
    ~PollingController();

    PollingController(const PollingController&) = delete;
    PollingController& operator=(const PollingController&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    /**
     * Run a cycle on the calling thread unless one is already running
     * @return false if the cycle was skipped
     */
    bool tryRunCycle();

    /**
     * Same guard, running the given function instead of the configured one
     */
    bool tryRunCycle(const CycleFunction& cycle);

    /**
     * Wake the timer thread to run a cycle now
     */
    void triggerNow();

    /**
     * Re-evaluate the mode for a new active count (e.g. after an add)
     */
    void recompute(size_t activeCount);

    /**
     * Flag or unflag a bulk operation; takes effect immediately
     */
    void setBulkOperation(bool inProgress);
    bool bulkOperation() const;

    static PollingMode selectMode(size_t activeCount, bool bulkOperation);

    PollingMode mode() const;
    std::chrono::milliseconds interval() const;
    std::chrono::milliseconds intervalFor(PollingMode mode) const;

    size_t cyclesRun() const { return m_cyclesRun.load(); }
    size_t cyclesSkipped() const { return m_cyclesSkipped.load(); }

private:
    void timerLoop();

    // Requires m_mutex
    void applyModeLocked(PollingMode mode);

private:
    CycleFunction m_cycle;
    const PollingSettings m_settings;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    bool m_running{false};
    bool m_stopRequested{false};
    bool m_triggered{false};
    bool m_bulk{false};
    size_t m_lastActiveCount{0};
    PollingMode m_mode{PollingMode::Idle};
    Clock::time_point m_deadline;

    std::atomic<bool> m_cycleInFlight{false};
    std::atomic<size_t> m_cyclesRun{0};
    std::atomic<size_t> m_cyclesSkipped{0};
};

} // namespace soulsync::core::reconcile
