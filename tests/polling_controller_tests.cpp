// PollingController tests (run via CTest).
#include "TestSupport.hpp"

#include "core/reconcile/PollingController.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace soulsync;
using core::reconcile::PollingController;
using core::reconcile::PollingMode;
using core::reconcile::PollingSettings;
using test::TestContext;

namespace {

PollingSettings fastSettings() {
    PollingSettings s;
    s.activeInterval = std::chrono::milliseconds(20);
    s.idleInterval = std::chrono::milliseconds(200);
    s.bulkInterval = std::chrono::milliseconds(400);
    return s;
}

void test_select_mode(TestContext &t) {
    t.check(PollingController::selectMode(0, false) == PollingMode::Idle, "empty queue is idle");
    t.check(PollingController::selectMode(3, false) == PollingMode::Active, "active items poll fast");
    t.check(PollingController::selectMode(3, true) == PollingMode::BulkPause, "bulk flag wins");
    t.check(PollingController::selectMode(0, true) == PollingMode::BulkPause, "bulk flag wins when empty");
}

void test_intervals_follow_mode(TestContext &t) {
    PollingController polling([]() { return size_t(0); }, fastSettings());
    t.check(polling.mode() == PollingMode::Idle, "controller starts idle");
    t.check(polling.interval() == std::chrono::milliseconds(200), "idle interval");

    polling.recompute(2);
    t.check(polling.mode() == PollingMode::Active, "recompute with items switches to active");
    t.check(polling.interval() == std::chrono::milliseconds(20), "active interval");

    polling.setBulkOperation(true);
    t.check(polling.mode() == PollingMode::BulkPause, "bulk flag switches immediately");
    t.check(polling.interval() == std::chrono::milliseconds(400), "bulk interval");

    polling.setBulkOperation(false);
    t.check(polling.mode() == PollingMode::Active, "clearing bulk restores the load-based mode");
}

void test_cycle_result_drives_mode(TestContext &t) {
    std::atomic<size_t> active{4};
    PollingController polling([&]() { return active.load(); }, fastSettings());

    polling.tryRunCycle();
    t.check(polling.mode() == PollingMode::Active, "post-cycle count 4 -> active");

    active = 0;
    polling.tryRunCycle();
    t.check(polling.mode() == PollingMode::Idle, "post-cycle count 0 -> idle");
    t.checkEq(polling.cyclesRun(), size_t(2), "two cycles ran");
}

void test_timer_runs_cycles(TestContext &t) {
    std::atomic<int> cycles{0};
    PollingController polling([&]() { ++cycles; return size_t(1); }, fastSettings());
    polling.recompute(1);
    polling.start();
    t.check(polling.isRunning(), "controller reports running");

    bool ticked = test::waitUntil([&]() { return cycles.load() >= 3; });
    polling.stop();
    t.check(ticked, "active mode should tick repeatedly");
    t.check(!polling.isRunning(), "controller stopped");

    const int afterStop = cycles.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    t.checkEq(cycles.load(), afterStop, "no cycles after stop");
}

void test_mode_change_reprograms_timer(TestContext &t) {
    PollingSettings s;
    s.activeInterval = std::chrono::milliseconds(20);
    s.idleInterval = std::chrono::hours(1);
    s.bulkInterval = std::chrono::hours(1);

    std::atomic<int> cycles{0};
    PollingController polling([&]() { ++cycles; return size_t(1); }, s);
    polling.start();

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    t.checkEq(cycles.load(), 0, "idle interval of an hour has not elapsed");

    // Leaving idle must not wait out the hour-long idle deadline
    polling.recompute(1);
    bool ticked = test::waitUntil([&]() { return cycles.load() >= 1; }, std::chrono::milliseconds(2000));
    polling.stop();
    t.check(ticked, "switching to active reprograms the pending deadline");
}

void test_trigger_now(TestContext &t) {
    PollingSettings s;
    s.activeInterval = std::chrono::hours(1);
    s.idleInterval = std::chrono::hours(1);
    s.bulkInterval = std::chrono::hours(1);

    std::atomic<int> cycles{0};
    PollingController polling([&]() { ++cycles; return size_t(0); }, s);
    polling.start();
    polling.triggerNow();
    bool ran = test::waitUntil([&]() { return cycles.load() == 1; });
    polling.stop();
    t.check(ran, "triggerNow runs a cycle without waiting for the interval");
}

void test_overlapping_cycles_are_skipped(TestContext &t) {
    std::mutex m;
    std::condition_variable cv;
    bool entered = false;
    bool release = false;

    PollingController polling([&]() {
        std::unique_lock<std::mutex> lock(m);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [&] { return release; });
        return size_t(1);
    }, fastSettings());

    std::thread slow([&]() { polling.tryRunCycle(); });
    {
        std::unique_lock<std::mutex> lock(m);
        cv.wait(lock, [&] { return entered; });
    }

    t.check(!polling.tryRunCycle(), "a cycle requested while one runs is skipped");
    t.checkEq(polling.cyclesSkipped(), size_t(1), "skip is counted");

    {
        std::lock_guard<std::mutex> lock(m);
        release = true;
    }
    cv.notify_all();
    slow.join();

    t.checkEq(polling.cyclesRun(), size_t(1), "only the first cycle ran");
}

void test_cycle_exception_is_contained(TestContext &t) {
    PollingController polling([]() -> size_t { throw std::runtime_error("daemon exploded"); },
                              fastSettings());
    t.check(polling.tryRunCycle(), "a throwing cycle still counts as run");
    t.check(polling.tryRunCycle(), "the running flag is released after a throw");
}

void test_guarded_custom_cycle(TestContext &t) {
    std::atomic<int> configured{0};
    PollingController polling([&]() {
        ++configured;
        return size_t(0);
    }, fastSettings());

    int custom = 0;
    t.check(polling.tryRunCycle([&]() {
        ++custom;
        return size_t(2);
    }), "a custom cycle runs when nothing is in flight");
    t.checkEq(custom, 1, "the custom function ran");
    t.checkEq(configured.load(), 0, "the configured function did not");
    t.check(polling.mode() == PollingMode::Active, "custom cycle result drives the mode");
    t.checkEq(polling.cyclesRun(), size_t(1), "custom cycle counts as run");

    bool nestedRan = true;
    polling.tryRunCycle([&]() {
        nestedRan = polling.tryRunCycle([]() { return size_t(0); });
        return size_t(0);
    });
    t.check(!nestedRan, "a custom cycle is skipped while another is in flight");
}

} // namespace

int main() {
    test::quietLogging();

    TestContext t;
    test_select_mode(t);
    test_intervals_follow_mode(t);
    test_cycle_result_drives_mode(t);
    test_timer_runs_cycles(t);
    test_mode_change_reprograms_timer(t);
    test_trigger_now(t);
    test_overlapping_cycles_are_skipped(t);
    test_cycle_exception_is_contained(t);
    test_guarded_custom_cycle(t);

    return t.finish("polling_controller_tests");
}
