// CleanupAgent tests against the scripted transfer service (run via CTest).
#include "TestSupport.hpp"

#include "core/cleanup/CleanupAgent.hpp"
#include "core/transfer/MockTransferService.hpp"

#include <vector>

using namespace soulsync;
using core::cleanup::CleanupAgent;
using core::cleanup::CleanupSettings;
using core::transfer::MockTransferService;
using core::transfer::TransferRecord;
using test::TestContext;

namespace {

CleanupSettings fastSettings() {
    CleanupSettings s;
    s.retryDelays = {std::chrono::milliseconds(5), std::chrono::milliseconds(10), std::chrono::milliseconds(20)};
    s.sweepDelay = std::chrono::hours(1);
    s.sweepBatch = 5;
    s.workers = 2;
    return s;
}

void test_first_attempt_success(TestContext &t) {
    MockTransferService service;
    service.setRecords({test::makeRecord("r1", "alice", "Song.flac", "Completed, Errored")});
    CleanupAgent agent(service, fastSettings());

    t.check(agent.schedule("r1", "alice", true), "cleanup scheduled");
    agent.waitIdle();

    auto stats = agent.stats();
    t.checkEq(stats.attempts, size_t(1), "one attempt");
    t.checkEq(stats.succeeded, size_t(1), "success counted");
    t.checkEq(service.records().size(), size_t(0), "record removed from the daemon");
}

void test_retries_then_success(TestContext &t) {
    MockTransferService service;
    service.failNextCancels(2);
    CleanupAgent agent(service, fastSettings());

    agent.schedule("r1", "alice", true);
    agent.waitIdle();

    t.checkEq(service.cancelCallsFor("r1"), size_t(3), "two rejections then success");
    t.checkEq(agent.stats().succeeded, size_t(1), "eventually succeeded");
    t.checkEq(agent.stats().abandoned, size_t(0), "not abandoned");
}

void test_gives_up_after_three_retries(TestContext &t) {
    MockTransferService service;
    service.setCancelAlwaysFails(true);
    CleanupAgent agent(service, fastSettings());

    agent.schedule("r1", "alice", true);
    agent.waitIdle();

    t.checkEq(service.cancelCallsFor("r1"), size_t(4), "one attempt plus three retries");
    t.checkEq(agent.stats().abandoned, size_t(1), "cleanup abandoned");
}

void test_schedule_requires_remote_id(TestContext &t) {
    MockTransferService service;
    CleanupAgent agent(service, fastSettings());

    auto item = test::makeItem("alice", "Song.flac");
    t.check(!agent.schedule(*item, true), "item without remote id is not scheduled");
    t.check(!agent.schedule("", "alice", true), "empty id is not scheduled");
    t.check(!agent.sweepArmed(), "nothing scheduled, no sweep armed");

    item->setRemoteTransferId("r3");
    t.check(agent.schedule(*item, false), "item with remote id is scheduled");
    agent.waitIdle();

    auto calls = service.cancelCalls();
    t.checkEq(calls.size(), size_t(1), "one cancel call");
    if (!calls.empty()) {
        t.check(!calls[0].remove, "remove flag forwarded");
        t.checkEq(calls[0].username, std::string("alice"), "username forwarded");
    }
    t.check(agent.sweepArmed(), "scheduling arms the fallback sweep");
}

void test_sweep_is_bounded(TestContext &t) {
    MockTransferService service;
    std::vector<TransferRecord> records;
    for (int i = 0; i < 8; ++i) {
        records.push_back(test::makeRecord("e" + std::to_string(i), "alice", "f" + std::to_string(i), "Completed, Errored"));
    }
    records.push_back(test::makeRecord("c1", "bob", "x", "Completed, Cancelled"));
    records.push_back(test::makeRecord("ok", "bob", "y", "Completed, Succeeded"));
    records.push_back(test::makeRecord("live", "bob", "z", "InProgress"));
    service.setRecords(records);

    CleanupAgent agent(service, fastSettings());

    t.checkEq(agent.sweepNow(), size_t(5), "one sweep removes at most five records");
    t.checkEq(service.records().size(), size_t(6), "four stragglers and two healthy records remain");
    t.check(agent.sweepArmed(), "stragglers arm another sweep");

    t.checkEq(agent.sweepNow(), size_t(4), "next sweep takes the rest");
    t.checkEq(service.cancelCallsFor("ok"), size_t(0), "succeeded transfers are never swept");
    t.checkEq(service.cancelCallsFor("live"), size_t(0), "live transfers are never swept");
    t.checkEq(service.records().size(), size_t(2), "only healthy records remain");
}

void test_sweep_skips_failed_poll(TestContext &t) {
    MockTransferService service;
    service.failNextPolls(1);
    CleanupAgent agent(service, fastSettings());
    t.checkEq(agent.sweepNow(), size_t(0), "sweep does nothing when the list is unavailable");
    t.checkEq(service.cancelCalls().size(), size_t(0), "no cancel calls");
}

void test_delayed_sweep_fires(TestContext &t) {
    MockTransferService service;
    service.setRecords({test::makeRecord("e1", "alice", "f", "Errored")});

    auto settings = fastSettings();
    settings.sweepDelay = std::chrono::milliseconds(30);
    CleanupAgent agent(service, settings);

    agent.armSweep();
    bool swept = test::waitUntil([&]() { return agent.stats().sweeps >= 1; });
    t.check(swept, "armed sweep runs after its delay");
    t.check(test::waitUntil([&]() { return service.records().empty(); }), "sweep removed the stale record");
    t.check(!agent.sweepArmed(), "sweep does not re-arm without stragglers");
}

void test_shutdown_interrupts_retries(TestContext &t) {
    MockTransferService service;
    service.setCancelAlwaysFails(true);

    auto settings = fastSettings();
    settings.retryDelays = {std::chrono::hours(1), std::chrono::hours(1), std::chrono::hours(1)};
    CleanupAgent agent(service, settings);

    agent.schedule("r1", "alice", true);
    test::waitUntil([&]() { return service.cancelCallsFor("r1") >= 1; });

    const auto start = std::chrono::steady_clock::now();
    agent.shutdown();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    t.check(elapsed < std::chrono::seconds(5), "shutdown does not wait out retry delays");
    t.checkEq(service.cancelCallsFor("r1"), size_t(1), "no retries after shutdown");
    t.check(!agent.schedule("r2", "alice", true), "scheduling after shutdown is refused");
}

void test_clear_completed_runs_in_background(TestContext &t) {
    MockTransferService service;
    service.setRecords({
        test::makeRecord("a", "alice", "a", "Completed, Succeeded"),
        test::makeRecord("b", "alice", "b", "InProgress"),
    });
    CleanupAgent agent(service, fastSettings());

    t.check(agent.scheduleClearCompleted(), "clear scheduled");
    agent.waitIdle();
    t.checkEq(service.clearCalls(), size_t(1), "daemon asked once");
    t.checkEq(service.records().size(), size_t(1), "only the live record remains");
}

} // namespace

int main() {
    test::quietLogging();

    TestContext t;
    test_first_attempt_success(t);
    test_retries_then_success(t);
    test_gives_up_after_three_retries(t);
    test_schedule_requires_remote_id(t);
    test_sweep_is_bounded(t);
    test_sweep_skips_failed_poll(t);
    test_delayed_sweep_fires(t);
    test_shutdown_interrupts_retries(t);
    test_clear_completed_runs_in_background(t);

    return t.finish("cleanup_agent_tests");
}
