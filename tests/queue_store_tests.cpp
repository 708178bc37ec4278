// QueueStore unit tests (run via CTest).
#include "TestSupport.hpp"

#include "core/queue/QueueStore.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace soulsync;
using core::queue::DownloadItemPtr;
using core::queue::DownloadStatus;
using core::queue::QueueStore;
using test::TestContext;

namespace {

void test_add_and_remove(TestContext &t) {
    QueueStore store;
    auto item = test::makeItem("alice", "Song.flac");

    t.check(store.addActive(item), "first add should succeed");
    t.check(!store.addActive(item), "adding the same item twice should be refused");
    t.check(!store.addActive(nullptr), "adding null should be refused");
    t.checkEq(store.activeCount(), size_t(1), "one active item");

    t.check(store.removeActive(item), "remove of a present item returns true");
    t.check(!store.removeActive(item), "remove of an absent item returns false");
    t.check(!store.removeFinished(item), "remove from finished returns false when absent");
    t.checkEq(store.activeCount(), size_t(0), "store should be empty");
}

void test_move_to_finished(TestContext &t) {
    QueueStore store;
    auto item = test::makeItem("alice", "Song.flac");
    store.addActive(item);

    t.check(store.moveToFinished(item), "move should succeed for an active item");
    t.check(!store.isActive(item), "item should no longer be active");
    t.check(store.isFinished(item), "item should be finished");
    t.check(!store.moveToFinished(item), "second move should return false");
    t.checkEq(store.finishedCount(), size_t(1), "finished count should be 1");
    t.check(store.findById(item->id()) == item, "findById should search finished items");
    t.check(store.findById("nope") == nullptr, "unknown id returns null");
}

void test_snapshot_is_independent(TestContext &t) {
    QueueStore store;
    auto a = test::makeItem("alice", "a.flac");
    auto b = test::makeItem("bob", "b.flac");
    store.addActive(a);
    store.addActive(b);

    auto snapshot = store.snapshotActive();
    store.removeActive(a);

    t.checkEq(snapshot.size(), size_t(2), "snapshot should not change when the store does");
    t.checkEq(store.activeCount(), size_t(1), "store should reflect the removal");
    t.check(snapshot[0] == a && snapshot[1] == b, "snapshot keeps insertion order");
}

void test_transition_fires_once_on_change(TestContext &t) {
    QueueStore store;
    auto item = test::makeItem("alice", "Song.flac");
    store.addActive(item);

    int calls = 0;
    DownloadStatus seenOld = DownloadStatus::Queued;
    DownloadStatus seenNew = DownloadStatus::Queued;
    auto callback = [&](const DownloadItemPtr &, DownloadStatus oldStatus, DownloadStatus newStatus) {
        ++calls;
        seenOld = oldStatus;
        seenNew = newStatus;
    };

    t.check(!store.atomicTransition(item, DownloadStatus::Downloading, callback),
            "same-status transition is a no-op");
    t.checkEq(calls, 0, "no callback for a no-op");

    t.check(store.atomicTransition(item, DownloadStatus::Completed, callback), "downloading -> completed");
    t.checkEq(calls, 1, "callback fires on a real change");
    t.checkEq(seenOld, DownloadStatus::Downloading, "callback sees the old status");
    t.checkEq(seenNew, DownloadStatus::Completed, "callback sees the new status");
    t.checkEq(item->progress(), 100, "completed forces progress to 100");
}

void test_terminal_never_reverts(TestContext &t) {
    QueueStore store;
    auto item = test::makeItem("alice", "Song.flac");
    store.addActive(item);

    t.check(store.atomicTransition(item, DownloadStatus::Failed), "downloading -> failed");
    const DownloadStatus targets[] = {DownloadStatus::Queued, DownloadStatus::Downloading,
                                      DownloadStatus::Completed, DownloadStatus::Cancelled};
    for (auto target : targets) {
        t.check(!store.atomicTransition(item, target),
                std::string("failed must not move to ") + core::queue::toString(target));
    }
    t.checkEq(item->status(), DownloadStatus::Failed, "status stays failed");
}

void test_illegal_backward_edge_rejected(TestContext &t) {
    QueueStore store;
    auto item = test::makeItem("alice", "Song.flac");
    t.check(!store.atomicTransition(item, DownloadStatus::Queued), "downloading -> queued is rejected");
    t.checkEq(item->status(), DownloadStatus::Downloading, "status unchanged");
    t.check(!store.atomicTransition(nullptr, DownloadStatus::Failed), "null item is rejected");
}

void test_concurrent_transition_fires_once(TestContext &t) {
    constexpr int kRounds = 50;
    constexpr int kThreads = 8;

    for (int round = 0; round < kRounds; ++round) {
        QueueStore store;
        auto item = test::makeItem("alice", "Song.flac");
        store.addActive(item);

        std::atomic<int> callbacks{0};
        std::atomic<int> winners{0};
        std::atomic<bool> go{false};
        std::vector<std::thread> threads;

        for (int i = 0; i < kThreads; ++i) {
            threads.emplace_back([&]() {
                while (!go.load()) std::this_thread::yield();
                bool changed = store.atomicTransition(item, DownloadStatus::Cancelled,
                    [&](const DownloadItemPtr &, DownloadStatus, DownloadStatus) { ++callbacks; });
                if (changed) ++winners;
            });
        }
        go = true;
        for (auto &th : threads) th.join();

        if (callbacks.load() != 1 || winners.load() != 1) {
            t.check(false, "round " + std::to_string(round) + ": callback should fire exactly once");
            return;
        }
    }
}

void test_cancel_races_completion(TestContext &t) {
    QueueStore store;
    auto item = test::makeItem("alice", "Song.flac");
    store.addActive(item);

    std::atomic<int> callbacks{0};
    auto count = [&](const DownloadItemPtr &, DownloadStatus, DownloadStatus) { ++callbacks; };

    std::thread user([&]() { store.atomicTransition(item, DownloadStatus::Cancelled, count); });
    std::thread cycle([&]() { store.atomicTransition(item, DownloadStatus::Completed, count); });
    user.join();
    cycle.join();

    auto status = item->status();
    t.check(status == DownloadStatus::Cancelled || status == DownloadStatus::Completed,
            "one of the racing transitions should win");
    t.checkEq(callbacks.load(), 1, "only the winner's callback should fire");
}

void test_callback_exception_is_contained(TestContext &t) {
    QueueStore store;
    auto item = test::makeItem("alice", "Song.flac");

    bool changed = store.atomicTransition(item, DownloadStatus::Failed,
        [](const DownloadItemPtr &, DownloadStatus, DownloadStatus) {
            throw std::runtime_error("subscriber bug");
        });
    t.check(changed, "transition should still report the change");
    t.checkEq(item->status(), DownloadStatus::Failed, "status was written");
}

void test_size_callback_and_clear(TestContext &t) {
    QueueStore store;
    size_t lastActive = 99;
    size_t lastFinished = 99;
    int notifications = 0;
    store.setSizeChangedCallback([&](size_t active, size_t finished) {
        ++notifications;
        lastActive = active;
        lastFinished = finished;
    });

    auto a = test::makeItem("alice", "a.flac");
    auto b = test::makeItem("bob", "b.flac");
    store.addActive(a);
    store.addActive(b);
    store.moveToFinished(a);
    t.checkEq(lastActive, size_t(1), "size callback reports active count");
    t.checkEq(lastFinished, size_t(1), "size callback reports finished count");

    auto removed = store.clearFinished();
    t.checkEq(removed.size(), size_t(1), "clearFinished returns the evicted items");
    t.checkEq(lastFinished, size_t(0), "finished collection is empty");
    t.checkEq(notifications, 4, "every size change notifies once");

    store.clearFinished();
    t.checkEq(notifications, 4, "clearing an empty collection does not notify");
}

void test_notification_batch(TestContext &t) {
    QueueStore store;
    auto a = test::makeItem("alice", "A.flac");
    auto b = test::makeItem("alice", "B.flac");

    int events = 0;
    size_t lastActive = 0;
    size_t lastFinished = 0;
    store.setSizeChangedCallback([&](size_t active, size_t finished) {
        ++events;
        lastActive = active;
        lastFinished = finished;
    });

    store.addActive(a);
    store.addActive(b);
    t.checkEq(events, 2, "adds outside a batch notify individually");

    {
        QueueStore::NotificationBatch outer(store);
        store.moveToFinished(a);
        {
            QueueStore::NotificationBatch inner(store);
            store.moveToFinished(b);
        }
        t.checkEq(events, 2, "nothing fires while a batch is open");
    }
    t.checkEq(events, 3, "closing the outermost batch fires once");
    t.checkEq(lastActive, size_t(0), "batched notification has the final active count");
    t.checkEq(lastFinished, size_t(2), "batched notification has the final finished count");

    {
        QueueStore::NotificationBatch quiet(store);
    }
    t.checkEq(events, 3, "a batch without size changes stays silent");

    store.setSizeChangedCallback(nullptr);
}

} // namespace

int main() {
    test::quietLogging();

    TestContext t;
    test_add_and_remove(t);
    test_move_to_finished(t);
    test_snapshot_is_independent(t);
    test_transition_fires_once_on_change(t);
    test_terminal_never_reverts(t);
    test_illegal_backward_edge_rejected(t);
    test_concurrent_transition_fires_once(t);
    test_cancel_races_completion(t);
    test_callback_exception_is_contained(t);
    test_size_callback_and_clear(t);
    test_notification_batch(t);

    return t.finish("queue_store_tests");
}
