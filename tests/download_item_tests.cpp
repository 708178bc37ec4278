// DownloadItem unit tests (run via CTest).
#include "TestSupport.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace soulsync;
using core::queue::DownloadItem;
using core::queue::DownloadRequest;
using core::queue::DownloadStatus;
using test::TestContext;

namespace {

void test_new_item_defaults(TestContext &t) {
    DownloadRequest request;
    request.title = "Song";
    request.artist = "Artist";
    request.username = "alice";
    request.filePath = "Music\\Artist\\Song.flac";

    DownloadItem item(request);
    t.checkEq(item.status(), DownloadStatus::Downloading, "new item should be downloading");
    t.checkEq(item.progress(), 0, "new item should start at 0%");
    t.check(!item.id().empty(), "new item should get an id");
    t.check(!item.remoteTransferId().has_value(), "new item should have no remote id");
    t.check(!item.queueEnteredAt().has_value(), "new item should have no queue timestamp");
    t.checkEq(item.apiMissingCount(), 0, "new item should have no missing cycles");
    t.check(!item.completionProcessed(), "completion should not be processed yet");
}

void test_ids_are_unique(TestContext &t) {
    auto a = test::makeItem("alice", "a.flac");
    auto b = test::makeItem("alice", "a.flac");
    t.check(a->id() != b->id(), "two items should never share an id");
}

void test_invalid_requests_throw(TestContext &t) {
    DownloadRequest noUser;
    noUser.filePath = "x.flac";
    bool threw = false;
    try {
        DownloadItem item(noUser);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    t.check(threw, "request without username should throw invalid_argument");

    DownloadRequest noTarget;
    noTarget.username = "bob";
    threw = false;
    try {
        DownloadItem item(noTarget);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    t.check(threw, "request without path and title should throw invalid_argument");
}

void test_empty_remote_id_is_ignored(TestContext &t) {
    DownloadRequest request;
    request.username = "alice";
    request.filePath = "Song.flac";
    request.remoteTransferId = "";
    DownloadItem item(request);
    t.check(!item.remoteTransferId().has_value(), "empty remote id should be treated as unset");

    item.setRemoteTransferId("r7");
    t.check(item.remoteTransferId() == std::optional<std::string>("r7"), "remote id should be stored");
    item.setRemoteTransferId("");
    t.check(!item.remoteTransferId().has_value(), "clearing with empty string should unset the id");
}

void test_progress_is_monotonic_and_clamped(TestContext &t) {
    auto item = test::makeItem("alice", "Song.flac");

    t.check(item->updateProgress(40), "progress 0 -> 40 should change the value");
    t.check(!item->updateProgress(30), "progress must not go backwards");
    t.checkEq(item->progress(), 40, "progress should stay at 40");
    t.check(item->updateProgress(250), "progress above 100 should clamp");
    t.checkEq(item->progress(), 100, "progress should clamp to 100");
    t.check(!item->updateProgress(-5), "negative progress should be ignored");
}

void test_speed_never_negative(TestContext &t) {
    auto item = test::makeItem("alice", "Song.flac");
    item->setSpeed(-12.0);
    t.check(item->speed() == 0.0, "negative speed should clamp to zero");
    item->setSpeed(1024.0);
    t.check(item->speed() == 1024.0, "speed should be stored");
}

void test_missing_counter(TestContext &t) {
    auto item = test::makeItem("alice", "Song.flac");
    t.checkEq(item->incrementMissingCount(), 1, "first increment returns 1");
    t.checkEq(item->incrementMissingCount(), 2, "second increment returns 2");
    item->resetMissingCount();
    t.checkEq(item->apiMissingCount(), 0, "reset should zero the counter");
}

void test_concurrent_mark_completion_processed(TestContext &t) {
    auto item = test::makeItem("alice", "Song.flac");
    constexpr int kThreads = 16;

    std::atomic<int> winners{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) std::this_thread::yield();
            if (item->markCompletionProcessed()) ++winners;
        });
    }
    go = true;
    for (auto &th : threads) th.join();

    t.checkEq(winners.load(), 1, "exactly one caller should claim completion");
    t.check(item->completionProcessed(), "completion flag should be set");
    t.check(!item->markCompletionProcessed(), "later callers should still be refused");
}

void test_retry_request_drops_remote_state(TestContext &t) {
    DownloadRequest request;
    request.title = "Song";
    request.artist = "Artist";
    request.album = "Album";
    request.trackNumber = 3;
    request.username = "alice";
    request.filePath = "Music/Song.flac";
    request.runPostProcessing = true;
    request.remoteTransferId = "r1";
    DownloadItem item(request);
    item.setFilePath("Music/Artist/Song.flac");

    auto retry = item.toRetryRequest();
    t.checkEq(retry.username, std::string("alice"), "retry keeps the username");
    t.checkEq(retry.filePath, std::string("Music/Artist/Song.flac"), "retry uses the latest path");
    t.check(retry.album == std::optional<std::string>("Album"), "retry keeps the album");
    t.check(retry.trackNumber == std::optional<int>(3), "retry keeps the track number");
    t.check(retry.runPostProcessing, "retry keeps the post-processing flag");
    t.check(!retry.remoteTransferId.has_value(), "retry must not reuse the stale remote id");
}

void test_transition_graph(TestContext &t) {
    using core::queue::isLegalTransition;
    t.check(isLegalTransition(DownloadStatus::Queued, DownloadStatus::Downloading), "queued -> downloading");
    t.check(isLegalTransition(DownloadStatus::Queued, DownloadStatus::Failed), "queued -> failed");
    t.check(isLegalTransition(DownloadStatus::Queued, DownloadStatus::Cancelled), "queued -> cancelled");
    t.check(!isLegalTransition(DownloadStatus::Queued, DownloadStatus::Completed), "queued -> completed is illegal");
    t.check(isLegalTransition(DownloadStatus::Downloading, DownloadStatus::Completed), "downloading -> completed");
    t.check(!isLegalTransition(DownloadStatus::Downloading, DownloadStatus::Queued), "downloading -> queued is illegal");

    const DownloadStatus terminal[] = {DownloadStatus::Completed, DownloadStatus::Failed, DownloadStatus::Cancelled};
    const DownloadStatus all[] = {DownloadStatus::Queued, DownloadStatus::Downloading, DownloadStatus::Completed,
                                  DownloadStatus::Failed, DownloadStatus::Cancelled};
    for (auto from : terminal) {
        t.check(core::queue::isTerminal(from), std::string(core::queue::toString(from)) + " should be terminal");
        for (auto to : all) {
            t.check(!isLegalTransition(from, to),
                    std::string("no edge out of ") + core::queue::toString(from));
        }
    }
}

void test_view_copies_state(TestContext &t) {
    auto item = test::makeItem("alice", "Song.flac", "Song");
    item->updateProgress(55);
    item->setErrorMessage("boom");

    auto v = item->view();
    t.checkEq(v.id, item->id(), "view id");
    t.checkEq(v.progress, 55, "view progress");
    t.checkEq(v.errorMessage, std::string("boom"), "view error message");
    t.checkEq(v.status, DownloadStatus::Downloading, "view status");
}

} // namespace

int main() {
    test::quietLogging();

    TestContext t;
    test_new_item_defaults(t);
    test_ids_are_unique(t);
    test_invalid_requests_throw(t);
    test_empty_remote_id_is_ignored(t);
    test_progress_is_monotonic_and_clamped(t);
    test_speed_never_negative(t);
    test_missing_counter(t);
    test_concurrent_mark_completion_processed(t);
    test_retry_request_drops_remote_state(t);
    test_transition_graph(t);
    test_view_copies_state(t);

    return t.finish("download_item_tests");
}
