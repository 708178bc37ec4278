// Matcher unit tests (run via CTest).
#include "TestSupport.hpp"

#include "core/reconcile/Matcher.hpp"

#include <unordered_set>
#include <vector>

using namespace soulsync;
using core::reconcile::claimKey;
using core::reconcile::Matcher;
using core::reconcile::MatchKind;
using core::transfer::TransferRecord;
using test::TestContext;

namespace {

void test_remote_id_wins(TestContext &t) {
    Matcher matcher;
    auto item = test::makeItem("alice", "Music\\Song.flac");
    item->setRemoteTransferId("r2");

    std::vector<TransferRecord> records = {
        test::makeRecord("r1", "alice", "Music\\Song.flac", "InProgress"),
        test::makeRecord("r2", "alice", "Other\\Renamed.flac", "InProgress"),
    };

    auto match = matcher.match(*item, records, {});
    t.check(match.has_value(), "item with remote id should match");
    if (match) {
        t.checkEq(match->record->id, std::string("r2"), "id match should beat filename match");
        t.check(match->kind == MatchKind::RemoteId, "match kind should be remote id");
    }
}

void test_filename_fallback_is_case_insensitive(TestContext &t) {
    Matcher matcher;
    auto item = test::makeItem("Alice", "/downloads/Artist/SONG.flac");

    std::vector<TransferRecord> records = {
        test::makeRecord("r1", "bob", "@@share\\Artist\\Song.flac", "InProgress"),
        test::makeRecord("r2", "alice", "@@share\\Artist\\song.FLAC", "InProgress"),
    };

    auto match = matcher.match(*item, records, {});
    t.check(match.has_value(), "filename fallback should match");
    if (match) {
        t.checkEq(match->record->id, std::string("r2"), "username must match too");
        t.check(match->kind == MatchKind::UserAndFilename, "match kind should be user and filename");
    }
}

void test_stale_remote_id_falls_back_to_filename(TestContext &t) {
    Matcher matcher;
    auto item = test::makeItem("alice", "Song.flac");
    item->setRemoteTransferId("gone");

    std::vector<TransferRecord> records = {
        test::makeRecord("r9", "alice", "dir\\Song.flac", "Queued, Remotely"),
    };
    auto match = matcher.match(*item, records, {});
    t.check(match && match->record->id == "r9", "re-issued id should be found by filename");
}

void test_title_tokens_last_resort(TestContext &t) {
    Matcher matcher;
    auto item = test::makeItem("alice", "", "The Long Winding Road");

    std::vector<TransferRecord> records = {
        test::makeRecord("r1", "carol", "x\\Road Trip.mp3", "InProgress"),
        test::makeRecord("r2", "dave", "x\\01 - The Long and Winding Road.mp3", "InProgress"),
    };
    auto match = matcher.match(*item, records, {});
    t.check(match.has_value(), "title tokens should find a record");
    if (match) {
        t.checkEq(match->record->id, std::string("r2"), "every long token must be present");
        t.check(match->kind == MatchKind::TitleTokens, "match kind should be title tokens");
    }
}

void test_short_tokens_do_not_match(TestContext &t) {
    Matcher matcher;
    auto item = test::makeItem("alice", "", "Up");

    std::vector<TransferRecord> records = {
        test::makeRecord("r1", "alice", "x\\Up.mp3", "InProgress"),
    };
    t.check(!matcher.match(*item, records, {}).has_value(),
            "titles without long tokens never match by title");
}

void test_claimed_records_are_skipped(TestContext &t) {
    Matcher matcher;
    auto first = test::makeItem("alice", "Song.flac");
    auto second = test::makeItem("alice", "Song.flac");

    std::vector<TransferRecord> records = {
        test::makeRecord("r1", "alice", "a\\Song.flac", "InProgress"),
        test::makeRecord("r2", "alice", "b\\Song.flac", "InProgress"),
    };

    std::unordered_set<std::string> claimed;
    auto m1 = matcher.match(*first, records, claimed);
    t.check(m1.has_value(), "first item matches");
    if (m1) claimed.insert(claimKey(*m1->record));

    auto m2 = matcher.match(*second, records, claimed);
    t.check(m2.has_value(), "second item matches the other record");
    if (m1 && m2) {
        t.check(m1->record->id != m2->record->id, "no record may be attributed twice");
        claimed.insert(claimKey(*m2->record));
    }

    auto third = test::makeItem("alice", "Song.flac");
    t.check(!matcher.match(*third, records, claimed).has_value(),
            "a third colliding item finds nothing unclaimed");
}

void test_paired_item_never_matches_by_title(TestContext &t) {
    Matcher matcher;
    auto item = test::makeItem("alice", "Live\\Amazing Grace Live.flac", "Amazing Grace Live");
    item->setRemoteTransferId("r1");

    std::vector<TransferRecord> records = {
        test::makeRecord("r2", "bob", "Other\\Amazing Grace (Live).mp3", "InProgress"),
        test::makeRecord("r3", "alice", "Other\\Amazing Grace Live (2).flac", "InProgress"),
    };
    t.check(!matcher.match(*item, records, {}).has_value(),
            "an item with a remote id whose record is absent matches nothing");

    records.push_back(test::makeRecord("r4", "bob", "Live\\Amazing Grace Live.flac", "InProgress"));
    t.check(!matcher.match(*item, records, {}).has_value(),
            "same basename from another user is not a re-issued id");
}

void test_claim_key_without_id(TestContext &t) {
    auto a = test::makeRecord("", "Alice", "x\\Song.flac", "Queued");
    auto b = test::makeRecord("", "alice", "X\\song.flac", "Queued");
    auto c = test::makeRecord("", "alice", "x\\Other.flac", "Queued");
    t.checkEq(claimKey(a), claimKey(b), "id-less records claim by user and path, case-insensitively");
    t.check(claimKey(a) != claimKey(c), "different paths claim separately");
    t.checkEq(claimKey(test::makeRecord("r5", "alice", "x", "Queued")), std::string("r5"),
              "records with ids claim by id");
}

void test_no_records(TestContext &t) {
    Matcher matcher;
    auto item = test::makeItem("alice", "Song.flac", "Some Song");
    t.check(!matcher.match(*item, {}, {}).has_value(), "empty list never matches");
}

} // namespace

int main() {
    test::quietLogging();

    TestContext t;
    test_remote_id_wins(t);
    test_filename_fallback_is_case_insensitive(t);
    test_stale_remote_id_falls_back_to_filename(t);
    test_title_tokens_last_resort(t);
    test_short_tokens_do_not_match(t);
    test_claimed_records_are_skipped(t);
    test_paired_item_never_matches_by_title(t);
    test_claim_key_without_id(t);
    test_no_records(t);

    return t.finish("matcher_tests");
}
