#include "ledger.hpp"
#include "upload_types.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace chunkflow;

namespace {

LedgerEntry make_entry(const std::string& checksum, uint32_t total_chunks, const std::string& owner = "") {
    LedgerEntry entry;
    entry.set_checksum(checksum);
    entry.set_file_name("video.mp4");
    entry.set_mime_type("video/mp4");
    entry.set_total_size(static_cast<uint64_t>(total_chunks) * 1024);
    entry.set_total_chunks(total_chunks);
    entry.set_chunk_size(1024);
    entry.set_owner_scope(owner);
    return entry;
}

ChunkPlacement placement(uint32_t index, const std::string& server = "node-a") {
    ChunkPlacement p;
    p.set_chunk_index(index);
    p.set_server_id(server);
    p.set_storage_locator(server + "/" + std::to_string(index));
    p.set_size(1024);
    return p;
}

const std::string CHECKSUM_A(64, 'a');
const std::string CHECKSUM_B(64, 'b');

}

TEST(LedgerTest, FindsEntriesByChecksum) {
    PartialUploadLedger ledger;
    EXPECT_FALSE(ledger.find_by_checksum(CHECKSUM_A));

    ledger.create_or_update(make_entry(CHECKSUM_A, 4));
    auto entry = ledger.find_by_checksum(CHECKSUM_A);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->file_name(), "video.mp4");
    EXPECT_EQ(entry->completed_chunks_size(), 0);
    EXPECT_GT(entry->created_at(), 0);
}

TEST(LedgerTest, RejectsMalformedEntries) {
    PartialUploadLedger ledger;
    EXPECT_THROW(ledger.create_or_update(make_entry("not-a-checksum", 2)), std::invalid_argument);

    LedgerEntry entry = make_entry(CHECKSUM_A, 2);
    entry.add_completed_chunks(2);
    EXPECT_THROW(ledger.create_or_update(entry), std::invalid_argument);
}

TEST(LedgerTest, CheckResumableRejectsSizeMismatch) {
    PartialUploadLedger ledger;
    ledger.create_or_update(make_entry(CHECKSUM_A, 4));

    EXPECT_FALSE(ledger.check_resumable(CHECKSUM_B, 4096));
    EXPECT_TRUE(ledger.check_resumable(CHECKSUM_A, 4096));
    EXPECT_THROW(ledger.check_resumable(CHECKSUM_A, 4095), IntegrityError);
}

TEST(LedgerTest, MarkChunkCompleteKeepsIndicesSortedAndUnique) {
    PartialUploadLedger ledger;
    ledger.create_or_update(make_entry(CHECKSUM_A, 5));

    EXPECT_TRUE(ledger.mark_chunk_complete(CHECKSUM_A, placement(3)));
    EXPECT_TRUE(ledger.mark_chunk_complete(CHECKSUM_A, placement(0)));
    EXPECT_TRUE(ledger.mark_chunk_complete(CHECKSUM_A, placement(3, "node-b")));

    auto entry = ledger.find_by_checksum(CHECKSUM_A);
    ASSERT_TRUE(entry);
    ASSERT_EQ(entry->completed_chunks_size(), 2);
    EXPECT_EQ(entry->completed_chunks(0), 0u);
    EXPECT_EQ(entry->completed_chunks(1), 3u);
    ASSERT_EQ(entry->placements_size(), 2);
    for (const auto& p : entry->placements()) {
        if (p.chunk_index() == 3) {
            EXPECT_EQ(p.server_id(), "node-b");
        }
    }
}

TEST(LedgerTest, MarkChunkCompleteValidatesItsArguments) {
    PartialUploadLedger ledger;
    EXPECT_FALSE(ledger.mark_chunk_complete(CHECKSUM_A, placement(0)));

    ledger.create_or_update(make_entry(CHECKSUM_A, 2));
    EXPECT_THROW(ledger.mark_chunk_complete(CHECKSUM_A, placement(2)), std::out_of_range);
}

TEST(LedgerTest, ConcurrentCompletionsAreAllRecorded) {
    const uint32_t chunks = 64;
    test::TempDir dir;
    PartialUploadLedger ledger(dir.path());
    ledger.create_or_update(make_entry(CHECKSUM_A, chunks));

    std::vector<std::thread> threads;
    for (uint32_t t = 0; t < 8; ++t) {
        threads.emplace_back([&ledger, t]() {
            for (uint32_t i = t; i < chunks; i += 8) {
                ledger.mark_chunk_complete(CHECKSUM_A, placement(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto entry = ledger.find_by_checksum(CHECKSUM_A);
    ASSERT_TRUE(entry);
    ASSERT_EQ(entry->completed_chunks_size(), static_cast<int>(chunks));
    for (uint32_t i = 0; i < chunks; ++i) {
        EXPECT_EQ(entry->completed_chunks(static_cast<int>(i)), i);
    }

    PartialUploadLedger reloaded(dir.path());
    auto persisted = reloaded.find_by_checksum(CHECKSUM_A);
    ASSERT_TRUE(persisted);
    EXPECT_EQ(persisted->completed_chunks_size(), static_cast<int>(chunks));
}

TEST(LedgerTest, SurvivesRestart) {
    test::TempDir dir;
    {
        PartialUploadLedger ledger(dir.path());
        ledger.create_or_update(make_entry(CHECKSUM_A, 3, "forum-1/user-9"));
        ledger.mark_chunk_complete(CHECKSUM_A, placement(1));
        ledger.create_or_update(make_entry(CHECKSUM_B, 2));
        EXPECT_TRUE(ledger.remove(CHECKSUM_B));
    }

    PartialUploadLedger ledger(dir.path());
    EXPECT_FALSE(ledger.find_by_checksum(CHECKSUM_B));
    auto entry = ledger.find_by_checksum(CHECKSUM_A);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->owner_scope(), "forum-1/user-9");
    ASSERT_EQ(entry->completed_chunks_size(), 1);
    EXPECT_EQ(entry->completed_chunks(0), 1u);
    EXPECT_EQ(entry->placements(0).storage_locator(), "node-a/1");
}

TEST(LedgerTest, UpdatesKeepCreationTime) {
    PartialUploadLedger ledger;
    LedgerEntry entry = make_entry(CHECKSUM_A, 3);
    ledger.create_or_update(entry);
    int64_t created = ledger.find_by_checksum(CHECKSUM_A)->created_at();

    entry.set_created_at(1);
    entry.set_file_name("renamed.mp4");
    ledger.create_or_update(entry);
    auto updated = ledger.find_by_checksum(CHECKSUM_A);
    EXPECT_EQ(updated->created_at(), created);
    EXPECT_EQ(updated->file_name(), "renamed.mp4");
}

TEST(LedgerTest, ListsByOwnerScope) {
    PartialUploadLedger ledger;
    ledger.create_or_update(make_entry(CHECKSUM_A, 2, "alice"));
    ledger.create_or_update(make_entry(CHECKSUM_B, 2, "bob"));

    EXPECT_EQ(ledger.list().size(), 2u);
    auto alice = ledger.list("alice");
    ASSERT_EQ(alice.size(), 1u);
    EXPECT_EQ(alice[0].checksum(), CHECKSUM_A);
    EXPECT_TRUE(ledger.list("carol").empty());
    EXPECT_FALSE(ledger.remove(std::string(64, 'c')));
}
