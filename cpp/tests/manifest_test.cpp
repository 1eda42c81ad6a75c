#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chunkpipe/backend/local_transport.hpp"
#include "chunkpipe/integrity/manifest.hpp"
#include "chunkpipe/storage/layout.hpp"
#include "chunkpipe/storage/temp_area.hpp"
#include "test_support.hpp"

using namespace chunkpipe::core;
using chunkpipe::integrity::ChunkRecord;
using chunkpipe::integrity::IntegrityManifest;

namespace {
    Hash256 digest_of(u8 tag) {
        Hash256 h{};
        h.b[0] = tag;
        h.b[31] = static_cast<u8>(~tag);
        return h;
    }
} // namespace

TEST(IntegrityManifest, RecordIsIdempotentForSameChecksum) {
    IntegrityManifest m;
    ASSERT_TRUE(is_ok(m.record(0, 100, digest_of(1), false)));
    EXPECT_TRUE(is_ok(m.record(0, 100, digest_of(1), false)));
    EXPECT_EQ(m.record_count(), 1u);
}

TEST(IntegrityManifest, DifferentChecksumIsConflict) {
    IntegrityManifest m;
    ASSERT_TRUE(is_ok(m.record(3, 100, digest_of(1), false)));
    const Status s = m.record(3, 100, digest_of(2), false);
    EXPECT_EQ(s.code, StatusCode::ManifestConflict);
    EXPECT_EQ(s.aux, 3u);

    ChunkRecord rec{};
    ASSERT_TRUE(is_ok(m.find(3, &rec)));
    EXPECT_EQ(rec.checksum, digest_of(1));
}

TEST(IntegrityManifest, FinalizeRequiresEveryIndex) {
    IntegrityManifest m;
    ASSERT_TRUE(is_ok(m.record(0, 8, digest_of(0), false)));
    ASSERT_TRUE(is_ok(m.record(2, 4, digest_of(2), false)));

    Status s = m.finalize(3, digest_of(9), 20);
    EXPECT_EQ(s.code, StatusCode::IncompleteManifest);
    EXPECT_EQ(s.aux, 1u);
    EXPECT_FALSE(m.finalized());

    ASSERT_TRUE(is_ok(m.record(1, 8, digest_of(1), false)));
    EXPECT_EQ(m.finalize(2, digest_of(9), 16).code, StatusCode::IncompleteManifest);
    ASSERT_TRUE(is_ok(m.finalize(3, digest_of(9), 20)));
    EXPECT_TRUE(m.finalized());
    EXPECT_EQ(m.total_chunks(), 3u);
}

TEST(IntegrityManifest, SealedManifestOnlyAcceptsReRecords) {
    IntegrityManifest m;
    ASSERT_TRUE(is_ok(m.record(0, 5, digest_of(0), true)));
    ASSERT_TRUE(is_ok(m.finalize(1, digest_of(7), 5)));

    EXPECT_TRUE(is_ok(m.record(0, 5, digest_of(0), true)));
    EXPECT_EQ(m.record(1, 5, digest_of(1), false).code, StatusCode::ManifestConflict);
    EXPECT_EQ(m.record(0, 5, digest_of(4), true).code, StatusCode::ManifestConflict);
}

TEST(IntegrityManifest, RecordsComeBackInIndexOrder) {
    IntegrityManifest m;
    for (u64 i : {4ull, 1ull, 3ull, 0ull, 2ull}) {
        ASSERT_TRUE(is_ok(m.record(i, 10 + i, digest_of(static_cast<u8>(i)), false)));
    }
    const auto recs = m.records();
    ASSERT_EQ(recs.size(), 5u);
    for (u64 i = 0; i < 5; ++i) {
        EXPECT_EQ(recs[i].index, i);
        EXPECT_EQ(recs[i].size, 10 + i);
    }
}

TEST(IntegrityManifest, ConcurrentRecordsOnDistinctIndices) {
    IntegrityManifest m;
    std::vector<std::thread> threads;
    for (u32 t = 0; t < 4; ++t) {
        threads.emplace_back([&m, t] {
            for (u64 i = t; i < 400; i += 4) {
                EXPECT_TRUE(is_ok(m.record(i, 1, digest_of(static_cast<u8>(i)), false)));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_TRUE(is_ok(m.finalize(400, digest_of(0), 400)));
}

TEST(IntegrityManifest, EncodeDecodePreservesEverything) {
    IntegrityManifest m(chunkpipe::integrity::ManifestParams{4096, 512});
    ASSERT_TRUE(is_ok(m.record(0, 4096, digest_of(1), true)));
    ASSERT_TRUE(is_ok(m.record(1, 17, digest_of(2), false)));
    ASSERT_TRUE(is_ok(m.finalize(2, digest_of(3), 4113)));

    std::vector<u8> bytes;
    ASSERT_TRUE(is_ok(m.encode(&bytes)));
    EXPECT_EQ(bytes.size(), chunkpipe::storage::kManifestHeaderBytes + 2 * chunkpipe::storage::kManifestEntryBytes);

    IntegrityManifest back;
    ASSERT_TRUE(is_ok(back.decode({bytes.data(), static_cast<u32>(bytes.size())})));
    EXPECT_TRUE(back.finalized());
    EXPECT_EQ(back.total_chunks(), 2u);
    EXPECT_EQ(back.stream_size(), 4113u);
    EXPECT_EQ(back.stream_digest(), digest_of(3));
    EXPECT_EQ(back.params().chunk_size, 4096u);
    EXPECT_EQ(back.params().block_size, 512u);

    ChunkRecord rec{};
    ASSERT_TRUE(is_ok(back.find(0, &rec)));
    EXPECT_TRUE(rec.has_parity);
    ASSERT_TRUE(is_ok(back.find(1, &rec)));
    EXPECT_FALSE(rec.has_parity);
    EXPECT_EQ(rec.size, 17u);
}

TEST(IntegrityManifest, DecodeRejectsTruncatedAndInconsistentInput) {
    IntegrityManifest m;
    ASSERT_TRUE(is_ok(m.record(0, 3, digest_of(1), false)));
    ASSERT_TRUE(is_ok(m.finalize(1, digest_of(2), 3)));
    std::vector<u8> bytes;
    ASSERT_TRUE(is_ok(m.encode(&bytes)));

    IntegrityManifest back;
    EXPECT_EQ(back.decode({bytes.data(), static_cast<u32>(bytes.size() - 1)}).code, StatusCode::Invalid);

    // Stream size no longer matches the entry sizes.
    bytes[39] ^= 0x01;
    EXPECT_EQ(back.decode({bytes.data(), static_cast<u32>(bytes.size())}).code, StatusCode::Invalid);
}

TEST(IntegrityManifest, SingleRecordObjectRoundTrip) {
    const ChunkRecord in{7, 1234, digest_of(5), true};
    std::vector<u8> body;
    ASSERT_TRUE(is_ok(chunkpipe::integrity::manifest_encode_record(in, &body)));
    EXPECT_EQ(body.size(), chunkpipe::storage::kManifestEntryBytes);

    ChunkRecord out{};
    ASSERT_TRUE(is_ok(chunkpipe::integrity::manifest_decode_record({body.data(), static_cast<u32>(body.size())}, &out)));
    EXPECT_EQ(out.index, 7u);
    EXPECT_EQ(out.size, 1234u);
    EXPECT_EQ(out.checksum, in.checksum);
    EXPECT_TRUE(out.has_parity);
}

class ManifestStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dest_ = scratch_.sub("dest");
        transport_ = std::make_unique<chunkpipe::backend::LocalTransport>(dest_, 512);
        ASSERT_TRUE(is_ok(temp_.open(scratch_.sub("tmp"), false)));
        retry_.backoff_ms = 0;
    }

    chunkpipe::test::ScratchDir scratch_;
    std::string dest_;
    std::unique_ptr<chunkpipe::backend::LocalTransport> transport_;
    chunkpipe::storage::TempArea temp_;
    chunkpipe::transfer::RetryPolicy retry_{};
};

TEST_F(ManifestStoreTest, StoreThenLoad) {
    IntegrityManifest m(chunkpipe::integrity::ManifestParams{64, 16});
    ASSERT_TRUE(is_ok(m.record(0, 64, digest_of(1), false)));
    ASSERT_TRUE(is_ok(m.record(1, 10, digest_of(2), false)));
    ASSERT_TRUE(is_ok(m.finalize(2, digest_of(3), 74)));
    ASSERT_TRUE(is_ok(chunkpipe::integrity::manifest_store(m, *transport_, temp_, retry_)));
    EXPECT_TRUE(chunkpipe::storage::file_exists(transport_->object_path("rpipe.manifest").c_str()));
    EXPECT_EQ(temp_.file_count(), 0u);

    IntegrityManifest loaded;
    ASSERT_TRUE(is_ok(chunkpipe::integrity::manifest_load(*transport_, temp_, retry_, &loaded)));
    EXPECT_EQ(loaded.total_chunks(), 2u);
    EXPECT_EQ(loaded.stream_digest(), digest_of(3));
}

TEST_F(ManifestStoreTest, StoreRefusesUnsealedManifest) {
    IntegrityManifest m;
    ASSERT_TRUE(is_ok(m.record(0, 1, digest_of(1), false)));
    EXPECT_EQ(chunkpipe::integrity::manifest_store(m, *transport_, temp_, retry_).code, StatusCode::IncompleteManifest);
}

TEST_F(ManifestStoreTest, MissingManifestIsIncomplete) {
    IntegrityManifest loaded;
    EXPECT_EQ(chunkpipe::integrity::manifest_load(*transport_, temp_, retry_, &loaded).code,
        StatusCode::IncompleteManifest);
}

TEST_F(ManifestStoreTest, ScanPartialReadsChecksumObjects) {
    for (u64 i : {0ull, 2ull}) {
        std::vector<u8> body;
        ASSERT_TRUE(is_ok(chunkpipe::integrity::manifest_encode_record({i, 50, digest_of(static_cast<u8>(i)), false}, &body)));
        const std::string local = temp_.path_for("body");
        ASSERT_TRUE(is_ok(chunkpipe::storage::write_file(local.c_str(), {body.data(), static_cast<u32>(body.size())}, false)));
        ASSERT_TRUE(is_ok(transport_->upload(local, chunkpipe::storage::layout_checksum_key(i))));
        (void)chunkpipe::storage::remove_file(local);
    }

    IntegrityManifest partial;
    ASSERT_TRUE(is_ok(chunkpipe::integrity::manifest_scan_partial(*transport_, temp_, retry_, &partial)));
    EXPECT_EQ(partial.record_count(), 2u);
    EXPECT_FALSE(partial.finalized());
    EXPECT_EQ(partial.finalize(3, digest_of(0), 150).code, StatusCode::IncompleteManifest);
}
