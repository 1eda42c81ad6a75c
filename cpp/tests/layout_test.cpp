#include <array>
#include <string>

#include <gtest/gtest.h>

#include "chunkpipe/storage/layout.hpp"

TEST(StorageLayout, ChunkNamesAreBase26) {
    char name[16];
    ASSERT_TRUE(chunkpipe::storage::layout_chunk_name(0, name, sizeof(name)));
    EXPECT_STREQ(name, "rp-aaaaaa");
    ASSERT_TRUE(chunkpipe::storage::layout_chunk_name(1, name, sizeof(name)));
    EXPECT_STREQ(name, "rp-aaaaab");
    ASSERT_TRUE(chunkpipe::storage::layout_chunk_name(26, name, sizeof(name)));
    EXPECT_STREQ(name, "rp-aaaaba");
    ASSERT_TRUE(chunkpipe::storage::layout_chunk_name(chunkpipe::storage::kMaxChunks - 1, name, sizeof(name)));
    EXPECT_STREQ(name, "rp-zzzzzz");
    EXPECT_FALSE(chunkpipe::storage::layout_chunk_name(chunkpipe::storage::kMaxChunks, name, sizeof(name)));
}

TEST(StorageLayout, ChunkNameNeedsRoomForTerminator) {
    char name[9];
    EXPECT_FALSE(chunkpipe::storage::layout_chunk_name(0, name, sizeof(name)));
}

TEST(StorageLayout, ChunkNamesSortInIndexOrder) {
    std::string prev = chunkpipe::storage::layout_data_key(0);
    for (chunkpipe::core::u64 i = 1; i < 2000; i += 7) {
        const std::string cur = chunkpipe::storage::layout_data_key(i);
        EXPECT_LT(prev, cur) << i;
        prev = cur;
    }
}

TEST(StorageLayout, ParseChunkNameInvertsFormat) {
    for (chunkpipe::core::u64 i : {0ull, 25ull, 26ull, 675ull, 123456ull}) {
        chunkpipe::core::u64 back = 0;
        ASSERT_TRUE(chunkpipe::storage::layout_parse_chunk_name(chunkpipe::storage::layout_data_key(i).c_str(), &back));
        EXPECT_EQ(back, i);
    }

    chunkpipe::core::u64 idx = 0;
    EXPECT_FALSE(chunkpipe::storage::layout_parse_chunk_name("rp-aaaaa", &idx));
    EXPECT_FALSE(chunkpipe::storage::layout_parse_chunk_name("rp-aaaaaA", &idx));
    EXPECT_FALSE(chunkpipe::storage::layout_parse_chunk_name("xx-aaaaaa", &idx));
    EXPECT_FALSE(chunkpipe::storage::layout_parse_chunk_name("rp-aaaaaa.b3", &idx));
}

TEST(StorageLayout, ObjectKeysCarrySuffixes) {
    EXPECT_EQ(chunkpipe::storage::layout_data_key(2), "rp-aaaaac");
    EXPECT_EQ(chunkpipe::storage::layout_checksum_key(2), "rp-aaaaac.b3");
    EXPECT_EQ(chunkpipe::storage::layout_parity_key(2), "rp-aaaaac.par");
}

TEST(StorageLayout, ManifestHeaderRoundTrip) {
    chunkpipe::storage::ManifestHeader in{};
    in.chunk_size = 8u << 20;
    in.block_size = 65536;
    in.flags = chunkpipe::storage::kManifestFlagFinalized;
    in.total_chunks = 3;
    in.stream_size = 0x0102030405060708ull;
    in.entry_count = 3;
    for (size_t i = 0; i < in.stream_digest.b.size(); ++i) {
        in.stream_digest.b[i] = static_cast<chunkpipe::core::u8>(i * 3);
    }

    std::array<chunkpipe::storage::u8, chunkpipe::storage::kManifestHeaderBytes> buf{};
    ASSERT_EQ(chunkpipe::storage::layout_write_manifest_header(in, {buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}),
              chunkpipe::storage::kManifestHeaderBytes);
    EXPECT_EQ(buf[0], 'C');
    EXPECT_EQ(buf[3], 'F');

    chunkpipe::storage::ManifestHeader out{};
    ASSERT_EQ(chunkpipe::storage::layout_read_manifest_header({buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}, &out),
              chunkpipe::storage::LayoutParseResult::Ok);
    EXPECT_EQ(out.version, chunkpipe::storage::kLayoutVersion);
    EXPECT_EQ(out.chunk_size, in.chunk_size);
    EXPECT_EQ(out.block_size, in.block_size);
    EXPECT_EQ(out.flags, in.flags);
    EXPECT_EQ(out.total_chunks, in.total_chunks);
    EXPECT_EQ(out.stream_size, in.stream_size);
    EXPECT_EQ(out.stream_digest, in.stream_digest);
    EXPECT_EQ(out.entry_count, in.entry_count);
}

TEST(StorageLayout, ManifestHeaderNeedMoreWhenShort) {
    std::array<chunkpipe::storage::u8, chunkpipe::storage::kManifestHeaderBytes - 1> buf{};
    chunkpipe::storage::ManifestHeader out{};
    EXPECT_EQ(chunkpipe::storage::layout_read_manifest_header({buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}, &out),
              chunkpipe::storage::LayoutParseResult::NeedMore);
}

TEST(StorageLayout, ManifestHeaderRejectsBadMagicAndReserved) {
    chunkpipe::storage::ManifestHeader in{};
    std::array<chunkpipe::storage::u8, chunkpipe::storage::kManifestHeaderBytes> buf{};
    ASSERT_NE(chunkpipe::storage::layout_write_manifest_header(in, {buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}), 0u);

    chunkpipe::storage::ManifestHeader out{};
    auto bad_magic = buf;
    bad_magic[0] ^= 0xff;
    EXPECT_EQ(chunkpipe::storage::layout_read_manifest_header({bad_magic.data(), static_cast<chunkpipe::storage::u32>(bad_magic.size())}, &out),
              chunkpipe::storage::LayoutParseResult::Invalid);

    auto bad_reserved = buf;
    bad_reserved[90] = 1;
    EXPECT_EQ(chunkpipe::storage::layout_read_manifest_header({bad_reserved.data(), static_cast<chunkpipe::storage::u32>(bad_reserved.size())}, &out),
              chunkpipe::storage::LayoutParseResult::Invalid);
}

TEST(StorageLayout, FinalizedHeaderMustCountEveryEntry) {
    chunkpipe::storage::ManifestHeader in{};
    in.flags = chunkpipe::storage::kManifestFlagFinalized;
    in.total_chunks = 4;
    in.entry_count = 3;
    std::array<chunkpipe::storage::u8, chunkpipe::storage::kManifestHeaderBytes> buf{};
    ASSERT_NE(chunkpipe::storage::layout_write_manifest_header(in, {buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}), 0u);

    chunkpipe::storage::ManifestHeader out{};
    EXPECT_EQ(chunkpipe::storage::layout_read_manifest_header({buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}, &out),
              chunkpipe::storage::LayoutParseResult::Invalid);
}

TEST(StorageLayout, ManifestEntryRoundTripAndFlagValidation) {
    chunkpipe::storage::ManifestEntry in{};
    in.index = 41;
    in.size_bytes = 1234;
    in.flags = chunkpipe::storage::kEntryFlagParity;
    in.checksum.b[0] = 0xab;
    in.checksum.b[31] = 0xcd;

    std::array<chunkpipe::storage::u8, chunkpipe::storage::kManifestEntryBytes> buf{};
    ASSERT_EQ(chunkpipe::storage::layout_write_manifest_entry(in, {buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}),
              chunkpipe::storage::kManifestEntryBytes);

    chunkpipe::storage::ManifestEntry out{};
    ASSERT_EQ(chunkpipe::storage::layout_read_manifest_entry({buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}, &out),
              chunkpipe::storage::LayoutParseResult::Ok);
    EXPECT_EQ(out.index, 41u);
    EXPECT_EQ(out.size_bytes, 1234u);
    EXPECT_EQ(out.flags, chunkpipe::storage::kEntryFlagParity);
    EXPECT_EQ(out.checksum, in.checksum);

    buf[51] |= 0x02;  // unknown flag bit
    EXPECT_EQ(chunkpipe::storage::layout_read_manifest_entry({buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}, &out),
              chunkpipe::storage::LayoutParseResult::Invalid);
}

TEST(StorageLayout, EntryWriteRejectsReservedBits) {
    chunkpipe::storage::ManifestEntry in{};
    in.reserved = 1;
    std::array<chunkpipe::storage::u8, chunkpipe::storage::kManifestEntryBytes> buf{};
    EXPECT_EQ(chunkpipe::storage::layout_write_manifest_entry(in, {buf.data(), static_cast<chunkpipe::storage::u32>(buf.size())}), 0u);
}
