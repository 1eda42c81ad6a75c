#pragma once

#include <cstddef>
#include <string>
#include <type_traits>

#include "chunkpipe/core/types.hpp"
#include "chunkpipe/storage/buffer.hpp"

namespace chunkpipe::storage {
    using u8 = chunkpipe::core::u8;
    using u32 = chunkpipe::core::u32;
    using u64 = chunkpipe::core::u64;

    constexpr u32 kLayoutVersion = 1;

    // Remote object names. Chunk n is "rp-" + n in base 26 (a-z), six letters wide,
    // so names sort lexically in index order.
    inline constexpr char kChunkPrefix[] = "rp-";
    inline constexpr u32 kChunkNameWidth = 6;
    inline constexpr u64 kMaxChunks = 308915776ull;  // 26^6
    inline constexpr char kChecksumSuffix[] = ".b3";
    inline constexpr char kParitySuffix[] = ".par";
    inline constexpr char kManifestKey[] = "rpipe.manifest";

    // Writes the NUL-terminated chunk name. Returns false if index >= kMaxChunks or out is too small.
    [[nodiscard]] bool layout_chunk_name(u64 index, char* out, size_t out_size) noexcept;

    // Parses "rp-xxxxxx" (no suffix). Returns false on anything else.
    [[nodiscard]] bool layout_parse_chunk_name(const char* name, u64* index) noexcept;

    [[nodiscard]] std::string layout_data_key(u64 index);
    [[nodiscard]] std::string layout_checksum_key(u64 index);
    [[nodiscard]] std::string layout_parity_key(u64 index);

    inline constexpr u32 kManifestMagic = 0x43504d46u;  // "CPMF"
    inline constexpr u32 kManifestFlagFinalized = 1u << 0;
    inline constexpr u32 kEntryFlagParity = 1u << 0;

    struct ManifestHeader {
        u32 version{kLayoutVersion};
        u64 chunk_size{0};
        u32 block_size{0};
        u32 flags{0};
        u64 total_chunks{0};
        u64 stream_size{0};
        chunkpipe::core::Hash256 stream_digest{};
        u64 entry_count{0};
    };

    struct ManifestEntry {
        u64 index{0};
        u64 size_bytes{0};
        chunkpipe::core::Hash256 checksum{};
        u32 flags{0};
        u32 reserved{0};
    };

    // Layout (big-endian):
    // header: 0..3 magic, 4..7 version, 8..15 chunk_size, 16..19 block_size, 20..23 flags,
    //         24..31 total_chunks, 32..39 stream_size, 40..71 stream_digest, 72..79 entry_count,
    //         80..95 reserved (zero).
    // entry:  0..7 index, 8..15 size, 16..47 checksum, 48..51 flags, 52..55 reserved (zero).
    inline constexpr u32 kManifestHeaderBytes = 96;
    inline constexpr u32 kManifestEntryBytes = 56;

    enum class LayoutParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
    };

    // Return bytes written (0 on failure).
    [[nodiscard]] u32 layout_write_manifest_header(const ManifestHeader& h, BufferMut out) noexcept;
    [[nodiscard]] u32 layout_write_manifest_entry(const ManifestEntry& e, BufferMut out) noexcept;

    [[nodiscard]] LayoutParseResult layout_read_manifest_header(BufferView in, ManifestHeader* out) noexcept;
    [[nodiscard]] LayoutParseResult layout_read_manifest_entry(BufferView in, ManifestEntry* out) noexcept;

    static_assert(std::is_trivially_copyable_v<ManifestHeader>);
    static_assert(std::is_trivially_copyable_v<ManifestEntry>);
    static_assert(std::is_standard_layout_v<ManifestHeader>);
    static_assert(std::is_standard_layout_v<ManifestEntry>);

} // namespace chunkpipe::storage
