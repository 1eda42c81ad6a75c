#include "chunkpipe/storage/layout.hpp"

#include <cstddef>
#include <cstring>

#include "chunkpipe/storage/endian.hpp"

namespace chunkpipe::storage {
    namespace {
        [[nodiscard]] bool all_zero(const u8* p, size_t n) noexcept {
            for (size_t i = 0; i < n; ++i) {
                if (p[i] != 0) {
                    return false;
                }
            }
            return true;
        }

        std::string key_with_suffix(u64 index, const char* suffix) {
            char name[32];
            if (!layout_chunk_name(index, name, sizeof(name))) {
                return std::string();
            }
            return std::string(name) + suffix;
        }
    } // namespace

    bool layout_chunk_name(u64 index, char* out, size_t out_size) noexcept {
        const size_t prefix_len = sizeof(kChunkPrefix) - 1;
        if (out == nullptr || out_size < prefix_len + kChunkNameWidth + 1) {
            return false;
        }
        if (index >= kMaxChunks) {
            return false;
        }
        std::memcpy(out, kChunkPrefix, prefix_len);
        char* digits = out + prefix_len;
        for (u32 i = 0; i < kChunkNameWidth; ++i) {
            digits[i] = 'a';
        }
        u64 n = index;
        for (u32 p = kChunkNameWidth; p > 0 && n != 0; --p) {
            digits[p - 1] = static_cast<char>('a' + (n % 26));
            n /= 26;
        }
        digits[kChunkNameWidth] = '\0';
        return true;
    }

    bool layout_parse_chunk_name(const char* name, u64* index) noexcept {
        if (name == nullptr || index == nullptr) {
            return false;
        }
        const size_t prefix_len = sizeof(kChunkPrefix) - 1;
        if (std::strlen(name) != prefix_len + kChunkNameWidth) {
            return false;
        }
        if (std::memcmp(name, kChunkPrefix, prefix_len) != 0) {
            return false;
        }
        u64 v = 0;
        for (u32 i = 0; i < kChunkNameWidth; ++i) {
            const char c = name[prefix_len + i];
            if (c < 'a' || c > 'z') {
                return false;
            }
            v = v * 26 + static_cast<u64>(c - 'a');
        }
        *index = v;
        return true;
    }

    std::string layout_data_key(u64 index) {
        return key_with_suffix(index, "");
    }

    std::string layout_checksum_key(u64 index) {
        return key_with_suffix(index, kChecksumSuffix);
    }

    std::string layout_parity_key(u64 index) {
        return key_with_suffix(index, kParitySuffix);
    }

    u32 layout_write_manifest_header(const ManifestHeader& h, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kManifestHeaderBytes) {
            return 0;
        }
        if (h.version != kLayoutVersion) {
            return 0;
        }

        u8* p = out.data;
        put_u32_be(p + 0, kManifestMagic);
        put_u32_be(p + 4, h.version);
        put_u64_be(p + 8, h.chunk_size);
        put_u32_be(p + 16, h.block_size);
        put_u32_be(p + 20, h.flags);
        put_u64_be(p + 24, h.total_chunks);
        put_u64_be(p + 32, h.stream_size);
        std::memcpy(p + 40, h.stream_digest.b.data(), h.stream_digest.b.size());
        put_u64_be(p + 72, h.entry_count);
        std::memset(p + 80, 0, kManifestHeaderBytes - 80);
        return kManifestHeaderBytes;
    }

    LayoutParseResult layout_read_manifest_header(BufferView in, ManifestHeader* out) noexcept {
        if (out == nullptr) {
            return LayoutParseResult::Invalid;
        }
        if (in.len < kManifestHeaderBytes) {
            return LayoutParseResult::NeedMore;
        }
        if (in.data == nullptr) {
            return LayoutParseResult::Invalid;
        }

        const u8* p = in.data;
        if (get_u32_be(p + 0) != kManifestMagic) {
            return LayoutParseResult::Invalid;
        }
        ManifestHeader h{};
        h.version = get_u32_be(p + 4);
        h.chunk_size = get_u64_be(p + 8);
        h.block_size = get_u32_be(p + 16);
        h.flags = get_u32_be(p + 20);
        h.total_chunks = get_u64_be(p + 24);
        h.stream_size = get_u64_be(p + 32);
        std::memcpy(h.stream_digest.b.data(), p + 40, h.stream_digest.b.size());
        h.entry_count = get_u64_be(p + 72);

        if (h.version != kLayoutVersion) {
            return LayoutParseResult::Invalid;
        }
        if (!all_zero(p + 80, kManifestHeaderBytes - 80)) {
            return LayoutParseResult::Invalid;
        }
        if ((h.flags & kManifestFlagFinalized) != 0 && h.total_chunks != h.entry_count) {
            return LayoutParseResult::Invalid;
        }

        *out = h;
        return LayoutParseResult::Ok;
    }

    u32 layout_write_manifest_entry(const ManifestEntry& e, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kManifestEntryBytes) {
            return 0;
        }
        if (e.reserved != 0 || e.index >= kMaxChunks) {
            return 0;
        }

        u8* p = out.data;
        put_u64_be(p + 0, e.index);
        put_u64_be(p + 8, e.size_bytes);
        std::memcpy(p + 16, e.checksum.b.data(), e.checksum.b.size());
        put_u32_be(p + 48, e.flags);
        put_u32_be(p + 52, e.reserved);
        return kManifestEntryBytes;
    }

    LayoutParseResult layout_read_manifest_entry(BufferView in, ManifestEntry* out) noexcept {
        if (out == nullptr) {
            return LayoutParseResult::Invalid;
        }
        if (in.len < kManifestEntryBytes) {
            return LayoutParseResult::NeedMore;
        }
        if (in.data == nullptr) {
            return LayoutParseResult::Invalid;
        }

        const u8* p = in.data;
        ManifestEntry e{};
        e.index = get_u64_be(p + 0);
        e.size_bytes = get_u64_be(p + 8);
        std::memcpy(e.checksum.b.data(), p + 16, e.checksum.b.size());
        e.flags = get_u32_be(p + 48);
        e.reserved = get_u32_be(p + 52);

        if (e.reserved != 0 || e.index >= kMaxChunks) {
            return LayoutParseResult::Invalid;
        }
        if ((e.flags & ~kEntryFlagParity) != 0) {
            return LayoutParseResult::Invalid;
        }

        *out = e;
        return LayoutParseResult::Ok;
    }
} // namespace chunkpipe::storage
