#pragma once

#include <map>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/storage/buffer.hpp"
#include "chunkpipe/transfer/retry.hpp"
#include "chunkpipe/transfer/transport.hpp"

namespace chunkpipe::storage {
    class TempArea;
}

namespace chunkpipe::integrity {

    using u8 = chunkpipe::core::u8;
    using u32 = chunkpipe::core::u32;
    using u64 = chunkpipe::core::u64;

    struct ChunkRecord {
        u64 index{0};
        u64 size{0};
        chunkpipe::core::Hash256 checksum{};
        bool has_parity{false};
    };

    struct ManifestParams {
        u64 chunk_size{0};
        u32 block_size{0};
    };

    // Ordered chunk metadata for one stream. Records arrive in completion order and are
    // kept keyed by index. A record never changes once written; re-recording the same
    // checksum is a no-op, a different one is ManifestConflict. finalize() seals the
    // manifest with the chunk count and whole-stream digest.
    //
    // record() is safe from several workers at once.
    class IntegrityManifest {
    public:
        IntegrityManifest() noexcept = default;
        explicit IntegrityManifest(const ManifestParams& params) noexcept : params_(params) {}

        IntegrityManifest(const IntegrityManifest&) = delete;
        IntegrityManifest& operator=(const IntegrityManifest&) = delete;

        [[nodiscard]] chunkpipe::core::Status record(u64 index,
            u64 size,
            const chunkpipe::core::Hash256& checksum,
            bool has_parity) noexcept;

        // IncompleteManifest unless every index 0..total_chunks-1 has a record
        // and nothing beyond it does.
        [[nodiscard]] chunkpipe::core::Status finalize(u64 total_chunks,
            const chunkpipe::core::Hash256& stream_digest,
            u64 stream_size) noexcept;

        // Records in index order.
        [[nodiscard]] std::vector<ChunkRecord> records() const;

        [[nodiscard]] chunkpipe::core::Status find(u64 index, ChunkRecord* out) const noexcept;

        [[nodiscard]] bool finalized() const noexcept;
        [[nodiscard]] u64 total_chunks() const noexcept;
        [[nodiscard]] u64 stream_size() const noexcept;
        [[nodiscard]] chunkpipe::core::Hash256 stream_digest() const noexcept;
        [[nodiscard]] u64 record_count() const noexcept;
        [[nodiscard]] ManifestParams params() const noexcept;

        // Binary form (storage/layout.hpp).
        [[nodiscard]] chunkpipe::core::Status encode(std::vector<u8>* out) const noexcept;

        // Replaces the contents with the decoded manifest.
        [[nodiscard]] chunkpipe::core::Status decode(chunkpipe::storage::BufferView in) noexcept;

    private:
        mutable std::mutex mutex_;
        ManifestParams params_{};
        std::map<u64, ChunkRecord> records_;
        bool finalized_{false};
        u64 total_chunks_{0};
        u64 stream_size_{0};
        chunkpipe::core::Hash256 stream_digest_{};
    };

    // The single-record body of a per-chunk checksum object ("rp-xxxxxx.b3").
    [[nodiscard]] chunkpipe::core::Status manifest_encode_record(const ChunkRecord& rec, std::vector<u8>* out) noexcept;
    [[nodiscard]] chunkpipe::core::Status manifest_decode_record(chunkpipe::storage::BufferView in, ChunkRecord* out) noexcept;

    // Uploads the finalized manifest as kManifestKey.
    [[nodiscard]] chunkpipe::core::Status manifest_store(const IntegrityManifest& manifest,
        chunkpipe::transfer::TransportClient& transport,
        chunkpipe::storage::TempArea& temp,
        const chunkpipe::transfer::RetryPolicy& retry) noexcept;

    // Fetches and decodes kManifestKey. A missing or unsealed manifest is IncompleteManifest.
    [[nodiscard]] chunkpipe::core::Status manifest_load(chunkpipe::transfer::TransportClient& transport,
        chunkpipe::storage::TempArea& temp,
        const chunkpipe::transfer::RetryPolicy& retry,
        IntegrityManifest* out) noexcept;

    // Rebuilds an unsealed view from the per-chunk checksum objects of an interrupted run.
    [[nodiscard]] chunkpipe::core::Status manifest_scan_partial(chunkpipe::transfer::TransportClient& transport,
        chunkpipe::storage::TempArea& temp,
        const chunkpipe::transfer::RetryPolicy& retry,
        IntegrityManifest* out) noexcept;

    static_assert(std::is_trivially_copyable_v<ChunkRecord>);
    static_assert(std::is_trivially_copyable_v<ManifestParams>);

} // namespace chunkpipe::integrity
