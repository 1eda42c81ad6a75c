#include "chunkpipe/integrity/manifest.hpp"

#include <cstring>
#include <new>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/storage/file_io.hpp"
#include "chunkpipe/storage/layout.hpp"
#include "chunkpipe/storage/temp_area.hpp"

namespace chunkpipe::integrity {

using namespace chunkpipe::core;
using chunkpipe::storage::BufferMut;
using chunkpipe::storage::BufferView;

namespace {

Status manifest_status(StatusCode code, u64 index = 0) {
    return make_status(StatusDomain::Manifest, code, static_cast<u32>(index));
}

storage::ManifestEntry to_entry(const ChunkRecord& rec) {
    storage::ManifestEntry e{};
    e.index = rec.index;
    e.size_bytes = rec.size;
    e.checksum = rec.checksum;
    e.flags = rec.has_parity ? storage::kEntryFlagParity : 0u;
    return e;
}

ChunkRecord from_entry(const storage::ManifestEntry& e) {
    ChunkRecord rec{};
    rec.index = e.index;
    rec.size = e.size_bytes;
    rec.checksum = e.checksum;
    rec.has_parity = (e.flags & storage::kEntryFlagParity) != 0;
    return rec;
}

// Downloads key into the temp area and reads it back whole.
Status fetch_object(transfer::TransportClient& transport,
    storage::TempArea& temp,
    const transfer::RetryPolicy& retry,
    const std::string& key,
    std::vector<u8>* out) {
    const std::string path = temp.path_for(key);
    Status s = transfer::with_retries(retry, nullptr, "download", key,
        [&] { return transport.download(key, path); });
    if (is_ok(s)) {
        s = storage::read_file(path.c_str(), out);
    }
    (void)storage::remove_file(path);
    return s;
}

} // namespace

// ========================================================================
// IntegrityManifest
// ========================================================================

Status IntegrityManifest::record(u64 index, u64 size, const Hash256& checksum, bool has_parity) noexcept {
    if (index >= storage::kMaxChunks) {
        return manifest_status(StatusCode::Invalid, index);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(index);
    if (it != records_.end()) {
        if (it->second.checksum == checksum && it->second.size == size) {
            return ok_status();
        }
        log_emit(LogLevel::Error, "manifest conflict for chunk %llu", static_cast<unsigned long long>(index));
        return manifest_status(StatusCode::ManifestConflict, index);
    }
    if (finalized_) {
        // A sealed manifest only accepts idempotent re-records.
        return manifest_status(StatusCode::ManifestConflict, index);
    }

    try {
        records_.emplace(index, ChunkRecord{index, size, checksum, has_parity});
    } catch (const std::bad_alloc&) {
        return manifest_status(StatusCode::Unavailable, index);
    }
    return ok_status();
}

Status IntegrityManifest::finalize(u64 total_chunks, const Hash256& stream_digest, u64 stream_size) noexcept {
    if (total_chunks == 0) {
        return manifest_status(StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (finalized_) {
        if (total_chunks_ == total_chunks && stream_digest_ == stream_digest && stream_size_ == stream_size) {
            return ok_status();
        }
        return manifest_status(StatusCode::ManifestConflict);
    }

    // Keys are ordered, so 0..n-1 dense means n entries with the last one at n-1.
    if (records_.size() != total_chunks || records_.rbegin()->first != total_chunks - 1) {
        u64 first_gap = 0;
        while (records_.count(first_gap) != 0) {
            ++first_gap;
        }
        return manifest_status(StatusCode::IncompleteManifest, first_gap);
    }

    u64 sum = 0;
    for (const auto& kv : records_) {
        sum += kv.second.size;
    }
    if (sum != stream_size) {
        return manifest_status(StatusCode::Invalid);
    }

    total_chunks_ = total_chunks;
    stream_digest_ = stream_digest;
    stream_size_ = stream_size;
    finalized_ = true;
    return ok_status();
}

std::vector<ChunkRecord> IntegrityManifest::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) {
        out.push_back(kv.second);
    }
    return out;
}

Status IntegrityManifest::find(u64 index, ChunkRecord* out) const noexcept {
    if (out == nullptr) {
        return manifest_status(StatusCode::Invalid, index);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(index);
    if (it == records_.end()) {
        return manifest_status(StatusCode::NotFound, index);
    }
    *out = it->second;
    return ok_status();
}

bool IntegrityManifest::finalized() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return finalized_;
}

u64 IntegrityManifest::total_chunks() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_chunks_;
}

u64 IntegrityManifest::stream_size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_size_;
}

Hash256 IntegrityManifest::stream_digest() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_digest_;
}

u64 IntegrityManifest::record_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

ManifestParams IntegrityManifest::params() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}

Status IntegrityManifest::encode(std::vector<u8>* out) const noexcept {
    if (out == nullptr) {
        return manifest_status(StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);

    storage::ManifestHeader h{};
    h.chunk_size = params_.chunk_size;
    h.block_size = params_.block_size;
    h.flags = finalized_ ? storage::kManifestFlagFinalized : 0u;
    h.total_chunks = total_chunks_;
    h.stream_size = stream_size_;
    h.stream_digest = stream_digest_;
    h.entry_count = records_.size();

    const u64 total = storage::kManifestHeaderBytes + static_cast<u64>(records_.size()) * storage::kManifestEntryBytes;
    if (total > 0xffffffffull) {
        return manifest_status(StatusCode::Invalid);
    }
    try {
        out->assign(static_cast<size_t>(total), 0);
    } catch (const std::bad_alloc&) {
        return manifest_status(StatusCode::Unavailable);
    }

    u8* p = out->data();
    if (storage::layout_write_manifest_header(h, BufferMut{p, storage::kManifestHeaderBytes}) == 0) {
        return manifest_status(StatusCode::Invalid);
    }
    p += storage::kManifestHeaderBytes;
    for (const auto& kv : records_) {
        if (storage::layout_write_manifest_entry(to_entry(kv.second), BufferMut{p, storage::kManifestEntryBytes}) == 0) {
            return manifest_status(StatusCode::Invalid, kv.first);
        }
        p += storage::kManifestEntryBytes;
    }
    return ok_status();
}

Status IntegrityManifest::decode(BufferView in) noexcept {
    storage::ManifestHeader h{};
    if (storage::layout_read_manifest_header(in, &h) != storage::LayoutParseResult::Ok) {
        return manifest_status(StatusCode::Invalid);
    }
    const u64 expect = storage::kManifestHeaderBytes + h.entry_count * storage::kManifestEntryBytes;
    if (h.entry_count > storage::kMaxChunks || expect != in.len) {
        return manifest_status(StatusCode::Invalid);
    }

    std::map<u64, ChunkRecord> records;
    const u8* p = in.data + storage::kManifestHeaderBytes;
    bool have_prev = false;
    u64 prev = 0;
    u64 sum = 0;
    try {
        for (u64 i = 0; i < h.entry_count; ++i) {
            storage::ManifestEntry e{};
            if (storage::layout_read_manifest_entry(BufferView{p, storage::kManifestEntryBytes}, &e) !=
                storage::LayoutParseResult::Ok) {
                return manifest_status(StatusCode::Invalid, i);
            }
            if (have_prev && e.index <= prev) {
                return manifest_status(StatusCode::Invalid, e.index);
            }
            have_prev = true;
            prev = e.index;
            sum += e.size_bytes;
            records.emplace(e.index, from_entry(e));
            p += storage::kManifestEntryBytes;
        }
    } catch (const std::bad_alloc&) {
        return manifest_status(StatusCode::Unavailable);
    }

    const bool sealed = (h.flags & storage::kManifestFlagFinalized) != 0;
    if (sealed) {
        if (records.empty() || records.rbegin()->first != h.total_chunks - 1 || sum != h.stream_size) {
            return manifest_status(StatusCode::Invalid);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    params_ = ManifestParams{h.chunk_size, h.block_size};
    records_ = std::move(records);
    finalized_ = sealed;
    total_chunks_ = h.total_chunks;
    stream_size_ = h.stream_size;
    stream_digest_ = h.stream_digest;
    return ok_status();
}

// ========================================================================
// Per-chunk checksum objects
// ========================================================================

Status manifest_encode_record(const ChunkRecord& rec, std::vector<u8>* out) noexcept {
    if (out == nullptr) {
        return manifest_status(StatusCode::Invalid);
    }
    try {
        out->assign(storage::kManifestEntryBytes, 0);
    } catch (const std::bad_alloc&) {
        return manifest_status(StatusCode::Unavailable);
    }
    if (storage::layout_write_manifest_entry(to_entry(rec), BufferMut{out->data(), storage::kManifestEntryBytes}) == 0) {
        return manifest_status(StatusCode::Invalid, rec.index);
    }
    return ok_status();
}

Status manifest_decode_record(BufferView in, ChunkRecord* out) noexcept {
    if (out == nullptr || in.len != storage::kManifestEntryBytes) {
        return manifest_status(StatusCode::Invalid);
    }
    storage::ManifestEntry e{};
    if (storage::layout_read_manifest_entry(in, &e) != storage::LayoutParseResult::Ok) {
        return manifest_status(StatusCode::Invalid);
    }
    *out = from_entry(e);
    return ok_status();
}

// ========================================================================
// Remote persistence
// ========================================================================

Status manifest_store(const IntegrityManifest& manifest,
    transfer::TransportClient& transport,
    storage::TempArea& temp,
    const transfer::RetryPolicy& retry) noexcept {
    if (!manifest.finalized()) {
        return manifest_status(StatusCode::IncompleteManifest);
    }
    try {
        std::vector<u8> bytes;
        Status s = manifest.encode(&bytes);
        if (!is_ok(s)) {
            return s;
        }
        const std::string key = storage::kManifestKey;
        const std::string path = temp.path_for(key);
        s = storage::write_file(path.c_str(), BufferView{bytes.data(), static_cast<u32>(bytes.size())}, true);
        if (!is_ok(s)) {
            return s;
        }
        s = transfer::with_retries(retry, nullptr, "upload", key, [&] { return transport.upload(path, key); });
        (void)storage::remove_file(path);
        return s;
    } catch (const std::bad_alloc&) {
        return manifest_status(StatusCode::Unavailable);
    }
}

Status manifest_load(transfer::TransportClient& transport,
    storage::TempArea& temp,
    const transfer::RetryPolicy& retry,
    IntegrityManifest* out) noexcept {
    if (out == nullptr) {
        return manifest_status(StatusCode::Invalid);
    }
    try {
        std::vector<u8> bytes;
        Status s = fetch_object(transport, temp, retry, storage::kManifestKey, &bytes);
        if (s.code == StatusCode::NotFound) {
            return manifest_status(StatusCode::IncompleteManifest);
        }
        if (!is_ok(s)) {
            return s;
        }
        s = out->decode(BufferView{bytes.data(), static_cast<u32>(bytes.size())});
        if (!is_ok(s)) {
            return s;
        }
        if (!out->finalized()) {
            return manifest_status(StatusCode::IncompleteManifest);
        }
        return ok_status();
    } catch (const std::bad_alloc&) {
        return manifest_status(StatusCode::Unavailable);
    }
}

Status manifest_scan_partial(transfer::TransportClient& transport,
    storage::TempArea& temp,
    const transfer::RetryPolicy& retry,
    IntegrityManifest* out) noexcept {
    if (out == nullptr) {
        return manifest_status(StatusCode::Invalid);
    }
    try {
        std::vector<std::string> keys;
        Status s = transfer::with_retries(retry, nullptr, "list", storage::kChunkPrefix,
            [&] { return transport.list(storage::kChunkPrefix, &keys); });
        if (!is_ok(s)) {
            return s;
        }

        const size_t suffix_len = sizeof(storage::kChecksumSuffix) - 1;
        for (const std::string& key : keys) {
            if (key.size() <= suffix_len || key.compare(key.size() - suffix_len, suffix_len, storage::kChecksumSuffix) != 0) {
                continue;
            }
            std::vector<u8> bytes;
            s = fetch_object(transport, temp, retry, key, &bytes);
            if (!is_ok(s)) {
                return s;
            }
            ChunkRecord rec{};
            s = manifest_decode_record(BufferView{bytes.data(), static_cast<u32>(bytes.size())}, &rec);
            if (!is_ok(s)) {
                log_emit(LogLevel::Warn, "skipping unreadable checksum object %s", key.c_str());
                continue;
            }
            s = out->record(rec.index, rec.size, rec.checksum, rec.has_parity);
            if (!is_ok(s)) {
                return s;
            }
        }
        return ok_status();
    } catch (const std::bad_alloc&) {
        return manifest_status(StatusCode::Unavailable);
    }
}

} // namespace chunkpipe::integrity
