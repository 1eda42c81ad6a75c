#include "chunkpipe/transfer/scheduler.hpp"

#include <new>
#include <vector>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/integrity/redundancy.hpp"
#include "chunkpipe/integrity/repair.hpp"
#include "chunkpipe/storage/file_io.hpp"
#include "chunkpipe/storage/hashing.hpp"
#include "chunkpipe/storage/layout.hpp"
#include "chunkpipe/storage/temp_area.hpp"

namespace chunkpipe::transfer {

using namespace chunkpipe::core;
using chunkpipe::integrity::ChunkRecord;
using chunkpipe::storage::BufferView;

namespace {

Status transfer_status(StatusCode code, u64 index) {
    return make_status(StatusDomain::Transfer, code, static_cast<u32>(index));
}

Status mismatch_status(u64 index) {
    return make_status(StatusDomain::Integrity, StatusCode::ChecksumMismatch, static_cast<u32>(index));
}

} // namespace

SchedulerOptions scheduler_options_from(const PipeConfig& cfg) noexcept {
    SchedulerOptions o{};
    o.jobs = cfg.jobs;
    o.block_size = cfg.block_size;
    o.no_check = cfg.no_check;
    o.parity = cfg.parity;
    o.retry = retry_policy_from(cfg);
    return o;
}

TransferScheduler::TransferScheduler(TransportClient& transport,
    SlotPool& slots,
    integrity::IntegrityManifest& manifest,
    storage::TempArea& temp,
    const SchedulerOptions& options,
    integrity::RedundancyEngine* redundancy,
    integrity::RepairEngine* repair)
    : transport_(transport),
      slots_(slots),
      manifest_(manifest),
      temp_(temp),
      options_(options),
      redundancy_(redundancy),
      repair_(repair),
      workers_(options.jobs) {}

void TransferScheduler::cancel() noexcept {
    if (!cancelled_.exchange(true, std::memory_order_acq_rel)) {
        log_emit(LogLevel::Debug, "transfer scheduler cancelled");
    }
    slots_.cancel();
}

// ========================================================================
// Submission
// ========================================================================

std::future<TransferResult> TransferScheduler::submit_upload(ChunkDescriptor chunk, SlotLease lease) {
    return workers_.submit([this, chunk = std::move(chunk), lease = std::move(lease)]() mutable {
        TransferResult r = run_upload(chunk);
        if (!is_ok(r.status) && r.status.code != StatusCode::Cancelled) {
            // Cancel before the slot goes back so the writer cannot start another chunk.
            cancel();
        }
        lease.release();
        return r;
    });
}

std::future<TransferResult> TransferScheduler::submit_download(const ChunkRecord& rec, DownloadCallback on_complete) {
    return workers_.submit([this, rec, on_complete = std::move(on_complete)] {
        TransferResult r = run_download(rec);
        if (on_complete) {
            on_complete(r);
        }
        return r;
    });
}

std::future<TransferResult> TransferScheduler::submit_check(const ChunkRecord& rec, SlotLease lease) {
    return workers_.submit([this, rec, lease = std::move(lease)]() mutable {
        TransferResult r = run_check(rec);
        lease.release();
        return r;
    });
}

// ========================================================================
// Upload
// ========================================================================

TransferResult TransferScheduler::run_upload(ChunkDescriptor& chunk) noexcept {
    TransferResult r{};
    r.index = chunk.index;
    r.size = chunk.size;
    r.checksum = chunk.checksum;
    r.state = chunk.state;

    if (cancelled()) {
        (void)storage::remove_file(chunk.local_path);
        r.status = transfer_status(StatusCode::Cancelled, chunk.index);
        return r;
    }

    try {
        const std::string key = storage::layout_data_key(chunk.index);
        chunk.state = ChunkState::Uploading;
        log_emit(LogLevel::Debug, "uploading %s (%llu bytes)", key.c_str(), static_cast<unsigned long long>(chunk.size));

        Status s = with_retries(options_.retry, &cancelled_, "upload", key,
            [&] { return transport_.upload(chunk.local_path, key); });
        if (is_ok(s) && options_.parity) {
            s = upload_parity(chunk);
            chunk.has_parity = is_ok(s);
        }

        const ChunkRecord rec{chunk.index, chunk.size, chunk.checksum, chunk.has_parity};
        if (is_ok(s)) {
            s = upload_checksum(rec);
        }
        if (is_ok(s)) {
            s = manifest_.record(rec.index, rec.size, rec.checksum, rec.has_parity);
        }

        (void)storage::remove_file(chunk.local_path);
        if (!is_ok(s)) {
            log_status(LogLevel::Error, key.c_str(), s);
            r.status = s;
            return r;
        }
        chunk.state = ChunkState::Uploaded;
        r.state = chunk.state;
        return r;
    } catch (const std::bad_alloc&) {
        (void)storage::remove_file(chunk.local_path);
        r.status = transfer_status(StatusCode::Unavailable, chunk.index);
        return r;
    }
}

Status TransferScheduler::upload_parity(const ChunkDescriptor& chunk) noexcept {
    if (redundancy_ == nullptr) {
        return make_status(StatusDomain::Redundancy, StatusCode::Invalid, static_cast<u32>(chunk.index));
    }
    try {
        std::vector<u8> bytes;
        std::vector<u8> parity;
        Status s = storage::read_file(chunk.local_path.c_str(), &bytes);
        if (!is_ok(s)) {
            return s;
        }
        s = redundancy_->encode(BufferView{bytes.data(), static_cast<u32>(bytes.size())}, &parity);
        if (!is_ok(s)) {
            return s;
        }
        const std::string key = storage::layout_parity_key(chunk.index);
        const std::string path = temp_.path_for(key);
        s = storage::write_file(path.c_str(), BufferView{parity.data(), static_cast<u32>(parity.size())}, true);
        if (is_ok(s)) {
            s = with_retries(options_.retry, &cancelled_, "upload", key, [&] { return transport_.upload(path, key); });
        }
        (void)storage::remove_file(path);
        return s;
    } catch (const std::bad_alloc&) {
        return transfer_status(StatusCode::Unavailable, chunk.index);
    }
}

Status TransferScheduler::upload_checksum(const ChunkRecord& rec) noexcept {
    try {
        std::vector<u8> body;
        Status s = integrity::manifest_encode_record(rec, &body);
        if (!is_ok(s)) {
            return s;
        }
        const std::string key = storage::layout_checksum_key(rec.index);
        const std::string path = temp_.path_for(key);
        s = storage::write_file(path.c_str(), BufferView{body.data(), static_cast<u32>(body.size())}, false);
        if (is_ok(s)) {
            s = with_retries(options_.retry, &cancelled_, "upload", key, [&] { return transport_.upload(path, key); });
        }
        (void)storage::remove_file(path);
        return s;
    } catch (const std::bad_alloc&) {
        return transfer_status(StatusCode::Unavailable, rec.index);
    }
}

// ========================================================================
// Download / check
// ========================================================================

void TransferScheduler::try_repair(const std::string& local_copy, TransferResult* r) noexcept {
    r->state = ChunkState::Mismatched;
    r->status = mismatch_status(r->index);
    if (repair_ == nullptr) {
        log_emit(LogLevel::Error, "checksum mismatch in chunk %llu", static_cast<unsigned long long>(r->index));
        return;
    }

    r->state = ChunkState::Repairing;
    integrity::RepairResult rr{};
    const Status s = repair_->repair(r->index, local_copy, &rr);
    switch (rr.outcome) {
    case integrity::RepairOutcome::Repaired:
        r->state = ChunkState::Repaired;
        r->status = ok_status();
        r->repaired = true;
        break;
    case integrity::RepairOutcome::NoParityAvailable:
        // Still a plain mismatch; NoParity itself is informational.
        r->state = ChunkState::Mismatched;
        break;
    case integrity::RepairOutcome::Unrepairable:
        r->state = ChunkState::Unrepairable;
        r->status = s.code == StatusCode::Unrepairable ? s : worse_status(r->status, s);
        break;
    }
}

TransferResult TransferScheduler::run_download(const ChunkRecord& rec) noexcept {
    TransferResult r{};
    r.index = rec.index;
    r.size = rec.size;
    r.checksum = rec.checksum;
    r.state = ChunkState::Listed;

    if (cancelled()) {
        r.status = transfer_status(StatusCode::Cancelled, rec.index);
        return r;
    }

    try {
        const std::string key = storage::layout_data_key(rec.index);
        const std::string path = temp_.path_for(key);
        r.state = ChunkState::Downloading;

        Status s = with_retries(options_.retry, &cancelled_, "download", key,
            [&] { return transport_.download(key, path); });
        if (!is_ok(s)) {
            (void)storage::remove_file(path);
            log_status(LogLevel::Error, key.c_str(), s);
            // aux names the chunk; the transport's errno is in the log line above.
            r.status = make_status(s.domain, s.code, static_cast<u32>(rec.index));
            return r;
        }
        r.state = ChunkState::Downloaded;
        r.local_path = path;

        if (options_.no_check) {
            return r;
        }

        Hash256 got{};
        u64 size = 0;
        s = storage::hash_file(path.c_str(), options_.block_size, &got, &size);
        if (!is_ok(s)) {
            (void)storage::remove_file(path);
            r.local_path.clear();
            r.status = s;
            return r;
        }
        if (got == rec.checksum && size == rec.size) {
            r.state = ChunkState::Verified;
            return r;
        }

        try_repair(path, &r);
        if (!is_ok(r.status)) {
            (void)storage::remove_file(path);
            r.local_path.clear();
        }
        return r;
    } catch (const std::bad_alloc&) {
        r.status = transfer_status(StatusCode::Unavailable, rec.index);
        return r;
    }
}

TransferResult TransferScheduler::run_check(const ChunkRecord& rec) noexcept {
    TransferResult r{};
    r.index = rec.index;
    r.size = rec.size;
    r.state = ChunkState::Listed;

    if (cancelled()) {
        r.status = transfer_status(StatusCode::Cancelled, rec.index);
        return r;
    }

    try {
        const std::string key = storage::layout_data_key(rec.index);
        bool present = false;
        Status s = with_retries(options_.retry, &cancelled_, "head", key,
            [&] { return transport_.head_checksum(key, &r.checksum, &present); });

        std::string path;
        if (is_ok(s) && !present) {
            path = temp_.path_for(key + ".check");
            s = with_retries(options_.retry, &cancelled_, "download", key,
                [&] { return transport_.download(key, path); });
            if (is_ok(s)) {
                r.state = ChunkState::Downloaded;
                s = storage::hash_file(path.c_str(), options_.block_size, &r.checksum, &r.size);
            }
        }
        if (!is_ok(s)) {
            if (!path.empty()) {
                (void)storage::remove_file(path);
            }
            r.status = s.code == StatusCode::NotFound
                           ? make_status(StatusDomain::Integrity, StatusCode::NotFound, static_cast<u32>(rec.index))
                           : s;
            return r;
        }

        if (r.checksum == rec.checksum && r.size == rec.size) {
            r.state = ChunkState::Verified;
        } else {
            log_emit(LogLevel::Warn, "chunk %llu does not match its manifest record",
                static_cast<unsigned long long>(rec.index));
            try_repair(path, &r);
        }
        if (!path.empty()) {
            (void)storage::remove_file(path);
        }
        return r;
    } catch (const std::bad_alloc&) {
        r.status = transfer_status(StatusCode::Unavailable, rec.index);
        return r;
    }
}

} // namespace chunkpipe::transfer
