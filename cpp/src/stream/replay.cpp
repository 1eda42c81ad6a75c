#include "chunkpipe/stream/replay.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <new>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/integrity/repair.hpp"
#include "chunkpipe/storage/file_io.hpp"
#include "chunkpipe/storage/hashing.hpp"
#include "chunkpipe/storage/temp_area.hpp"
#include "chunkpipe/stream/reorder_buffer.hpp"

namespace chunkpipe::stream {

using namespace chunkpipe::core;
using chunkpipe::integrity::ChunkRecord;

namespace {

// Copies one downloaded chunk to the output and feeds it to the stream digest.
Status emit_chunk(const std::string& path, int output_fd, std::vector<u8>& block,
    storage::StreamHasher& hasher, u64* emitted) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return storage::errno_status(StatusDomain::Stream, errno);
    }
    Status s = ok_status();
    for (;;) {
        size_t n = 0;
        s = storage::read_full(fd, block.data(), block.size(), &n);
        if (!is_ok(s) || n == 0) break;
        hasher.update(block.data(), n);
        s = storage::write_all(output_fd, block.data(), n);
        if (!is_ok(s)) break;
        *emitted += n;
        if (n < block.size()) break;
    }
    ::close(fd);
    return s;
}

} // namespace

Status ReplayEngine::replay(const integrity::IntegrityManifest& manifest, int output_fd, ReplayStats* stats) noexcept {
    if (!manifest.finalized()) {
        return make_status(StatusDomain::Manifest, StatusCode::IncompleteManifest);
    }
    const bool no_check = scheduler_.options().no_check;

    try {
        const std::vector<ChunkRecord> records = manifest.records();
        const u64 total = records.size();

        std::vector<u8> block(scheduler_.options().block_size == 0 ? 1 : scheduler_.options().block_size);
        storage::StreamHasher hasher;
        ReorderBuffer reorder;
        std::map<u64, transfer::SlotLease> leases;
        std::vector<std::future<TransferResult>> inflight;

        u64 issued = 0;
        u64 emitted_bytes = 0;
        u64 repaired = 0;
        Status failure = ok_status();

        while (reorder.next_index() < total) {
            // Results travel through the reorder buffer; finished futures are only dropped.
            inflight.erase(std::remove_if(inflight.begin(), inflight.end(),
                               [](const std::future<TransferResult>& f) {
                                   return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                               }),
                inflight.end());

            transfer::SlotLease lease;
            while (issued < total && slots_.try_acquire(&lease)) {
                const ChunkRecord& rec = records[static_cast<size_t>(issued)];
                leases.emplace(rec.index, std::move(lease));
                inflight.push_back(scheduler_.submit_download(rec,
                    [&reorder](const TransferResult& r) { reorder.push(r); }));
                ++issued;
            }

            TransferResult r{};
            if (!reorder.wait_next(&r)) {
                failure = make_status(StatusDomain::Stream, StatusCode::Cancelled);
                break;
            }
            if (!is_ok(r.status)) {
                failure = r.status;
                break;
            }

            log_emit(LogLevel::Info, "Retrieving %llu/%llu", static_cast<unsigned long long>(r.index + 1),
                static_cast<unsigned long long>(total));
            failure = emit_chunk(r.local_path, output_fd, block, hasher, &emitted_bytes);
            (void)storage::remove_file(r.local_path);
            leases.erase(r.index);
            if (!is_ok(failure)) {
                log_status(LogLevel::Error, "write output", failure);
                break;
            }
            if (r.repaired) {
                ++repaired;
            }
        }

        if (!is_ok(failure)) {
            scheduler_.cancel();
            reorder.cancel();
        }
        for (auto& f : inflight) {
            f.wait();
        }
        for (const TransferResult& left : reorder.drain()) {
            if (!left.local_path.empty()) {
                (void)storage::remove_file(left.local_path);
            }
        }
        leases.clear();

        if (!is_ok(failure)) {
            if (failure.code == StatusCode::ChecksumMismatch) {
                log_emit(LogLevel::Error, "checksum mismatch in chunk %u", failure.aux);
            }
            return failure;
        }

        const Hash256 digest = hasher.finish();
        if (stats != nullptr) {
            stats->chunks = total;
            stats->bytes = emitted_bytes;
            stats->repaired = repaired;
            stats->digest = digest;
        }

        if (digest != manifest.stream_digest() || emitted_bytes != manifest.stream_size()) {
            if (no_check) {
                log_emit(LogLevel::Warn, "stream digest differs from the manifest (integrity checks disabled)");
                return ok_status();
            }
            log_emit(LogLevel::Error, "stream digest differs from the manifest");
            return make_status(StatusDomain::Stream, StatusCode::ChecksumMismatch, kWholeStream);
        }
        return ok_status();
    } catch (const std::bad_alloc&) {
        scheduler_.cancel();
        return make_status(StatusDomain::Stream, StatusCode::Unavailable);
    }
}

Status replay_destination(const PipeConfig& cfg,
    transfer::TransportClient& transport,
    integrity::RedundancyEngine* redundancy,
    int output_fd,
    ReplayStats* stats) noexcept {
    storage::TempArea temp;
    Status s = temp.open(cfg.temp_dir, cfg.temp_check_free_space);
    if (!is_ok(s)) {
        log_status(LogLevel::Error, "temp area", s);
        return s;
    }

    const transfer::RetryPolicy retry = transfer::retry_policy_from(cfg);
    integrity::IntegrityManifest manifest;
    s = integrity::manifest_load(transport, temp, retry, &manifest);
    if (s.code == StatusCode::IncompleteManifest) {
        integrity::IntegrityManifest partial;
        if (is_ok(integrity::manifest_scan_partial(transport, temp, retry, &partial))) {
            log_emit(LogLevel::Error, "no complete manifest at destination (%llu chunk records found)",
                static_cast<unsigned long long>(partial.record_count()));
        }
        return s;
    }
    if (!is_ok(s)) {
        log_status(LogLevel::Error, "load manifest", s);
        return s;
    }

    try {
        transfer::SlotPool slots(config_slot_capacity(cfg));
        std::unique_ptr<integrity::RepairEngine> repair;
        if (cfg.repair && redundancy != nullptr && !cfg.no_check) {
            repair = std::make_unique<integrity::RepairEngine>(transport, *redundancy, manifest, temp, retry);
        }
        transfer::TransferScheduler scheduler(transport, slots, manifest, temp, transfer::scheduler_options_from(cfg),
            redundancy, repair.get());
        ReplayEngine engine(scheduler, slots);
        s = engine.replay(manifest, output_fd, stats);
    } catch (const std::bad_alloc&) {
        s = make_status(StatusDomain::Stream, StatusCode::Unavailable);
    } catch (const std::system_error&) {
        // std::thread creation failed.
        s = make_status(StatusDomain::Transfer, StatusCode::Unavailable);
    }
    return s;
}

} // namespace chunkpipe::stream
