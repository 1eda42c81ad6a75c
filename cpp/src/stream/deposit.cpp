#include "chunkpipe/stream/deposit.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <new>
#include <system_error>
#include <vector>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/integrity/manifest.hpp"
#include "chunkpipe/storage/hashing.hpp"
#include "chunkpipe/storage/temp_area.hpp"
#include "chunkpipe/stream/chunk_writer.hpp"
#include "chunkpipe/transfer/destination.hpp"
#include "chunkpipe/transfer/scheduler.hpp"
#include "chunkpipe/transfer/slot_pool.hpp"

namespace chunkpipe::stream {

using namespace chunkpipe::core;

namespace {

// Folds finished uploads into *failure and drops their futures.
void collect_finished(std::vector<std::future<TransferResult>>& pending, Status* failure) {
    auto done = std::remove_if(pending.begin(), pending.end(), [failure](std::future<TransferResult>& f) {
        if (f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }
        *failure = worse_status(*failure, f.get().status);
        return true;
    });
    pending.erase(done, pending.end());
}

} // namespace

Status DepositPipeline::run(int input_fd, DepositStats* stats) noexcept {
    if (cfg_.parity && redundancy_ == nullptr) {
        return make_status(StatusDomain::Stream, StatusCode::Invalid);
    }

    const transfer::RetryPolicy retry = transfer::retry_policy_from(cfg_);
    if (cfg_.purge_first) {
        Status s = transfer::destination_purge(transport_, retry, nullptr);
        if (!is_ok(s)) {
            return s;
        }
    }

    bool in_use = false;
    Status s = transfer::destination_in_use(transport_, retry, &in_use);
    if (!is_ok(s)) {
        log_status(LogLevel::Error, "list destination", s);
        return s;
    }
    if (in_use) {
        log_emit(LogLevel::Error, "destination %s is not empty (use --purge-first to clear it)", cfg_.destination.c_str());
        return make_status(StatusDomain::Stream, StatusCode::Conflict);
    }

    storage::TempArea temp;
    s = temp.open(cfg_.temp_dir, cfg_.temp_check_free_space);
    if (!is_ok(s)) {
        log_status(LogLevel::Error, "temp area", s);
        return s;
    }

    try {
        integrity::IntegrityManifest manifest(integrity::ManifestParams{cfg_.chunk_size, cfg_.block_size});
        transfer::SlotPool slots(config_slot_capacity(cfg_));
        transfer::TransferScheduler scheduler(transport_, slots, manifest, temp, transfer::scheduler_options_from(cfg_),
            redundancy_, nullptr);
        ChunkWriter writer(temp, cfg_.chunk_size, cfg_.block_size);

        std::vector<std::future<TransferResult>> uploads;
        Status failure = ok_status();
        u64 peak_pending = 0;

        for (;;) {
            transfer::SlotLease lease;
            s = slots.acquire(&lease);
            if (!is_ok(s)) {
                failure = s;
                break;
            }
            collect_finished(uploads, &failure);
            if (!is_ok(failure)) {
                break;
            }

            ChunkDescriptor chunk;
            bool eos = false;
            s = writer.next_chunk(input_fd, &chunk, &eos);
            if (!is_ok(s)) {
                failure = s;
                scheduler.cancel();
                break;
            }
            if (eos) {
                break;
            }
            chunk.has_parity = cfg_.parity;
            log_emit(LogLevel::Info, "Sending chunk %llu [%llu bytes so far]", static_cast<unsigned long long>(chunk.index),
                static_cast<unsigned long long>(writer.bytes_read()));
            uploads.push_back(scheduler.submit_upload(std::move(chunk), std::move(lease)));
            peak_pending = std::max<u64>(peak_pending, uploads.size());
        }

        for (auto& f : uploads) {
            const TransferResult r = f.get();
            failure = worse_status(failure, r.status);
        }
        if (!is_ok(failure)) {
            log_status(LogLevel::Error, "deposit", failure);
            return failure;
        }

        const Hash256 digest = writer.stream_digest();
        s = manifest.finalize(writer.chunks_built(), digest, writer.bytes_read());
        if (is_ok(s)) {
            s = integrity::manifest_store(manifest, transport_, temp, retry);
        }
        if (!is_ok(s)) {
            log_status(LogLevel::Error, "store manifest", s);
            return s;
        }

        char hex[65];
        storage::hash_to_hex(digest, hex, sizeof(hex));
        log_emit(LogLevel::Info, "Wrote %llu bytes in %llu chunks, blake3 %s",
            static_cast<unsigned long long>(writer.bytes_read()), static_cast<unsigned long long>(writer.chunks_built()),
            hex);

        if (stats != nullptr) {
            stats->chunks = writer.chunks_built();
            stats->bytes = writer.bytes_read();
            stats->peak_slots = slots.peak();
            stats->peak_pending = peak_pending;
            stats->digest = digest;
            stats->verified = false;
        }

        if (cfg_.no_check) {
            return ok_status();
        }

        integrity::VerifyEngine verifier(scheduler, slots);
        s = verifier.verify(manifest, &report_);
        if (!is_ok(s)) {
            return s;
        }
        if (stats != nullptr) {
            stats->verified = report_.ok;
        }
        return integrity::verify_report_status(report_);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Stream, StatusCode::Unavailable);
    } catch (const std::system_error&) {
        return make_status(StatusDomain::Transfer, StatusCode::Unavailable);
    }
}

} // namespace chunkpipe::stream
