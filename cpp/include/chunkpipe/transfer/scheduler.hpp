#pragma once

#include <atomic>
#include <functional>
#include <future>

#include "chunkpipe/core/chunk.hpp"
#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/integrity/manifest.hpp"
#include "chunkpipe/transfer/retry.hpp"
#include "chunkpipe/transfer/slot_pool.hpp"
#include "chunkpipe/transfer/transport.hpp"
#include "chunkpipe/transfer/worker_pool.hpp"

namespace chunkpipe::storage {
    class TempArea;
}

namespace chunkpipe::integrity {
    class RedundancyEngine;
    class RepairEngine;
}

namespace chunkpipe::transfer {

    struct SchedulerOptions {
        u32 jobs{chunkpipe::core::kDefaultJobs};
        u32 block_size{chunkpipe::core::kDefaultBlockSize};
        bool no_check{false};
        bool parity{false};
        RetryPolicy retry{};
    };

    [[nodiscard]] SchedulerOptions scheduler_options_from(const chunkpipe::core::PipeConfig& cfg) noexcept;

    using DownloadCallback = std::function<void(const chunkpipe::core::TransferResult&)>;

    // Runs chunk transfers on a pool of `jobs` workers. Slots come from the caller's
    // SlotPool; a lease handed to a task is released only after the task has either
    // finished with its temp file or failed for good.
    //
    // redundancy is required when parity is on. repair, when set, is consulted for
    // downloaded or checked chunks whose checksum does not match.
    class TransferScheduler {
    public:
        TransferScheduler(TransportClient& transport,
            SlotPool& slots,
            chunkpipe::integrity::IntegrityManifest& manifest,
            chunkpipe::storage::TempArea& temp,
            const SchedulerOptions& options,
            chunkpipe::integrity::RedundancyEngine* redundancy = nullptr,
            chunkpipe::integrity::RepairEngine* repair = nullptr);

        TransferScheduler(const TransferScheduler&) = delete;
        TransferScheduler& operator=(const TransferScheduler&) = delete;

        // Uploads the data object, then the parity object (parity mode) and the checksum
        // object, records the chunk in the manifest and deletes its temp file.
        // A permanent failure cancels the run.
        [[nodiscard]] std::future<chunkpipe::core::TransferResult> submit_upload(chunkpipe::core::ChunkDescriptor chunk,
            SlotLease lease);

        // Downloads into the temp area and checks the bytes against rec. on_complete runs
        // on the worker thread for every outcome; the file at result.local_path then
        // belongs to the receiver. The caller keeps the chunk's lease until it is consumed.
        [[nodiscard]] std::future<chunkpipe::core::TransferResult> submit_download(const chunkpipe::integrity::ChunkRecord& rec,
            DownloadCallback on_complete);

        // Compares the stored object with rec using head_checksum, or a temp download when
        // the backend has no checksum. Failures never cancel the run.
        [[nodiscard]] std::future<chunkpipe::core::TransferResult> submit_check(const chunkpipe::integrity::ChunkRecord& rec,
            SlotLease lease);

        // Queued work finishes with Cancelled without touching the transport; blocked slot
        // waiters wake up.
        void cancel() noexcept;
        [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

        [[nodiscard]] const SchedulerOptions& options() const noexcept { return options_; }

    private:
        chunkpipe::core::TransferResult run_upload(chunkpipe::core::ChunkDescriptor& chunk) noexcept;
        chunkpipe::core::TransferResult run_download(const chunkpipe::integrity::ChunkRecord& rec) noexcept;
        chunkpipe::core::TransferResult run_check(const chunkpipe::integrity::ChunkRecord& rec) noexcept;

        chunkpipe::core::Status upload_parity(const chunkpipe::core::ChunkDescriptor& chunk) noexcept;
        chunkpipe::core::Status upload_checksum(const chunkpipe::integrity::ChunkRecord& rec) noexcept;

        // Hands a mismatched chunk to the repair engine and fills r accordingly.
        void try_repair(const std::string& local_copy, chunkpipe::core::TransferResult* r) noexcept;

        TransportClient& transport_;
        SlotPool& slots_;
        chunkpipe::integrity::IntegrityManifest& manifest_;
        chunkpipe::storage::TempArea& temp_;
        SchedulerOptions options_;
        chunkpipe::integrity::RedundancyEngine* redundancy_;
        chunkpipe::integrity::RepairEngine* repair_;
        std::atomic<bool> cancelled_{false};
        WorkerPool workers_;
    };

} // namespace chunkpipe::transfer
