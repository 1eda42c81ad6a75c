#pragma once

#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/integrity/manifest.hpp"
#include "chunkpipe/integrity/redundancy.hpp"
#include "chunkpipe/transfer/scheduler.hpp"
#include "chunkpipe/transfer/slot_pool.hpp"
#include "chunkpipe/transfer/transport.hpp"

namespace chunkpipe::stream {

    using u64 = chunkpipe::core::u64;

    struct ReplayStats {
        u64 chunks{0};
        u64 bytes{0};
        u64 repaired{0};
        chunkpipe::core::Hash256 digest{};
    };

    // Writes a stored stream back out in index order. Downloads run on the scheduler,
    // at most one per free slot; the lease for a chunk is held until its bytes have
    // been written to the output.
    class ReplayEngine {
    public:
        ReplayEngine(chunkpipe::transfer::TransferScheduler& scheduler, chunkpipe::transfer::SlotPool& slots) noexcept
            : scheduler_(scheduler), slots_(slots) {}

        ReplayEngine(const ReplayEngine&) = delete;
        ReplayEngine& operator=(const ReplayEngine&) = delete;

        // manifest must be finalized. A chunk that fails its checksum and cannot be
        // repaired ends the replay with ChecksumMismatch (aux = index); a whole-stream
        // digest or size mismatch uses aux = kWholeStream.
        [[nodiscard]] chunkpipe::core::Status replay(const chunkpipe::integrity::IntegrityManifest& manifest,
            int output_fd,
            ReplayStats* stats) noexcept;

    private:
        chunkpipe::transfer::TransferScheduler& scheduler_;
        chunkpipe::transfer::SlotPool& slots_;
    };

    // Loads the destination's manifest into a fresh temp area and replays it to output_fd.
    [[nodiscard]] chunkpipe::core::Status replay_destination(const chunkpipe::core::PipeConfig& cfg,
        chunkpipe::transfer::TransportClient& transport,
        chunkpipe::integrity::RedundancyEngine* redundancy,
        int output_fd,
        ReplayStats* stats) noexcept;

} // namespace chunkpipe::stream
