#pragma once

#include <vector>

#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/integrity/manifest.hpp"
#include "chunkpipe/integrity/redundancy.hpp"
#include "chunkpipe/transfer/scheduler.hpp"
#include "chunkpipe/transfer/slot_pool.hpp"
#include "chunkpipe/transfer/transport.hpp"

namespace chunkpipe::integrity {

    struct VerifyReport {
        bool ok{false};
        u64 checked{0};
        std::vector<u64> mismatched;    // still wrong after any repair attempt
        std::vector<u64> missing;
        std::vector<u64> repaired;
        std::vector<u64> unrepairable;
        std::vector<u64> failed;        // transport errors; state unknown
    };

    // Checks every stored chunk against the manifest without writing any output.
    // Best effort: one chunk's failure does not stop the pass. Remote objects are
    // only rewritten when the scheduler was given a repair engine.
    class VerifyEngine {
    public:
        VerifyEngine(chunkpipe::transfer::TransferScheduler& scheduler, chunkpipe::transfer::SlotPool& slots) noexcept
            : scheduler_(scheduler), slots_(slots) {}

        VerifyEngine(const VerifyEngine&) = delete;
        VerifyEngine& operator=(const VerifyEngine&) = delete;

        // Status reflects whether the pass ran (IncompleteManifest, Cancelled, ...);
        // report->ok tells whether the stored data is intact.
        [[nodiscard]] chunkpipe::core::Status verify(const IntegrityManifest& manifest, VerifyReport* report) noexcept;

    private:
        chunkpipe::transfer::TransferScheduler& scheduler_;
        chunkpipe::transfer::SlotPool& slots_;
    };

    // Loads the destination's manifest into a fresh temp area and verifies it.
    [[nodiscard]] chunkpipe::core::Status verify_destination(const chunkpipe::core::PipeConfig& cfg,
        chunkpipe::transfer::TransportClient& transport,
        RedundancyEngine* redundancy,
        VerifyReport* report) noexcept;

    // Worst status implied by a report: Ok, ChecksumMismatch, Unrepairable, NotFound or Transport.
    [[nodiscard]] chunkpipe::core::Status verify_report_status(const VerifyReport& report) noexcept;

} // namespace chunkpipe::integrity
