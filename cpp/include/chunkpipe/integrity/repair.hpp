#pragma once

#include <string>
#include <type_traits>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/integrity/manifest.hpp"
#include "chunkpipe/integrity/redundancy.hpp"
#include "chunkpipe/transfer/retry.hpp"
#include "chunkpipe/transfer/transport.hpp"

namespace chunkpipe::storage {
    class TempArea;
}

namespace chunkpipe::integrity {

    enum class RepairOutcome : u8 {
        Repaired = 0,
        NoParityAvailable,
        Unrepairable,
    };

    struct RepairResult {
        u64 index{0};
        RepairOutcome outcome{RepairOutcome::Unrepairable};
    };

    // Rebuilds a corrupted chunk from its parity object and puts the good bytes back at
    // the destination. Safe to call for different chunks from several threads.
    class RepairEngine {
    public:
        RepairEngine(chunkpipe::transfer::TransportClient& transport,
            RedundancyEngine& redundancy,
            IntegrityManifest& manifest,
            chunkpipe::storage::TempArea& temp,
            const chunkpipe::transfer::RetryPolicy& retry) noexcept
            : transport_(transport), redundancy_(redundancy), manifest_(manifest), temp_(temp), retry_(retry) {}

        RepairEngine(const RepairEngine&) = delete;
        RepairEngine& operator=(const RepairEngine&) = delete;

        // local_copy holds the corrupted bytes, or is empty to fetch them from the destination.
        // On success it is overwritten with the repaired bytes, and the data and checksum
        // objects are uploaded again.
        //
        // Returns NoParity when the chunk has no parity object (non-fatal for verify) and
        // Unrepairable when reconstruction fails or does not match the manifest.
        [[nodiscard]] chunkpipe::core::Status repair(u64 index,
            const std::string& local_copy,
            RepairResult* out) noexcept;

    private:
        chunkpipe::transfer::TransportClient& transport_;
        RedundancyEngine& redundancy_;
        IntegrityManifest& manifest_;
        chunkpipe::storage::TempArea& temp_;
        chunkpipe::transfer::RetryPolicy retry_;
    };

    static_assert(std::is_trivially_copyable_v<RepairResult>);

} // namespace chunkpipe::integrity
