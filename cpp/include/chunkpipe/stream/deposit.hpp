#pragma once

#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/integrity/redundancy.hpp"
#include "chunkpipe/integrity/verify.hpp"
#include "chunkpipe/transfer/transport.hpp"

namespace chunkpipe::stream {

    using u32 = chunkpipe::core::u32;
    using u64 = chunkpipe::core::u64;

    struct DepositStats {
        u64 chunks{0};
        u64 bytes{0};
        u32 peak_slots{0};
        u64 peak_pending{0};  // most uploads submitted but not yet collected
        chunkpipe::core::Hash256 digest{};
        bool verified{false};
    };

    // Write path: input -> ChunkWriter -> TransferScheduler -> manifest.
    //
    // The destination must be empty (Conflict otherwise) unless purge_first is set.
    // The writer takes a slot before building each chunk, so at most jobs + 1 chunks
    // sit in the temp area. Any permanent failure cancels the run; objects already
    // stored are left in place. Unless no_check is set, a verify pass follows the
    // manifest upload.
    class DepositPipeline {
    public:
        DepositPipeline(const chunkpipe::core::PipeConfig& cfg,
            chunkpipe::transfer::TransportClient& transport,
            chunkpipe::integrity::RedundancyEngine* redundancy) noexcept
            : cfg_(cfg), transport_(transport), redundancy_(redundancy) {}

        DepositPipeline(const DepositPipeline&) = delete;
        DepositPipeline& operator=(const DepositPipeline&) = delete;

        [[nodiscard]] chunkpipe::core::Status run(int input_fd, DepositStats* stats) noexcept;

        // Filled by the post-deposit verify pass.
        [[nodiscard]] const chunkpipe::integrity::VerifyReport& verify_report() const noexcept { return report_; }

    private:
        const chunkpipe::core::PipeConfig& cfg_;
        chunkpipe::transfer::TransportClient& transport_;
        chunkpipe::integrity::RedundancyEngine* redundancy_;
        chunkpipe::integrity::VerifyReport report_{};
    };

} // namespace chunkpipe::stream
