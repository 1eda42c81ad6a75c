#pragma once

#include <string>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/log.hpp"
#include "chunkpipe/core/types.hpp"

namespace chunkpipe::core {

    inline constexpr u64 kDefaultChunkSize = u64{1} << 23;  // 8 MiB
    inline constexpr u32 kDefaultBlockSize = u32{1} << 16;  // 64 KiB
    inline constexpr u64 kMaxChunkSize = u64{1} << 30;
    inline constexpr u32 kDefaultJobs = 2;
    inline constexpr u32 kDefaultRetries = 10;
    inline constexpr u32 kDefaultRetryBackoffMs = 200;
    inline constexpr u32 kDefaultRetryBackoffMaxMs = 5000;

    enum class PipeMode : u8 {
        Deposit = 0,
        Replay,
        Verify,
        Purge,
    };

    enum class BackendKind : u8 {
        Auto = 0,
        Local,
        Rclone,
    };

    struct PipeConfig {
        std::string destination;
        u64 chunk_size{kDefaultChunkSize};
        u32 block_size{kDefaultBlockSize};
        std::string temp_dir;
        u64 temp_budget_bytes{0};       // 0 = limited only by jobs + 1
        bool temp_check_free_space{true};
        PipeMode mode{PipeMode::Deposit};
        u32 jobs{kDefaultJobs};
        bool no_check{false};
        bool parity{false};
        bool repair{false};
        bool purge_first{false};
        u32 transport_retries{kDefaultRetries};
        u32 retry_backoff_ms{kDefaultRetryBackoffMs};
        u32 retry_backoff_max_ms{kDefaultRetryBackoffMaxMs};
        BackendKind backend{BackendKind::Auto};
        LogLevel log_level{LogLevel::Info};
    };

    // Defaults plus $TMPDIR for the temp area.
    [[nodiscard]] PipeConfig config_defaults();

    // Rejects impossible sizes, verify/repair combined with no-check (Incompatible),
    // and a temp budget that cannot hold one chunk (TempSpace).
    [[nodiscard]] Status config_validate(const PipeConfig& cfg) noexcept;

    // Number of chunk slots: jobs + 1, reduced to what the temp budget can hold.
    [[nodiscard]] u32 config_slot_capacity(const PipeConfig& cfg) noexcept;

    // Resolves BackendKind::Auto: "remote:path" selects rclone, anything else is a local directory.
    [[nodiscard]] BackendKind config_resolve_backend(const PipeConfig& cfg) noexcept;

} // namespace chunkpipe::core
