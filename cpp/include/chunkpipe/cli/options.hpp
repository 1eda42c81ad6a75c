#pragma once

#include <type_traits>

#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"

namespace chunkpipe::cli {
    using u8 = chunkpipe::core::u8;
    using u32 = chunkpipe::core::u32;
    using u64 = chunkpipe::core::u64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        Size = 2,   // unsigned, optional K/M/G suffix (powers of 1024)
        Count = 3,  // unsigned, no suffix
    };

    enum class OptionId : u32 {
        None = 0,
        ChunkSize,
        BlockSize,
        TempDir,
        TempBudget,
        Replay,
        Verify,
        Purge,
        PurgeFirst,
        Jobs,
        NoCheck,
        Parity,
        Repair,
        Retries,
        RetryBackoffMs,
        Backend,
        Verbose,
        Quiet,
        Help,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        u64 u64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // The chunkpipe option table. --PAR and --parity are the same option.
    extern const OptionSpec kPipeOptions[];
    extern const u32 kPipeOptionCount;

    // Parses leading options of args, stopping at the first non-option or after "--".
    // *consumed receives the number of argv entries used.
    [[nodiscard]] chunkpipe::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // "8388608", "8M", "64k", "1G".
    [[nodiscard]] bool parse_size(const char* s, u64* out) noexcept;

    // Applies parsed options on top of *cfg. Later options win.
    [[nodiscard]] chunkpipe::core::Status apply_options(const ParsedOptions& opts, chunkpipe::core::PipeConfig* cfg) noexcept;

    // Full command line (argv[0] excluded): options in any position around exactly one
    // destination. *help is set for -h/--help, in which case no destination is required.
    // --purge is a mode of its own; --purge-first clears DEST before a deposit.
    [[nodiscard]] chunkpipe::core::Status parse_command_line(const CliArgs& args,
        chunkpipe::core::PipeConfig* cfg,
        bool* help) noexcept;

    [[nodiscard]] const char* usage_text() noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace chunkpipe::cli
