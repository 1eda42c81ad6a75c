#include "chunkpipe/cli/options.hpp"

#include <charconv>
#include <cstring>
#include <limits>

namespace chunkpipe::cli {
    namespace {
        using chunkpipe::core::Status;
        using chunkpipe::core::StatusCode;
        using chunkpipe::core::StatusDomain;

        constexpr u32 kMaxParsedPerRun = 64;

        [[nodiscard]] Status usage_error() noexcept {
            return chunkpipe::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_count(const char* s, u64* out) noexcept {
            if (out == nullptr || s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            u64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Converts value according to spec->type into opt.
        [[nodiscard]] bool parse_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
            case OptionType::String:
                if (value == nullptr || *value == '\0') {
                    return false;
                }
                opt->value.str = value;
                return true;
            case OptionType::Size:
                return parse_size(value, &opt->value.u64v);
            case OptionType::Count:
                return parse_count(value, &opt->value.u64v);
            case OptionType::Flag:
                break;
            }
            return false;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return usage_error();
            }
            out->data[out->len++] = opt;
            return chunkpipe::core::ok_status();
        }

        [[nodiscard]] bool to_u32(u64 v, u32* out) noexcept {
            if (v > std::numeric_limits<u32>::max()) {
                return false;
            }
            *out = static_cast<u32>(v);
            return true;
        }

        [[nodiscard]] Status set_mode(chunkpipe::core::PipeConfig* cfg, chunkpipe::core::PipeMode mode) noexcept {
            using chunkpipe::core::PipeMode;
            if (cfg->mode == PipeMode::Deposit || cfg->mode == mode) {
                cfg->mode = mode;
                return chunkpipe::core::ok_status();
            }
            // --replay --verify only checks the stored stream, in either order.
            const bool replay_verify = (cfg->mode == PipeMode::Replay && mode == PipeMode::Verify) ||
                                       (cfg->mode == PipeMode::Verify && mode == PipeMode::Replay);
            if (replay_verify) {
                cfg->mode = PipeMode::Verify;
                return chunkpipe::core::ok_status();
            }
            return usage_error();
        }
    } // namespace

    const OptionSpec kPipeOptions[] = {
        {OptionId::ChunkSize, OptionType::Size, "chunksize", 'c'},
        {OptionId::BlockSize, OptionType::Size, "blocksize", 'b'},
        {OptionId::TempDir, OptionType::String, "tempdir", 't'},
        {OptionId::TempBudget, OptionType::Size, "temp-budget", '\0'},
        {OptionId::Replay, OptionType::Flag, "replay", 'r'},
        {OptionId::Verify, OptionType::Flag, "verify", '\0'},
        {OptionId::Purge, OptionType::Flag, "purge", '\0'},
        {OptionId::PurgeFirst, OptionType::Flag, "purge-first", '\0'},
        {OptionId::Jobs, OptionType::Count, "jobs", 'j'},
        {OptionId::NoCheck, OptionType::Flag, "nocheck", 'n'},
        {OptionId::Parity, OptionType::Flag, "PAR", '\0'},
        {OptionId::Parity, OptionType::Flag, "parity", '\0'},
        {OptionId::Repair, OptionType::Flag, "repair", '\0'},
        {OptionId::Retries, OptionType::Count, "retries", '\0'},
        {OptionId::RetryBackoffMs, OptionType::Count, "retry-backoff-ms", '\0'},
        {OptionId::Backend, OptionType::String, "backend", '\0'},
        {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
        {OptionId::Quiet, OptionType::Flag, "quiet", 'q'},
        {OptionId::Help, OptionType::Flag, "help", 'h'},
    };
    const u32 kPipeOptionCount = static_cast<u32>(sizeof(kPipeOptions) / sizeof(kPipeOptions[0]));

    bool parse_size(const char* s, u64* out) noexcept {
        if (out == nullptr || s == nullptr || *s == '\0') {
            return false;
        }
        const char* end = s + std::strlen(s);
        u64 v{};
        auto r = std::from_chars(s, end, v, 10);
        if (r.ec != std::errc() || r.ptr == s) {
            return false;
        }
        u32 shift = 0;
        if (r.ptr != end) {
            if (r.ptr + 1 != end) {
                return false;
            }
            switch (*r.ptr) {
            case 'k':
            case 'K':
                shift = 10;
                break;
            case 'm':
            case 'M':
                shift = 20;
                break;
            case 'g':
            case 'G':
                shift = 30;
                break;
            default:
                return false;
            }
        }
        if (shift > 0 && v > (std::numeric_limits<u64>::max() >> shift)) {
            return false;
        }
        *out = v << shift;
        return true;
    }

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return usage_error();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return usage_error();
        }
        if (spec_count > 0 && specs == nullptr) {
            return usage_error();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            bool inline_value = false;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                char name_buf[128]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return usage_error();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name = name_buf;
                    value = eq + 1;
                    inline_value = true;
                }
                spec = find_long(specs, spec_count, name);
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    value = tok + 2;
                    inline_value = true;
                }
            }
            if (spec == nullptr) {
                return usage_error();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            if (spec->type == OptionType::Flag) {
                if (inline_value) {
                    return usage_error();
                }
                opt.value.boolv = 1;
                ++i;
            } else if (inline_value) {
                ++i;
            } else {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return usage_error();
                }
                value = args.argv[i + 1];
                i += 2;
            }

            if (spec->type != OptionType::Flag && !parse_value(*spec, value, &opt)) {
                return usage_error();
            }
            const Status s = push_option(out, opt);
            if (!chunkpipe::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return chunkpipe::core::ok_status();
    }

    Status apply_options(const ParsedOptions& opts, chunkpipe::core::PipeConfig* cfg) noexcept {
        using chunkpipe::core::BackendKind;
        using chunkpipe::core::LogLevel;
        using chunkpipe::core::PipeMode;

        if (cfg == nullptr || (opts.len > 0 && opts.data == nullptr)) {
            return usage_error();
        }
        for (u32 i = 0; i < opts.len; ++i) {
            const ParsedOption& o = opts.data[i];
            Status s = chunkpipe::core::ok_status();
            switch (o.id) {
            case OptionId::ChunkSize:
                cfg->chunk_size = o.value.u64v;
                break;
            case OptionId::BlockSize:
                if (!to_u32(o.value.u64v, &cfg->block_size)) return usage_error();
                break;
            case OptionId::TempDir:
                cfg->temp_dir = o.value.str;
                break;
            case OptionId::TempBudget:
                cfg->temp_budget_bytes = o.value.u64v;
                break;
            case OptionId::Replay:
                s = set_mode(cfg, PipeMode::Replay);
                break;
            case OptionId::Verify:
                s = set_mode(cfg, PipeMode::Verify);
                break;
            case OptionId::Purge:
                s = set_mode(cfg, PipeMode::Purge);
                break;
            case OptionId::PurgeFirst:
                cfg->purge_first = true;
                break;
            case OptionId::Jobs:
                if (!to_u32(o.value.u64v, &cfg->jobs)) return usage_error();
                break;
            case OptionId::NoCheck:
                cfg->no_check = true;
                break;
            case OptionId::Parity:
                cfg->parity = true;
                break;
            case OptionId::Repair:
                cfg->repair = true;
                break;
            case OptionId::Retries:
                if (!to_u32(o.value.u64v, &cfg->transport_retries)) return usage_error();
                break;
            case OptionId::RetryBackoffMs:
                if (!to_u32(o.value.u64v, &cfg->retry_backoff_ms)) return usage_error();
                break;
            case OptionId::Backend:
                if (std::strcmp(o.value.str, "local") == 0) {
                    cfg->backend = BackendKind::Local;
                } else if (std::strcmp(o.value.str, "rclone") == 0) {
                    cfg->backend = BackendKind::Rclone;
                } else if (std::strcmp(o.value.str, "auto") == 0) {
                    cfg->backend = BackendKind::Auto;
                } else {
                    return usage_error();
                }
                break;
            case OptionId::Verbose:
                cfg->log_level = LogLevel::Debug;
                break;
            case OptionId::Quiet:
                cfg->log_level = LogLevel::Warn;
                break;
            case OptionId::Help:
            case OptionId::None:
                break;
            }
            if (!chunkpipe::core::is_ok(s)) {
                return s;
            }
        }
        return chunkpipe::core::ok_status();
    }

    Status parse_command_line(const CliArgs& args, chunkpipe::core::PipeConfig* cfg, bool* help) noexcept {
        if (cfg == nullptr || help == nullptr || (args.argc > 0 && args.argv == nullptr)) {
            return usage_error();
        }
        *help = false;

        ParsedOption storage[kMaxParsedPerRun];
        bool have_destination = false;
        bool options_done = false;
        u32 pos = 0;
        while (pos < args.argc) {
            if (!options_done) {
                ParsedOptions parsed{storage, 0, kMaxParsedPerRun};
                u32 used = 0;
                Status s = parse_options(CliArgs{args.argv + pos, args.argc - pos}, kPipeOptions, kPipeOptionCount,
                    &parsed, &used);
                if (!chunkpipe::core::is_ok(s)) {
                    return s;
                }
                for (u32 i = 0; i < parsed.len; ++i) {
                    if (parsed.data[i].id == OptionId::Help) {
                        *help = true;
                    }
                }
                s = apply_options(parsed, cfg);
                if (!chunkpipe::core::is_ok(s)) {
                    return s;
                }
                pos += used;
                if (used > 0 && std::strcmp(args.argv[pos - 1], "--") == 0) {
                    options_done = true;
                }
                if (pos >= args.argc) {
                    break;
                }
            }

            if (have_destination) {
                return usage_error();
            }
            cfg->destination = args.argv[pos];
            have_destination = true;
            ++pos;
        }

        if (*help) {
            return chunkpipe::core::ok_status();
        }
        if (!have_destination) {
            return usage_error();
        }
        if (cfg->purge_first && cfg->mode != chunkpipe::core::PipeMode::Deposit) {
            return usage_error();
        }
        return chunkpipe::core::ok_status();
    }

    const char* usage_text() noexcept {
        return "usage: chunkpipe [options] DESTINATION\n"
               "\n"
               "  <source> | chunkpipe [options] DEST         store stdin as chunks at DEST\n"
               "  chunkpipe --replay [options] DEST | <sink>  write the stored stream to stdout\n"
               "  chunkpipe --verify [options] DEST           check stored chunks against the manifest\n"
               "  chunkpipe --purge DEST                      delete everything stored at DEST\n"
               "\n"
               "DEST is a directory, or remote:path for rclone. A deposit needs an empty DEST.\n"
               "\n"
               "options:\n"
               "  -c, --chunksize N        chunk size (default 8M)\n"
               "  -b, --blocksize N        read/hash block size (default 64K)\n"
               "  -t, --tempdir DIR        temp directory (default $TMPDIR or /tmp)\n"
               "      --temp-budget N      cap on temp space used by chunks\n"
               "  -r, --replay             replay the stream to stdout\n"
               "      --verify             verify stored chunks only (also with --replay)\n"
               "      --purge              delete DEST contents and exit\n"
               "      --purge-first        delete DEST contents, then store stdin\n"
               "  -j, --jobs N             concurrent transfers (default 2)\n"
               "  -n, --nocheck            skip checksum verification\n"
               "      --PAR, --parity      store a parity object per chunk\n"
               "      --repair             rebuild corrupted chunks from parity\n"
               "      --retries N          transport retries per operation (default 10)\n"
               "      --retry-backoff-ms N first retry delay (default 200)\n"
               "      --backend KIND       local, rclone or auto (default auto)\n"
               "  -v, --verbose            debug logging\n"
               "  -q, --quiet              warnings and errors only\n"
               "  -h, --help               show this help\n";
    }
} // namespace chunkpipe::cli
