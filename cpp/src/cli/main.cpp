#include <cstdio>
#include <cstring>
#include <csignal>
#include <memory>
#include <unistd.h>

#include "chunkpipe/backend/local_transport.hpp"
#include "chunkpipe/backend/rclone_transport.hpp"
#include "chunkpipe/backend/xor_parity.hpp"
#include "chunkpipe/cli/options.hpp"
#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/log.hpp"
#include "chunkpipe/integrity/verify.hpp"
#include "chunkpipe/storage/hashing.hpp"
#include "chunkpipe/stream/deposit.hpp"
#include "chunkpipe/stream/replay.hpp"
#include "chunkpipe/transfer/destination.hpp"

using chunkpipe::core::PipeConfig;
using chunkpipe::core::PipeMode;
using chunkpipe::core::Status;
using chunkpipe::core::StatusCode;

// ========================================================================
// Exit codes
// ========================================================================

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// ========================================================================
// Error Reporting
// ========================================================================

void print_status_error_detailed(const char* context, Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            chunkpipe::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            chunkpipe::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
    if ((s.code == StatusCode::Io || s.code == StatusCode::TempSpace) && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

void print_usage_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
    fprintf(stderr, "%s", chunkpipe::cli::usage_text());
}

// ========================================================================
// Backend Selection
// ========================================================================

std::unique_ptr<chunkpipe::transfer::TransportClient> make_transport(const PipeConfig& cfg) {
    if (chunkpipe::core::config_resolve_backend(cfg) == chunkpipe::core::BackendKind::Rclone) {
        chunkpipe::core::log_emit(chunkpipe::core::LogLevel::Debug, "using rclone for %s", cfg.destination.c_str());
        return std::make_unique<chunkpipe::backend::RcloneTransport>(cfg.destination);
    }
    return std::make_unique<chunkpipe::backend::LocalTransport>(cfg.destination, cfg.block_size);
}

// ========================================================================
// Mode Handlers
// ========================================================================

int handle_deposit(const PipeConfig& cfg,
                   chunkpipe::transfer::TransportClient& transport,
                   chunkpipe::integrity::RedundancyEngine* redundancy) {
    if (isatty(STDIN_FILENO)) {
        chunkpipe::core::log_emit(chunkpipe::core::LogLevel::Warn, "reading the stream from a terminal");
    }
    chunkpipe::stream::DepositPipeline pipeline(cfg, transport, redundancy);
    chunkpipe::stream::DepositStats stats{};
    const Status s = pipeline.run(STDIN_FILENO, &stats);
    if (!chunkpipe::core::is_ok(s)) {
        print_status_error_detailed("deposit", s);
        return kExitFailure;
    }

    char hex[65];
    chunkpipe::storage::hash_to_hex(stats.digest, hex, sizeof(hex));
    fprintf(stderr, "TOTAL %s %llu\n", hex, static_cast<unsigned long long>(stats.bytes));
    return kExitOk;
}

int handle_replay(const PipeConfig& cfg,
                  chunkpipe::transfer::TransportClient& transport,
                  chunkpipe::integrity::RedundancyEngine* redundancy) {
    chunkpipe::stream::ReplayStats stats{};
    const Status s = chunkpipe::stream::replay_destination(cfg, transport, redundancy, STDOUT_FILENO, &stats);
    if (!chunkpipe::core::is_ok(s)) {
        print_status_error_detailed("replay", s);
        return kExitFailure;
    }
    if (stats.repaired > 0) {
        fprintf(stderr, "info: repaired %llu chunks\n", static_cast<unsigned long long>(stats.repaired));
    }
    return kExitOk;
}

int handle_verify(const PipeConfig& cfg,
                  chunkpipe::transfer::TransportClient& transport,
                  chunkpipe::integrity::RedundancyEngine* redundancy) {
    chunkpipe::integrity::VerifyReport report{};
    const Status s = chunkpipe::integrity::verify_destination(cfg, transport, redundancy, &report);
    if (!chunkpipe::core::is_ok(s)) {
        print_status_error_detailed("verify", s);
        return kExitFailure;
    }
    for (auto index : report.mismatched) {
        fprintf(stderr, "MISMATCH %llu\n", static_cast<unsigned long long>(index));
    }
    for (auto index : report.missing) {
        fprintf(stderr, "MISSING %llu\n", static_cast<unsigned long long>(index));
    }
    for (auto index : report.unrepairable) {
        fprintf(stderr, "UNREPAIRABLE %llu\n", static_cast<unsigned long long>(index));
    }
    for (auto index : report.repaired) {
        fprintf(stderr, "REPAIRED %llu\n", static_cast<unsigned long long>(index));
    }
    return report.ok ? kExitOk : kExitFailure;
}

int handle_purge(const PipeConfig& cfg, chunkpipe::transfer::TransportClient& transport) {
    chunkpipe::core::u64 removed = 0;
    const Status s = chunkpipe::transfer::destination_purge(transport, chunkpipe::transfer::retry_policy_from(cfg), &removed);
    if (!chunkpipe::core::is_ok(s)) {
        print_status_error_detailed("purge", s);
        return kExitFailure;
    }
    fprintf(stderr, "info: removed %llu objects\n", static_cast<unsigned long long>(removed));
    return kExitOk;
}

// ========================================================================
// Main Entry Point
// ========================================================================

int main(int argc, char** argv) {
    // A closed reader on replay must surface as EPIPE, not kill the process mid-cleanup.
    signal(SIGPIPE, SIG_IGN);

    PipeConfig cfg = chunkpipe::core::config_defaults();
    bool help = false;
    const chunkpipe::cli::CliArgs args{argc > 1 ? argv + 1 : nullptr, argc > 1 ? static_cast<chunkpipe::core::u32>(argc - 1) : 0u};
    Status s = chunkpipe::cli::parse_command_line(args, &cfg, &help);
    if (help) {
        printf("%s", chunkpipe::cli::usage_text());
        return kExitOk;
    }
    if (!chunkpipe::core::is_ok(s)) {
        print_usage_error("invalid command line");
        return kExitUsage;
    }

    chunkpipe::core::log_set_level(cfg.log_level);

    s = chunkpipe::core::config_validate(cfg);
    if (!chunkpipe::core::is_ok(s)) {
        switch (s.code) {
        case StatusCode::Incompatible:
            print_usage_error("--verify and --repair need checksums; drop --nocheck");
            return kExitUsage;
        case StatusCode::TempSpace:
            print_usage_error("--temp-budget cannot hold one chunk");
            return kExitUsage;
        case StatusCode::NotFound:
            fprintf(stderr, "error: temp directory %s does not exist\n", cfg.temp_dir.c_str());
            return kExitUsage;
        default:
            print_usage_error("invalid sizes or job count");
            return kExitUsage;
        }
    }

    std::unique_ptr<chunkpipe::transfer::TransportClient> transport = make_transport(cfg);
    std::unique_ptr<chunkpipe::backend::XorParityEngine> parity;
    if (cfg.parity || cfg.repair) {
        parity = std::make_unique<chunkpipe::backend::XorParityEngine>();
    }

    switch (cfg.mode) {
    case PipeMode::Deposit:
        return handle_deposit(cfg, *transport, parity.get());
    case PipeMode::Replay:
        return handle_replay(cfg, *transport, parity.get());
    case PipeMode::Verify:
        return handle_verify(cfg, *transport, parity.get());
    case PipeMode::Purge:
        return handle_purge(cfg, *transport);
    }
    return kExitFailure;
}
