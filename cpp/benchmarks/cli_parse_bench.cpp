#include <benchmark/benchmark.h>

#include "chunkpipe/cli/options.hpp"
#include "chunkpipe/core/config.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    const char* argv[] = {"-c", "8M", "--blocksize=64k", "-j4", "--PAR", "-n", "--", "remote:bucket"};
    const chunkpipe::cli::CliArgs args{argv, 8};
    for (auto _ : state) {
        chunkpipe::cli::ParsedOption buf[16]{};
        chunkpipe::cli::ParsedOptions out{buf, 0, 16};
        chunkpipe::cli::u32 consumed = 0;
        const chunkpipe::core::Status s = chunkpipe::cli::parse_options(args, chunkpipe::cli::kPipeOptions,
            chunkpipe::cli::kPipeOptionCount, &out, &consumed);
        benchmark::DoNotOptimize(static_cast<chunkpipe::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommandLine(benchmark::State& state) {
    const char* argv[] = {"--replay", "-j", "8", "/mnt/backup/stream", "--tempdir", "/var/tmp", "-q"};
    const chunkpipe::cli::CliArgs args{argv, 7};
    for (auto _ : state) {
        chunkpipe::core::PipeConfig cfg{};
        bool help = false;
        const chunkpipe::core::Status s = chunkpipe::cli::parse_command_line(args, &cfg, &help);
        benchmark::DoNotOptimize(static_cast<chunkpipe::core::u16>(s.code));
        benchmark::DoNotOptimize(cfg.jobs);
    }
}
BENCHMARK(BM_CliParseCommandLine);

static void BM_ParseSize(benchmark::State& state) {
    const char* inputs[] = {"8388608", "8M", "64k", "1G"};
    chunkpipe::cli::u32 i = 0;
    for (auto _ : state) {
        chunkpipe::cli::u64 v = 0;
        bool ok = chunkpipe::cli::parse_size(inputs[i & 3u], &v);
        benchmark::DoNotOptimize(ok);
        benchmark::DoNotOptimize(v);
        ++i;
    }
}
BENCHMARK(BM_ParseSize);
