#include "chunkpipe/core/config.hpp"

#include <cstdlib>
#include <sys/stat.h>

namespace chunkpipe::core {

    PipeConfig config_defaults() {
        PipeConfig cfg{};
        const char* tmp = std::getenv("TMPDIR");
        cfg.temp_dir = (tmp != nullptr && tmp[0] != '\0') ? tmp : "/tmp";
        return cfg;
    }

    Status config_validate(const PipeConfig& cfg) noexcept {
        if (cfg.destination.empty()) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (cfg.block_size == 0 || cfg.chunk_size == 0) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (cfg.chunk_size < cfg.block_size || cfg.chunk_size > kMaxChunkSize) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (cfg.jobs == 0) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (cfg.no_check && (cfg.mode == PipeMode::Verify || cfg.repair)) {
            return make_status(StatusDomain::Cli, StatusCode::Incompatible);
        }
        if (cfg.temp_budget_bytes != 0 && cfg.temp_budget_bytes < cfg.chunk_size) {
            return make_status(StatusDomain::Cli, StatusCode::TempSpace);
        }
        if (cfg.mode != PipeMode::Purge) {
            struct stat st{};
            if (cfg.temp_dir.empty() || ::stat(cfg.temp_dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
                return make_status(StatusDomain::Cli, StatusCode::NotFound);
            }
        }
        return ok_status();
    }

    u32 config_slot_capacity(const PipeConfig& cfg) noexcept {
        const u64 wanted = static_cast<u64>(cfg.jobs) + 1;
        if (cfg.temp_budget_bytes == 0 || cfg.chunk_size == 0) {
            return static_cast<u32>(wanted);
        }
        const u64 fits = cfg.temp_budget_bytes / cfg.chunk_size;
        if (fits == 0) {
            return 0;
        }
        return static_cast<u32>(fits < wanted ? fits : wanted);
    }

    BackendKind config_resolve_backend(const PipeConfig& cfg) noexcept {
        if (cfg.backend != BackendKind::Auto) {
            return cfg.backend;
        }
        const std::string& d = cfg.destination;
        if (d.empty() || d[0] == '/' || d[0] == '.') {
            return BackendKind::Local;
        }
        const auto colon = d.find(':');
        const auto slash = d.find('/');
        if (colon != std::string::npos && (slash == std::string::npos || colon < slash)) {
            return BackendKind::Rclone;
        }
        return BackendKind::Local;
    }

} // namespace chunkpipe::core
