#pragma once
#include <cstdint>
#include <type_traits>

namespace chunkpipe::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Conflict,
        Io,
        TempSpace,
        Transport,
        TransportTransient,
        ManifestConflict,
        IncompleteManifest,
        ChecksumMismatch,
        Unrepairable,
        NoParity,
        Incompatible,
        Cancelled,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Stream,
        Transfer,
        Manifest,
        Integrity,
        Transport,
        Redundancy,
        Cli,
    };

    // aux carries errno for Io/TempSpace and the chunk index for chunk-scoped codes.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Chunk-local failures that the scheduler may retry.
    [[nodiscard]] constexpr bool is_transient(Status s) noexcept {
        return s.code == StatusCode::TransportTransient;
    }

    // Ranks codes so an orchestrator can report the worst unresolved error of a run.
    [[nodiscard]] constexpr int status_severity(Status s) noexcept {
        switch (s.code) {
        case StatusCode::Ok:
            return 0;
        case StatusCode::NoParity:
            return 1;
        case StatusCode::Cancelled:
            return 2;
        case StatusCode::ChecksumMismatch:
        case StatusCode::Unrepairable:
            return 3;
        default:
            return 4;
        }
    }

    [[nodiscard]] constexpr Status worse_status(Status a, Status b) noexcept {
        return status_severity(b) > status_severity(a) ? b : a;
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace chunkpipe::core
