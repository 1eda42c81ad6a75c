#include "chunkpipe/core/errors.hpp"

namespace chunkpipe::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Io: return "IOError";
            case StatusCode::TempSpace: return "TempSpaceError";
            case StatusCode::Transport: return "TransportError";
            case StatusCode::TransportTransient: return "TransportError(transient)";
            case StatusCode::ManifestConflict: return "ManifestConflictError";
            case StatusCode::IncompleteManifest: return "IncompleteManifestError";
            case StatusCode::ChecksumMismatch: return "ChecksumMismatchError";
            case StatusCode::Unrepairable: return "UnrepairableChunkError";
            case StatusCode::NoParity: return "NoParityAvailable";
            case StatusCode::Incompatible: return "IncompatibleConfiguration";
            case StatusCode::Cancelled: return "Cancelled";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Stream: return "Stream";
            case StatusDomain::Transfer: return "Transfer";
            case StatusDomain::Manifest: return "Manifest";
            case StatusDomain::Integrity: return "Integrity";
            case StatusDomain::Transport: return "Transport";
            case StatusDomain::Redundancy: return "Redundancy";
            case StatusDomain::Cli: return "Cli";
        }
        return "Unknown";
    }
} // namespace chunkpipe::core
