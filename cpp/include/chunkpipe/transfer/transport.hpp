#pragma once

#include <string>
#include <vector>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"

namespace chunkpipe::transfer {

    // Single-object operations against one remote destination. Keys are object names
    // relative to that destination. Calls are synchronous; the scheduler provides concurrency,
    // so implementations must be safe to call from several worker threads at once.
    //
    // Failures use StatusDomain::Transport with TransportTransient (retryable),
    // Transport (permanent) or NotFound (missing object).
    class TransportClient {
    public:
        virtual ~TransportClient() = default;

        [[nodiscard]] virtual chunkpipe::core::Status upload(const std::string& local_path,
            const std::string& remote_key) noexcept = 0;

        [[nodiscard]] virtual chunkpipe::core::Status download(const std::string& remote_key,
            const std::string& local_path) noexcept = 0;

        // Keys starting with prefix, sorted.
        [[nodiscard]] virtual chunkpipe::core::Status list(const std::string& remote_prefix,
            std::vector<std::string>* out) noexcept = 0;

        [[nodiscard]] virtual chunkpipe::core::Status remove(const std::string& remote_key) noexcept = 0;

        // Content digest of the stored object as the remote sees it. *present is false when
        // the backend cannot report one; callers then download and hash.
        [[nodiscard]] virtual chunkpipe::core::Status head_checksum(const std::string& remote_key,
            chunkpipe::core::Hash256* out,
            bool* present) noexcept = 0;
    };

} // namespace chunkpipe::transfer
