#pragma once

#include <string>
#include <vector>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/transfer/transport.hpp"

namespace chunkpipe::backend {

// Destination is an rclone path ("remote:some/loc"). Each operation runs one rclone
// process. rclone's own retries are disabled (--retries=1) so the scheduler's retry
// policy is the only one in effect.
class RcloneTransport final : public chunkpipe::transfer::TransportClient {
public:
    explicit RcloneTransport(std::string remote, std::string rclone_binary = "rclone");

    [[nodiscard]] chunkpipe::core::Status upload(const std::string& local_path,
        const std::string& remote_key) noexcept override;
    [[nodiscard]] chunkpipe::core::Status download(const std::string& remote_key,
        const std::string& local_path) noexcept override;
    [[nodiscard]] chunkpipe::core::Status list(const std::string& remote_prefix,
        std::vector<std::string>* out) noexcept override;
    [[nodiscard]] chunkpipe::core::Status remove(const std::string& remote_key) noexcept override;

    // rclone cannot produce BLAKE3 digests on every remote; always reports absent.
    [[nodiscard]] chunkpipe::core::Status head_checksum(const std::string& remote_key,
        chunkpipe::core::Hash256* out,
        bool* present) noexcept override;

    [[nodiscard]] std::string remote_path(const std::string& remote_key) const;

private:
    [[nodiscard]] chunkpipe::core::Status run(const std::vector<std::string>& args, std::string* captured) noexcept;

    std::string remote_;
    std::string binary_;
};

// rclone exit code -> Status. 3/4 (directory/file not found) are NotFound,
// 2 (uncategorised) and 5 (temporary) are retryable, 127 means rclone is not installed.
[[nodiscard]] chunkpipe::core::Status rclone_exit_status(int exit_code) noexcept;

} // namespace chunkpipe::backend
