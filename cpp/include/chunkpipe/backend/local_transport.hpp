#pragma once

#include <string>
#include <vector>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/transfer/transport.hpp"

namespace chunkpipe::backend {

using u32 = chunkpipe::core::u32;

// Destination is a directory on a locally mounted filesystem.
// - upload writes {root}/{key}.partial, fsyncs it, then renames it into place,
//   so a visible object is always complete
// - head_checksum hashes the stored bytes, like a remote that reports content digests
class LocalTransport final : public chunkpipe::transfer::TransportClient {
public:
    explicit LocalTransport(std::string root, u32 block_size = 1u << 16);

    [[nodiscard]] chunkpipe::core::Status upload(const std::string& local_path,
        const std::string& remote_key) noexcept override;
    [[nodiscard]] chunkpipe::core::Status download(const std::string& remote_key,
        const std::string& local_path) noexcept override;
    [[nodiscard]] chunkpipe::core::Status list(const std::string& remote_prefix,
        std::vector<std::string>* out) noexcept override;
    [[nodiscard]] chunkpipe::core::Status remove(const std::string& remote_key) noexcept override;
    [[nodiscard]] chunkpipe::core::Status head_checksum(const std::string& remote_key,
        chunkpipe::core::Hash256* out,
        bool* present) noexcept override;

    [[nodiscard]] const std::string& root() const noexcept { return root_; }

    // Filesystem path of an object (for tests and diagnostics).
    [[nodiscard]] std::string object_path(const std::string& remote_key) const;

private:
    std::string root_;
    u32 block_size_;
};

} // namespace chunkpipe::backend
