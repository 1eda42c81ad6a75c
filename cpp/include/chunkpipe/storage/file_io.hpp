#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/storage/buffer.hpp"

namespace chunkpipe::storage {

    // Maps an errno to Io, or TempSpace for ENOSPC/EDQUOT, with the errno in aux.
    [[nodiscard]] chunkpipe::core::Status errno_status(chunkpipe::core::StatusDomain domain, int err) noexcept;

    // Reads until len bytes or end of file; *n receives the byte count. Retries EINTR.
    [[nodiscard]] chunkpipe::core::Status read_full(int fd, u8* buf, size_t len, size_t* n) noexcept;

    [[nodiscard]] chunkpipe::core::Status write_all(int fd, const u8* data, size_t len) noexcept;

    // Copies src to dst in block_size pieces. With durable set, dst is fsync'ed.
    [[nodiscard]] chunkpipe::core::Status copy_file(const char* src, const char* dst, u32 block_size, bool durable) noexcept;

    [[nodiscard]] chunkpipe::core::Status read_file(const char* path, std::vector<u8>* out) noexcept;
    [[nodiscard]] chunkpipe::core::Status write_file(const char* path, BufferView data, bool durable) noexcept;

    // Missing files are not an error.
    chunkpipe::core::Status remove_file(const std::string& path) noexcept;

    [[nodiscard]] bool file_exists(const char* path) noexcept;

    // Creates every missing directory on the way to path (path itself included).
    [[nodiscard]] chunkpipe::core::Status create_directories(const char* path) noexcept;

} // namespace chunkpipe::storage
