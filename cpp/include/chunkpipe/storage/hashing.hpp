#pragma once

#include <cstddef>

#include <blake3.h>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/storage/buffer.hpp"

namespace chunkpipe::storage {
    [[nodiscard]] constexpr bool hash_is_zero(const chunkpipe::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    chunkpipe::core::Status hash_compute(BufferView data, chunkpipe::core::Hash256* out) noexcept;

    // Hashes a file in block_size reads. size_out may be null.
    chunkpipe::core::Status hash_file(const char* path,
        u32 block_size,
        chunkpipe::core::Hash256* out,
        u64* size_out) noexcept;

    // Lowercase hex; out must hold 65 bytes.
    void hash_to_hex(const chunkpipe::core::Hash256& hash, char* out, size_t out_size) noexcept;
    [[nodiscard]] bool hash_from_hex(const char* hex, chunkpipe::core::Hash256* out) noexcept;

    // Running digest fed block by block.
    class StreamHasher {
    public:
        StreamHasher() noexcept;

        void update(const u8* data, size_t len) noexcept;
        [[nodiscard]] chunkpipe::core::Hash256 finish() const noexcept;
        void reset() noexcept;

    private:
        blake3_hasher hasher_;
    };

} // namespace chunkpipe::storage
