#pragma once

#include <vector>

#include "chunkpipe/core/chunk.hpp"
#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/storage/hashing.hpp"

namespace chunkpipe::storage {
    class TempArea;
}

namespace chunkpipe::stream {

    using u8 = chunkpipe::core::u8;
    using u32 = chunkpipe::core::u32;
    using u64 = chunkpipe::core::u64;

    // Cuts the input into chunk_size temp files, reading block_size at a time and
    // hashing each block into both the chunk digest and the whole-stream digest.
    //
    // An empty input yields one zero-length chunk 0. Otherwise no chunk is empty: an
    // input ending exactly on a chunk boundary produces no trailing chunk.
    class ChunkWriter {
    public:
        ChunkWriter(chunkpipe::storage::TempArea& temp, u64 chunk_size, u32 block_size);

        ChunkWriter(const ChunkWriter&) = delete;
        ChunkWriter& operator=(const ChunkWriter&) = delete;

        // Fills *out with a Built chunk (fsync'ed) or sets *end_of_stream.
        // Io on input or temp write errors, TempSpace when the temp directory is full.
        [[nodiscard]] chunkpipe::core::Status next_chunk(int input_fd,
            chunkpipe::core::ChunkDescriptor* out,
            bool* end_of_stream) noexcept;

        [[nodiscard]] chunkpipe::core::Hash256 stream_digest() const noexcept { return stream_hasher_.finish(); }
        [[nodiscard]] u64 bytes_read() const noexcept { return bytes_read_; }
        [[nodiscard]] u64 chunks_built() const noexcept { return next_index_; }

    private:
        chunkpipe::storage::TempArea& temp_;
        const u64 chunk_size_;
        const u32 block_size_;
        std::vector<u8> block_;
        chunkpipe::storage::StreamHasher stream_hasher_;
        u64 next_index_{0};
        u64 bytes_read_{0};
        bool eof_{false};
    };

} // namespace chunkpipe::stream
