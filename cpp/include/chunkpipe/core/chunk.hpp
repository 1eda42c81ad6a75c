#pragma once

#include <string>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"

namespace chunkpipe::core {

    // One bounded slice of the stream and the temp file holding it.
    struct ChunkDescriptor {
        u64 index{0};
        u64 size{0};
        Hash256 checksum{};
        std::string local_path;
        ChunkState state{ChunkState::Building};
        bool has_parity{false};
    };

    // Outcome of one scheduled transfer. Chunk-local failures stay here; the
    // orchestrator decides whether they end the run.
    struct TransferResult {
        u64 index{0};
        Status status{};
        ChunkState state{ChunkState::Building};
        u64 size{0};
        Hash256 checksum{};
        std::string local_path;  // downloads only; owned by the receiver
        bool repaired{false};
    };

} // namespace chunkpipe::core
