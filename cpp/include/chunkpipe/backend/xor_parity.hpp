#pragma once

#include <cstdint>
#include <vector>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/integrity/redundancy.hpp"
#include "chunkpipe/storage/buffer.hpp"

namespace chunkpipe::backend {

using u8 = chunkpipe::core::u8;
using u32 = chunkpipe::core::u32;
using u64 = chunkpipe::core::u64;

struct StripePlan {
    u32 shard_size{1u << 16};
    u32 group{8};  // data shards per parity shard
};

// Parity object layout (big-endian):
// 0..3 magic "CPPR", 4..7 version, 8..11 shard_size, 12..15 group, 16..23 data_len,
// 24..27 shard_count, 28..31 parity_count, then shard_count data-shard BLAKE3 hashes,
// parity_count parity-shard hashes, then parity_count parity shards of shard_size bytes.
inline constexpr u32 kParityMagic = 0x43505052u;  // "CPPR"
inline constexpr u32 kParityVersion = 1;
inline constexpr u32 kParityHeaderBytes = 32;

// One XOR parity shard per group of data shards. Corrupted shards are located by their
// stored hashes, so one damaged shard per group can be rebuilt.
class XorParityEngine final : public chunkpipe::integrity::RedundancyEngine {
public:
    XorParityEngine() noexcept = default;
    explicit XorParityEngine(const StripePlan& plan) noexcept : plan_(plan) {}

    [[nodiscard]] chunkpipe::core::Status encode(chunkpipe::storage::BufferView chunk,
        std::vector<u8>* parity) noexcept override;

    [[nodiscard]] chunkpipe::core::Status decode(chunkpipe::storage::BufferView corrupted,
        chunkpipe::storage::BufferView parity,
        std::vector<u8>* repaired) noexcept override;

    [[nodiscard]] const StripePlan& plan() const noexcept { return plan_; }

private:
    StripePlan plan_{};
};

} // namespace chunkpipe::backend
