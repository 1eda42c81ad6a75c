#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace chunkpipe::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // BLAKE3-256 digest.
    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    using ChunkIndex = u64;

    // Marker used in Status::aux when an error concerns the whole stream rather than one chunk.
    inline constexpr u32 kWholeStream = 0xffffffffu;

    // Per-chunk lifecycle. Write path: Building -> Built -> Uploading -> Uploaded.
    // Read path: Listed -> Downloading -> Downloaded -> Verified | Mismatched -> Repairing -> Repaired | Unrepairable.
    enum class ChunkState : u8 {
        Building = 0,
        Built,
        Uploading,
        Uploaded,
        Verified,
        Listed,
        Downloading,
        Downloaded,
        Mismatched,
        Repairing,
        Repaired,
        Unrepairable,
    };

    [[nodiscard]] constexpr bool chunk_state_terminal(ChunkState s) noexcept {
        return s == ChunkState::Uploaded || s == ChunkState::Verified || s == ChunkState::Repaired ||
               s == ChunkState::Unrepairable;
    }

    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_standard_layout_v<Hash256>);

} // namespace chunkpipe::core
