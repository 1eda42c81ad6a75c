#pragma once

#include "chunkpipe/core/types.hpp"

namespace chunkpipe::storage {
    inline void put_u32_be(core::u8* out, core::u32 v) noexcept {
        out[0] = static_cast<core::u8>((v >> 24) & 0xffu);
        out[1] = static_cast<core::u8>((v >> 16) & 0xffu);
        out[2] = static_cast<core::u8>((v >> 8) & 0xffu);
        out[3] = static_cast<core::u8>((v >> 0) & 0xffu);
    }

    inline void put_u64_be(core::u8* out, core::u64 v) noexcept {
        put_u32_be(out, static_cast<core::u32>(v >> 32));
        put_u32_be(out + 4, static_cast<core::u32>(v & 0xffffffffu));
    }

    [[nodiscard]] inline core::u32 get_u32_be(const core::u8* in) noexcept {
        return (static_cast<core::u32>(in[0]) << 24) | (static_cast<core::u32>(in[1]) << 16) |
               (static_cast<core::u32>(in[2]) << 8) | (static_cast<core::u32>(in[3]) << 0);
    }

    [[nodiscard]] inline core::u64 get_u64_be(const core::u8* in) noexcept {
        return (static_cast<core::u64>(get_u32_be(in)) << 32) | static_cast<core::u64>(get_u32_be(in + 4));
    }
} // namespace chunkpipe::storage
