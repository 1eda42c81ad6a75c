#pragma once

#include <type_traits>

#include "chunkpipe/core/types.hpp"

namespace chunkpipe::storage {
    using u8 = chunkpipe::core::u8;
    using u32 = chunkpipe::core::u32;
    using u64 = chunkpipe::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace chunkpipe::storage
