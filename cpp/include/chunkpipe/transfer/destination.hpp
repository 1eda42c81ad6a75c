#pragma once

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/transfer/retry.hpp"
#include "chunkpipe/transfer/transport.hpp"

namespace chunkpipe::transfer {

    using u64 = chunkpipe::core::u64;

    // True when the destination already holds chunk objects or a manifest.
    [[nodiscard]] chunkpipe::core::Status destination_in_use(TransportClient& transport,
        const RetryPolicy& retry,
        bool* in_use) noexcept;

    // Deletes every object under the destination. removed may be null.
    [[nodiscard]] chunkpipe::core::Status destination_purge(TransportClient& transport,
        const RetryPolicy& retry,
        u64* removed) noexcept;

} // namespace chunkpipe::transfer
