#pragma once

#include <vector>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/storage/buffer.hpp"

namespace chunkpipe::integrity {

    using u8 = chunkpipe::core::u8;

    // Parity producer/consumer. decode() returns Unrepairable (StatusDomain::Redundancy)
    // when the damage exceeds what the parity can undo.
    class RedundancyEngine {
    public:
        virtual ~RedundancyEngine() = default;

        [[nodiscard]] virtual chunkpipe::core::Status encode(chunkpipe::storage::BufferView chunk,
            std::vector<u8>* parity) noexcept = 0;

        [[nodiscard]] virtual chunkpipe::core::Status decode(chunkpipe::storage::BufferView corrupted,
            chunkpipe::storage::BufferView parity,
            std::vector<u8>* repaired) noexcept = 0;
    };

} // namespace chunkpipe::integrity
