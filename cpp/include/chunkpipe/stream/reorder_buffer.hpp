#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <vector>

#include "chunkpipe/core/chunk.hpp"
#include "chunkpipe/core/types.hpp"

namespace chunkpipe::stream {

    using u64 = chunkpipe::core::u64;

    // Holds completed downloads until the lowest outstanding index can be released.
    // push() is called from worker threads; wait_next() from the single consumer.
    class ReorderBuffer {
    public:
        explicit ReorderBuffer(u64 first_index = 0) noexcept : next_(first_index) {}

        ReorderBuffer(const ReorderBuffer&) = delete;
        ReorderBuffer& operator=(const ReorderBuffer&) = delete;

        void push(chunkpipe::core::TransferResult result);

        // Blocks until the result for the next index in sequence has arrived.
        // Returns false once cancel() has been called.
        [[nodiscard]] bool wait_next(chunkpipe::core::TransferResult* out);

        void cancel() noexcept;

        [[nodiscard]] u64 next_index() const noexcept;
        [[nodiscard]] std::size_t pending() const noexcept;

        // Takes whatever is still buffered, so the caller can clean up temp files.
        [[nodiscard]] std::vector<chunkpipe::core::TransferResult> drain();

    private:
        struct LaterIndex {
            bool operator()(const chunkpipe::core::TransferResult& a,
                const chunkpipe::core::TransferResult& b) const noexcept {
                return a.index > b.index;
            }
        };

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::priority_queue<chunkpipe::core::TransferResult, std::vector<chunkpipe::core::TransferResult>, LaterIndex> heap_;
        u64 next_;
        bool cancelled_{false};
    };

} // namespace chunkpipe::stream
