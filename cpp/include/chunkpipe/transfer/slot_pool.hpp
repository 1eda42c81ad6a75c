#pragma once

#include <condition_variable>
#include <mutex>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"

namespace chunkpipe::transfer {

    using u32 = chunkpipe::core::u32;

    class SlotPool;

    // One held slot. Released on destruction or release(); movable, not copyable.
    class SlotLease {
    public:
        SlotLease() noexcept = default;
        ~SlotLease() noexcept { release(); }

        SlotLease(SlotLease&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
        SlotLease& operator=(SlotLease&& other) noexcept;

        SlotLease(const SlotLease&) = delete;
        SlotLease& operator=(const SlotLease&) = delete;

        [[nodiscard]] bool held() const noexcept { return pool_ != nullptr; }
        void release() noexcept;

    private:
        friend class SlotPool;
        explicit SlotLease(SlotPool* pool) noexcept : pool_(pool) {}

        SlotPool* pool_{nullptr};
    };

    // Counting semaphore bounding how many chunks may occupy temp space at once.
    // The writer blocks in acquire() while the pool is full; cancel() wakes it.
    class SlotPool {
    public:
        explicit SlotPool(u32 capacity) noexcept : capacity_(capacity) {}

        SlotPool(const SlotPool&) = delete;
        SlotPool& operator=(const SlotPool&) = delete;

        // Blocks until a slot is free. Cancelled once cancel() has been called.
        [[nodiscard]] chunkpipe::core::Status acquire(SlotLease* out) noexcept;
        [[nodiscard]] bool try_acquire(SlotLease* out) noexcept;

        void cancel() noexcept;
        [[nodiscard]] bool cancelled() const noexcept;

        [[nodiscard]] u32 capacity() const noexcept { return capacity_; }
        [[nodiscard]] u32 in_use() const noexcept;
        [[nodiscard]] u32 peak() const noexcept;

    private:
        friend class SlotLease;
        void release_one() noexcept;

        const u32 capacity_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        u32 in_use_{0};
        u32 peak_{0};
        bool cancelled_{false};
    };

} // namespace chunkpipe::transfer
