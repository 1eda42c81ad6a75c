#include "chunkpipe/transfer/slot_pool.hpp"

namespace chunkpipe::transfer {

using namespace chunkpipe::core;

SlotLease& SlotLease::operator=(SlotLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        other.pool_ = nullptr;
    }
    return *this;
}

void SlotLease::release() noexcept {
    if (pool_ != nullptr) {
        pool_->release_one();
        pool_ = nullptr;
    }
}

Status SlotPool::acquire(SlotLease* out) noexcept {
    if (out == nullptr || capacity_ == 0) {
        return make_status(StatusDomain::Transfer, StatusCode::Invalid);
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_ || in_use_ < capacity_; });
    if (cancelled_) {
        return make_status(StatusDomain::Transfer, StatusCode::Cancelled);
    }
    ++in_use_;
    if (in_use_ > peak_) {
        peak_ = in_use_;
    }
    lock.unlock();
    *out = SlotLease(this);
    return ok_status();
}

bool SlotPool::try_acquire(SlotLease* out) noexcept {
    if (out == nullptr) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || in_use_ >= capacity_) {
            return false;
        }
        ++in_use_;
        if (in_use_ > peak_) {
            peak_ = in_use_;
        }
    }
    *out = SlotLease(this);
    return true;
}

void SlotPool::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool SlotPool::cancelled() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

u32 SlotPool::in_use() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

u32 SlotPool::peak() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

void SlotPool::release_one() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

} // namespace chunkpipe::transfer
