#include "chunkpipe/stream/reorder_buffer.hpp"

#include <utility>

namespace chunkpipe::stream {

using chunkpipe::core::TransferResult;

void ReorderBuffer::push(TransferResult result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        heap_.push(std::move(result));
    }
    cv_.notify_all();
}

bool ReorderBuffer::wait_next(TransferResult* out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_ || (!heap_.empty() && heap_.top().index == next_); });
    if (cancelled_) {
        return false;
    }
    *out = heap_.top();
    heap_.pop();
    ++next_;
    return true;
}

void ReorderBuffer::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

u64 ReorderBuffer::next_index() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_;
}

std::size_t ReorderBuffer::pending() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.size();
}

std::vector<TransferResult> ReorderBuffer::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferResult> out;
    while (!heap_.empty()) {
        out.push_back(heap_.top());
        heap_.pop();
    }
    return out;
}

} // namespace chunkpipe::stream
