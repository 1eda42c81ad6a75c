#include "chunkpipe/transfer/worker_pool.hpp"

#include "chunkpipe/core/log.hpp"

namespace chunkpipe::transfer {

WorkerPool::WorkerPool(u32 threads) {
    const u32 n = threads == 0 ? 1 : threads;
    workers_.reserve(n);
    try {
        for (u32 i = 0; i < n; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    } catch (...) {
        // Threads already running must be joined before workers_ goes away.
        stop_and_join();
        throw;
    }
    chunkpipe::core::log_emit(chunkpipe::core::LogLevel::Debug, "worker pool started with %u threads", n);
}

WorkerPool::~WorkerPool() {
    stop_and_join();
}

void WorkerPool::stop_and_join() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (std::thread& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

} // namespace chunkpipe::transfer
