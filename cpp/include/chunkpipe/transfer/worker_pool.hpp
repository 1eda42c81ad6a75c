#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include "chunkpipe/core/types.hpp"

namespace chunkpipe::transfer {

    using u32 = chunkpipe::core::u32;

    // Fixed set of threads draining a FIFO of tasks. The destructor runs every queued
    // task before joining.
    class WorkerPool {
    public:
        // Throws (std::system_error) when a thread cannot be started; threads started
        // before the failure are joined first.
        explicit WorkerPool(u32 threads);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        // f may be move-only. Must not be called once destruction has begun.
        template <class F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>&>>;

        [[nodiscard]] u32 size() const noexcept { return static_cast<u32>(workers_.size()); }

    private:
        void worker_loop();
        void stop_and_join() noexcept;

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_{false};
    };

    template <class F>
    auto WorkerPool::submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
        using R = std::invoke_result_t<std::decay_t<F>&>;

        // std::function needs a copyable target, so the task lives behind a shared_ptr.
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.emplace([task] { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

} // namespace chunkpipe::transfer
