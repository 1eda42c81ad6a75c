#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/log.hpp"
#include "chunkpipe/core/types.hpp"

namespace chunkpipe::transfer {
    using u32 = chunkpipe::core::u32;

    struct RetryPolicy {
        u32 retries{chunkpipe::core::kDefaultRetries};
        u32 backoff_ms{chunkpipe::core::kDefaultRetryBackoffMs};
        u32 backoff_max_ms{chunkpipe::core::kDefaultRetryBackoffMaxMs};
    };

    [[nodiscard]] inline RetryPolicy retry_policy_from(const chunkpipe::core::PipeConfig& cfg) noexcept {
        return RetryPolicy{cfg.transport_retries, cfg.retry_backoff_ms, cfg.retry_backoff_max_ms};
    }

    // Runs op() until it succeeds, fails permanently, or the retry budget is spent.
    // Only TransportTransient is retried. A set cancel flag stops further attempts.
    template <typename Op>
    [[nodiscard]] chunkpipe::core::Status with_retries(const RetryPolicy& policy,
        const std::atomic<bool>* cancelled,
        const char* what,
        const std::string& key,
        Op&& op) noexcept {
        u32 delay = policy.backoff_ms;
        for (u32 attempt = 0;; ++attempt) {
            const chunkpipe::core::Status s = op();
            if (!chunkpipe::core::is_transient(s)) {
                return s;
            }
            if (attempt >= policy.retries) {
                chunkpipe::core::log_emit(chunkpipe::core::LogLevel::Error,
                    "%s %s: giving up after %u attempts", what, key.c_str(), attempt + 1);
                return chunkpipe::core::make_status(s.domain, chunkpipe::core::StatusCode::Transport, s.aux);
            }
            if (cancelled != nullptr && cancelled->load(std::memory_order_acquire)) {
                return chunkpipe::core::make_status(chunkpipe::core::StatusDomain::Transfer,
                    chunkpipe::core::StatusCode::Cancelled);
            }
            chunkpipe::core::log_emit(chunkpipe::core::LogLevel::Warn,
                "%s %s: transient failure, retry %u/%u in %u ms", what, key.c_str(), attempt + 1, policy.retries, delay);
            if (delay > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            }
            const u32 next = delay * 2;
            delay = next > policy.backoff_max_ms ? policy.backoff_max_ms : next;
        }
    }

} // namespace chunkpipe::transfer
