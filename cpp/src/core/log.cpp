#include "chunkpipe/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace chunkpipe::core {
    namespace {
        std::atomic<u8> g_level{static_cast<u8>(LogLevel::Info)};
        std::mutex g_log_mutex;
        LogHandler g_handler;
    } // namespace

    const char* log_level_name(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Error: return "ERROR";
            case LogLevel::Warn: return "WARN";
            case LogLevel::Info: return "INFO";
            case LogLevel::Debug: return "DEBUG";
        }
        return "???";
    }

    void log_set_level(LogLevel level) noexcept {
        g_level.store(static_cast<u8>(level), std::memory_order_relaxed);
    }

    LogLevel log_level() noexcept {
        return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
    }

    void log_set_handler(LogHandler handler) {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_handler = std::move(handler);
    }

    void log_reset_handler() noexcept {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_handler = nullptr;
    }

    void log_emit(LogLevel level, const char* fmt, ...) noexcept {
        if (fmt == nullptr || static_cast<u8>(level) > g_level.load(std::memory_order_relaxed)) {
            return;
        }

        char buf[1024];
        va_list ap;
        va_start(ap, fmt);
        const int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        if (n < 0) {
            return;
        }
        const size_t len = static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf) - 1;

        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_handler) {
            try {
                g_handler(level, std::string_view(buf, len));
            } catch (const std::exception& e) {
                std::fprintf(stderr, "chunkpipe: log handler threw: %s\n", e.what());
            }
            return;
        }
        std::fprintf(stderr, "chunkpipe: [%s] %.*s\n", log_level_name(level), static_cast<int>(len), buf);
    }

    void log_status(LogLevel level, const char* context, Status s) noexcept {
        log_emit(level,
            "%s failed (code=%s/%u, domain=%s/%u, aux=%u)",
            context != nullptr ? context : "operation",
            status_code_name(s.code),
            static_cast<unsigned>(s.code),
            status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
        if ((s.code == StatusCode::Io || s.code == StatusCode::TempSpace) && s.aux != 0) {
            log_emit(level, "%s: %s", context != nullptr ? context : "operation", std::strerror(static_cast<int>(s.aux)));
        }
    }

} // namespace chunkpipe::core
