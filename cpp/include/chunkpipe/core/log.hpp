#pragma once

#include <functional>
#include <string_view>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"

namespace chunkpipe::core {

    enum class LogLevel : u8 {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
    };

    using LogHandler = std::function<void(LogLevel, std::string_view)>;

    [[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

    // Messages above `level` are dropped before formatting.
    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;

    // Process-wide handler. The default writes "chunkpipe: [LEVEL] msg" to stderr;
    // stdout is reserved for stream data.
    void log_set_handler(LogHandler handler);
    void log_reset_handler() noexcept;

    void log_emit(LogLevel level, const char* fmt, ...) noexcept
#if defined(__GNUC__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

    // "context failed (code=..., domain=..., aux=...)" plus strerror for Io codes.
    void log_status(LogLevel level, const char* context, Status s) noexcept;

} // namespace chunkpipe::core
