#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <functional>
#include <string>

namespace strata {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Injected logging capability. Every component that logs takes one of these
/// at construction; the default-constructed logger is a no-op.
struct logger {
    using sink_t = std::function<void(log_level, const char* tag, const std::string& message)>;

    log_level level = log_level::off;

    /// nullptr = write "[tag] message" to stderr.
    sink_t sink = nullptr;

    logger() = default;
    explicit logger(log_level l, sink_t s = nullptr) : level(l), sink(std::move(s)) {}

    bool enabled(log_level l) const {
        return static_cast<int>(l) <= static_cast<int>(level);
    }

    void write(log_level l, const char* tag, const std::string& message) const;
};

namespace detail {
    /// printf-style formatting into a std::string.
    std::string format_log(const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 1, 2)))
#endif
        ;
}

}  // namespace strata

#define STRATA_LOG(lg, lvl, tag, fmt, ...) \
    do { \
        if ((lg).enabled(lvl)) { \
            (lg).write(lvl, tag, strata::detail::format_log(fmt, ##__VA_ARGS__)); \
        } \
    } while(0)

#define LOG_ERROR(lg, tag, fmt, ...) STRATA_LOG(lg, strata::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(lg, tag, fmt, ...)  STRATA_LOG(lg, strata::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(lg, tag, fmt, ...)  STRATA_LOG(lg, strata::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(lg, tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(lg, tag, fmt, ...) STRATA_LOG(lg, strata::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
