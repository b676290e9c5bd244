#pragma once

namespace ucon {

enum class log_level : unsigned char {
    debug = 0,
    info,
    warn,
    error
};

/**
 * Log layer which discards every message.
 *
 * A log layer provides static printf style functions
 * `debug`, `info`, `warn` and `error`. Drivers take it as
 * template argument, so a disabled log costs nothing.
 */
struct null_log {
    template<typename... Args>
    static void debug(const char *, Args...) noexcept {}

    template<typename... Args>
    static void info(const char *, Args...) noexcept {}

    template<typename... Args>
    static void warn(const char *, Args...) noexcept {}

    template<typename... Args>
    static void error(const char *, Args...) noexcept {}
};

}
