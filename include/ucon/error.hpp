#pragma once

namespace ucon {

/// status codes of the syscall interface
/// @note values are passed unchanged to userspace callbacks
enum class error_code : int {
    success = 0,
    fail = -1,
    busy = -2,
    already = -3,
    off = -4,
    reserve = -5,
    invalid = -6,
    size = -7,
    cancel = -8,
    no_memory = -9,
    no_support = -10
};

constexpr int to_int(error_code ec) noexcept {
    return static_cast<int>(ec);
}

constexpr const char *to_string(error_code ec) noexcept {
    switch (ec) {
    case error_code::success: return "success";
    case error_code::fail: return "fail";
    case error_code::busy: return "busy";
    case error_code::already: return "already";
    case error_code::off: return "off";
    case error_code::reserve: return "reserve";
    case error_code::invalid: return "invalid";
    case error_code::size: return "size";
    case error_code::cancel: return "cancel";
    case error_code::no_memory: return "no_memory";
    case error_code::no_support: return "no_support";
    }
    return "unknown";
}

}
