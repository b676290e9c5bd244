#pragma once

#include <ucon/detail/owned_buffer.hpp>
#include <ucon/error.hpp>

#include <cstddef>

namespace ucon {

using process_id = unsigned;

struct process_memory_tag {};

/// byte range inside the memory of a process, shared via allow
using app_slice = owned_buffer<process_memory_tag>;

/**
 * Completion notifier registered by a process via subscribe.
 *
 * Holds the upcall function and an opaque argument of the process.
 * An empty callback is valid and ignores every schedule.
 */
struct callback {
    using function_t = void (*)(int, std::size_t, std::size_t, void *);

    constexpr callback() noexcept = default;
    constexpr callback(function_t fn, void *userdata) noexcept
        : fn_(fn), userdata_(userdata) {}

    constexpr explicit operator bool() const noexcept {
        return fn_ != nullptr;
    }

    void schedule(int r0, std::size_t r1, std::size_t r2) const noexcept {
        if (fn_) fn_(r0, r1, r2, userdata_);
    }

    void schedule(error_code ec, std::size_t r1, std::size_t r2) const noexcept {
        schedule(to_int(ec), r1, r2);
    }

private:
    function_t fn_ = nullptr;
    void *userdata_ = nullptr;
};

}
