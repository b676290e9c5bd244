#pragma once

#include <ucon/detail/owned_buffer.hpp>

namespace ucon {

struct kernel_memory_tag {};

/// buffer handed between the console and the uart transport
using static_buffer = owned_buffer<kernel_memory_tag>;

enum class uart_status : unsigned char {
    none = 0,
    aborted,
    overrun,
    parity,
    framing,
    break_condition,
    failure
};

/*
 * A uart transport is a layer with static functions:
 *
 *   static void transmit(static_buffer &&buffer, std::size_t length);
 *   static void receive(static_buffer &&buffer, std::size_t length);
 *   static void abort_receive();
 *
 * Every accepted transmit and receive completes exactly once by handing
 * the buffer back to its client together with the number of bytes
 * transferred and an uart_status. Completions never happen from within
 * transmit, receive or abort_receive.
 */

}
