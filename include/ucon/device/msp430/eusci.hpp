#pragma once

#include <ucon/uart.hpp>

#include <cstddef>
#include <utility>

#if defined(UCON_DEV_MSP430_ENABLE_EUSCIA0) || defined(UCON_DEV_MSP430_ENABLE_EUSCIA1)
#include <msp430.h>
#endif

namespace ucon::dev::msp430 {

struct eusci_uart_base {
    struct transfer_t {
        static_buffer buffer;
        std::size_t length = 0;
        std::size_t position = 0;
    };

    static constexpr std::size_t clamp(std::size_t length, static_buffer const &buffer) noexcept {
        return length < buffer.length() ? length : buffer.length();
    }
};

/**
 * Interrupt driven uart transport on top of an eUSCI_A module.
 *
 * Transmits one byte per transmit complete interrupt and stores one
 * byte per receive interrupt. Completions are forwarded to
 * `Client::transmitted` and `Client::received` from interrupt context.
 *
 * HWLayer provides register access:
 *   enable/disable_tx_interrupt, tx_busy, tx_interrupt_pending,
 *   raise_tx_interrupt, write(byte),
 *   enable/disable_rx_interrupt, raise_rx_interrupt, rx_status(), read()
 */
template<typename HWLayer, typename Client>
struct eusci_uart : eusci_uart_base {
    using base = eusci_uart_base;

    static void transmit(static_buffer &&buffer, std::size_t length) noexcept {
        HWLayer::disable_tx_interrupt();
        tx_.buffer = std::move(buffer);
        tx_.length = base::clamp(length, tx_.buffer);
        tx_.position = 0;

        if (not HWLayer::tx_busy() && not HWLayer::tx_interrupt_pending()) {
            HWLayer::raise_tx_interrupt(); // let the ISR do the dirty work
        }
        HWLayer::enable_tx_interrupt();
    }

    static void receive(static_buffer &&buffer, std::size_t length) noexcept {
        HWLayer::disable_rx_interrupt();
        rx_.buffer = std::move(buffer);
        rx_.length = base::clamp(length, rx_.buffer);
        rx_.position = 0;
        rx_abort_ = false;

        if (rx_.length == 0) {
            // nothing to wait for, complete from the ISR
            HWLayer::raise_rx_interrupt();
        }
        HWLayer::enable_rx_interrupt();
    }

    static void abort_receive() noexcept {
        if (!rx_.buffer) return;
        rx_abort_ = true;
        HWLayer::raise_rx_interrupt();
    }

    static bool tx_active() noexcept { return static_cast<bool>(tx_.buffer); }
    static bool rx_active() noexcept { return static_cast<bool>(rx_.buffer); }

    static void reset() noexcept {
        tx_ = base::transfer_t{};
        rx_ = base::transfer_t{};
        rx_abort_ = false;
    }

private:
    friend HWLayer;

    // UCTXCPTIFG: last byte left the shift register
    static void handle_tx_complete() noexcept {
        if (!tx_.buffer) {
            HWLayer::disable_tx_interrupt();
            return;
        }
        if (tx_.position < tx_.length) {
            HWLayer::write(tx_.buffer.data()[tx_.position]);
            tx_.position = tx_.position + 1;
            return;
        }

        HWLayer::disable_tx_interrupt();
        std::size_t sent = tx_.position;
        Client::transmitted(tx_.buffer.take(), sent, uart_status::none);
    }

    // UCRXIFG: byte received, or raised by software to complete early
    static void handle_rx() noexcept {
        if (!rx_.buffer) {
            // nobody is reading, drop the byte
            (void)HWLayer::read();
            return;
        }

        uart_status status = uart_status::none;
        if (rx_abort_) {
            status = uart_status::aborted;
        } else if (rx_.position < rx_.length) {
            // status has to be sampled before reading clears it
            status = HWLayer::rx_status();
            unsigned char byte = HWLayer::read();
            if (status == uart_status::none) {
                rx_.buffer.data()[rx_.position] = byte;
                rx_.position = rx_.position + 1;
                if (rx_.position < rx_.length) return;
            }
        }

        HWLayer::disable_rx_interrupt();
        rx_abort_ = false;
        std::size_t received = rx_.position;
        Client::received(rx_.buffer.take(), received, status);
    }

    static inline base::transfer_t tx_;
    static inline base::transfer_t rx_;
    static inline bool rx_abort_ = false;
};

#if defined(UCON_DEV_MSP430_ENABLE_EUSCIA0) || defined(UCON_DEV_MSP430_ENABLE_EUSCIA1)
/// maps the error bits of UCAxSTATW
inline uart_status eusci_status(unsigned statw) noexcept {
    if (statw & UCOE) return uart_status::overrun;
    if (statw & UCPE) return uart_status::parity;
    if (statw & UCFE) return uart_status::framing;
    if (statw & UCBRK) return uart_status::break_condition;
    if (statw & UCRXERR) return uart_status::failure;
    return uart_status::none;
}
#endif

#ifdef UCON_DEV_MSP430_ENABLE_EUSCIA0
/// completion sink of eusci_a0, defined by the board
struct eusci_a0_client {
    static void transmitted(static_buffer buffer, std::size_t length, uart_status status) noexcept;
    static void received(static_buffer buffer, std::size_t length, uart_status status) noexcept;
};

struct eusci_a0_layer {
    static void enable_tx_interrupt() noexcept {
        UCA0IE = UCA0IE | UCTXCPTIE;
    }

    static void disable_tx_interrupt() noexcept {
        UCA0IE = UCA0IE & ~UCTXCPTIE;
    }

    static bool tx_busy() noexcept {
        return UCA0STATW & UCBUSY;
    }

    static bool tx_interrupt_pending() noexcept {
        return UCA0IFG & UCTXCPTIFG;
    }

    static void raise_tx_interrupt() noexcept {
        UCA0IFG = UCA0IFG | UCTXCPTIFG;
    }

    static void write(unsigned char byte) noexcept {
        UCA0TXBUF_L = byte;
    }

    static void enable_rx_interrupt() noexcept {
        UCA0IE = UCA0IE | UCRXIE;
    }

    static void disable_rx_interrupt() noexcept {
        UCA0IE = UCA0IE & ~UCRXIE;
    }

    static void raise_rx_interrupt() noexcept {
        UCA0IFG = UCA0IFG | UCRXIFG;
    }

    static uart_status rx_status() noexcept {
        return eusci_status(UCA0STATW);
    }

    static unsigned char read() noexcept {
        return UCA0RXBUF_L;
    }

    static void __attribute__((interrupt(USCI_A0_VECTOR))) isr();
};

using eusci_a0 = eusci_uart<eusci_a0_layer, eusci_a0_client>;
#endif

#ifdef UCON_DEV_MSP430_ENABLE_EUSCIA1
/// completion sink of eusci_a1, defined by the board
struct eusci_a1_client {
    static void transmitted(static_buffer buffer, std::size_t length, uart_status status) noexcept;
    static void received(static_buffer buffer, std::size_t length, uart_status status) noexcept;
};

struct eusci_a1_layer {
    static void enable_tx_interrupt() noexcept {
        UCA1IE = UCA1IE | UCTXCPTIE;
    }

    static void disable_tx_interrupt() noexcept {
        UCA1IE = UCA1IE & ~UCTXCPTIE;
    }

    static bool tx_busy() noexcept {
        return UCA1STATW & UCBUSY;
    }

    static bool tx_interrupt_pending() noexcept {
        return UCA1IFG & UCTXCPTIFG;
    }

    static void raise_tx_interrupt() noexcept {
        UCA1IFG = UCA1IFG | UCTXCPTIFG;
    }

    static void write(unsigned char byte) noexcept {
        UCA1TXBUF_L = byte;
    }

    static void enable_rx_interrupt() noexcept {
        UCA1IE = UCA1IE | UCRXIE;
    }

    static void disable_rx_interrupt() noexcept {
        UCA1IE = UCA1IE & ~UCRXIE;
    }

    static void raise_rx_interrupt() noexcept {
        UCA1IFG = UCA1IFG | UCRXIFG;
    }

    static uart_status rx_status() noexcept {
        return eusci_status(UCA1STATW);
    }

    static unsigned char read() noexcept {
        return UCA1RXBUF_L;
    }

    static void __attribute__((interrupt(USCI_A1_VECTOR))) isr();
};

using eusci_a1 = eusci_uart<eusci_a1_layer, eusci_a1_client>;
#endif

}
