#include <msp430.h>

#include <ucon/console.hpp>
#include <ucon/device/msp430/eusci.hpp>

#include <cstring>

using namespace ucon;
using dev::msp430::eusci_a1;

static unsigned char tx_buffer[UCON_CONSOLE_BUFFER_SIZE];
static unsigned char rx_buffer[UCON_CONSOLE_BUFFER_SIZE];

using console_t = console<eusci_a1>;

static console_t console_driver{static_buffer(tx_buffer), static_buffer(rx_buffer)};

namespace ucon::dev::msp430 {

void eusci_a1_client::transmitted(static_buffer buffer, std::size_t length, uart_status status) noexcept {
    console_driver.transmitted(std::move(buffer), length, status);
}

void eusci_a1_client::received(static_buffer buffer, std::size_t length, uart_status status) noexcept {
    console_driver.received(std::move(buffer), length, status);
}

}

struct uca1_115200 {
    static inline void init() noexcept {
        P2SEL1 = P2SEL1 | BIT5 | BIT6; // USCI_A1 UART pins
        P2SEL0 = P2SEL0 & ~(BIT5 | BIT6);
        PM5CTL0 = PM5CTL0 & ~LOCKLPM5;

        UCA1CTLW0 = UCSWRST;
        UCA1CTLW0 = UCA1CTLW0 | UCSSEL__SMCLK;
        // 1MHz SMCLK, see Family User Guide table 30-5
        UCA1BRW = 8;
        UCA1MCTLW = 0xD600;
        UCA1CTLW0 = UCA1CTLW0 & ~UCSWRST;
    }
};

// stands in for two processes until the syscall layer is attached
static unsigned char greeting[] = "ucon console ready, type 8 characters\r\n";
static unsigned char line[8];
static unsigned char echo_line[8];
static volatile bool line_ready = false;

static void on_read(int status, std::size_t length, std::size_t, void *) {
    if (status == to_int(error_code::success) && length > 0) {
        line_ready = true;
    }
}

static void on_echo(int, std::size_t, std::size_t, void *) {}

static void require(error_code ec) {
    if (ec == error_code::success) return;
    // board has no other way to report
    for (;;) {
        P1OUT = P1OUT ^ BIT0;
        __delay_cycles(200000);
    }
}

int main() {
    WDTCTL = WDTPW | WDTHOLD;
    P1DIR = P1DIR | BIT0;
    uca1_115200::init();

    constexpr process_id shell = 1;
    constexpr process_id echo = 2;

    require(console_driver.allow(shell, console_t::allow_write, app_slice(greeting, sizeof(greeting) - 1)));
    require(console_driver.command(shell, console_t::command_write, sizeof(greeting) - 1, 0));

    require(console_driver.subscribe(echo, console_t::subscribe_read_done, callback(&on_read, nullptr)));
    require(console_driver.subscribe(echo, console_t::subscribe_write_done, callback(&on_echo, nullptr)));
    require(console_driver.allow(echo, console_t::allow_read, app_slice(line, sizeof(line))));
    require(console_driver.command(echo, console_t::command_read, sizeof(line), 0));

    for (;;) {
        // console state is only touched with interrupts disabled
        __bis_SR_register(LPM0_bits | GIE);
        __disable_interrupt();
        if (line_ready) {
            line_ready = false;
            // busy while the driver still holds echo_line from the last echo
            error_code ec = console_driver.allow(echo, console_t::allow_write, app_slice(echo_line, sizeof(echo_line)));
            if (ec == error_code::success) {
                std::memcpy(echo_line, line, sizeof(line));
                ec = console_driver.command(echo, console_t::command_write, sizeof(echo_line), 0);
            }
            if (ec != error_code::busy) require(ec);
            require(console_driver.allow(echo, console_t::allow_read, app_slice(line, sizeof(line))));
            require(console_driver.command(echo, console_t::command_read, sizeof(line), 0));
        }
    }
}
