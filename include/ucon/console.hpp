#pragma once

#include <ucon/config.hpp>
#include <ucon/detail/grant.hpp>
#include <ucon/error.hpp>
#include <ucon/log.hpp>
#include <ucon/process.hpp>
#include <ucon/uart.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>

namespace ucon {

/**
 * Console driver: shares one uart between many processes.
 *
 * Userspace usage:
 *   1. subscribe(1, cb)            (optional) write done callback
 *   2. allow(1, buffer)            share the bytes to send
 *   3. command(1, length)          start the transmission
 *
 * The shared buffer is released after it has been written, so every
 * write needs a new allow. Reads work the same way with number 2 and
 * have to fit into the receive buffer of the driver.
 *
 * Only one transmission is on the wire at a time. Writes which do not
 * fit into the transmit buffer are sent in several chunks; processes
 * which want to write while the uart is busy are marked pending and
 * started in attachment order once it becomes idle.
 *
 * `Transport` has to forward its completions to transmitted() and
 * received() of this instance.
 */
template<typename Transport, typename Log = null_log,
         unsigned NrProcesses = UCON_NUMBER_OF_PROCESSES>
class console {
public:
    static constexpr unsigned driver_num = UCON_CONSOLE_DRIVER_NUM;

    enum allow_num : unsigned {
        allow_write = 1,
        allow_read = 2
    };

    enum subscribe_num : unsigned {
        subscribe_write_done = 1,
        subscribe_read_done = 2
    };

    enum command_num : unsigned {
        command_probe = 0,
        command_write = 1,
        command_read = 2,
        command_abort_read = 3
    };

    struct app_state {
        callback write_callback;
        app_slice write_buffer;
        std::size_t write_len = 0;
        // bytes which were not handed to the uart yet
        std::size_t write_remaining = 0;
        // position of the next unsent byte in write_buffer
        std::size_t write_offset = 0;
        bool pending_write = false;

        callback read_callback;
        app_slice read_buffer;
        std::size_t read_len = 0;
    };

    console(static_buffer tx_buffer, static_buffer rx_buffer) noexcept
        : tx_slot_(std::move(tx_buffer)), rx_slot_(std::move(rx_buffer)) {}

    console(console const &) = delete;
    console &operator=(console const &) = delete;

    /**
     * share a buffer of `pid` with the driver
     *
     * - 1: bytes to write
     * - 2: destination of the next read
     *
     * An empty slice removes the current one.
     */
    error_code allow(process_id pid, unsigned num, app_slice slice) {
        switch (num) {
        case allow_write:
            return apps_.enter(pid, [&](app_state &app) {
                // the driver still holds the buffer of a running write
                if (app.pending_write || app.write_remaining > 0) {
                    return error_code::busy;
                }
                app.write_buffer = std::move(slice);
                return error_code::success;
            });
        case allow_read:
            return apps_.enter(pid, [&](app_state &app) {
                app.read_buffer = std::move(slice);
                return error_code::success;
            });
        default:
            return error_code::no_support;
        }
    }

    /**
     * - 1: write done, called with (status, bytes written, 0)
     * - 2: read done, called with (status, bytes read, 0)
     */
    error_code subscribe(process_id pid, unsigned num, callback cb) {
        switch (num) {
        case subscribe_write_done:
            return apps_.enter(pid, [&](app_state &app) {
                app.write_callback = cb;
                return error_code::success;
            });
        case subscribe_read_done:
            return apps_.enter(pid, [&](app_state &app) {
                app.read_callback = cb;
                return error_code::success;
            });
        default:
            return error_code::no_support;
        }
    }

    /**
     * - 0: driver present
     * - 1: write up to `arg1` bytes of the allowed write buffer
     * - 2: read up to `arg1` bytes into the allowed read buffer
     * - 3: abort the running read, the read callback of its
     *      process reports what was received so far
     */
    error_code command(process_id pid, unsigned num, std::size_t arg1, std::size_t) {
        switch (num) {
        case command_probe:
            return error_code::success;
        case command_write: {
            error_code ec = apps_.enter(pid, [&](app_state &app) {
                return send_new(pid, app, arg1);
            });
            finish_nested();
            return ec;
        }
        case command_read: {
            error_code ec = apps_.enter(pid, [&](app_state &app) {
                return receive_new(pid, app, arg1);
            });
            finish_nested();
            return ec;
        }
        case command_abort_read:
            if (rx_owner_ && !rx_orphaned_) {
                Transport::abort_receive();
            }
            return error_code::success;
        default:
            return error_code::no_support;
        }
    }

    /**
     * drops the state of a terminated process
     *
     * Transfers of `pid` which are on the wire complete without
     * notification, the buffers always return to the driver.
     */
    error_code release(process_id pid) {
        error_code ec = apps_.release(pid);
        if (ec != error_code::success) return ec;

        if (tx_owner_ && *tx_owner_ == pid) {
            tx_orphaned_ = true;
        }
        if (rx_owner_ && *rx_owner_ == pid && !rx_orphaned_) {
            rx_orphaned_ = true;
            Transport::abort_receive();
        }
        Log::debug("console: released process %u", pid);
        return error_code::success;
    }

    /// completion of Transport::transmit
    void transmitted(static_buffer buffer, std::size_t tx_len, uart_status status) {
        if (!buffer) {
            Log::error("console: transmit completed without buffer");
        }
        tx_slot_ = std::move(buffer);
        if (status != uart_status::none) {
            Log::warn("console: transmit of %u bytes finished with status %u",
                      static_cast<unsigned>(tx_len), static_cast<unsigned>(status));
        }

        std::optional<process_id> owner = tx_owner_;
        bool orphaned = tx_orphaned_;
        tx_owner_.reset();
        tx_orphaned_ = false;

        callback done;
        error_code result = error_code::success;
        std::size_t written = 0;
        bool notify = false;

        if (owner && !orphaned) {
            error_code ec = apps_.enter_existing(*owner, [&](app_state &app) {
                bool more = false;
                error_code cont = send_continue(*owner, app, more);
                if (cont != error_code::success) {
                    Log::error("console: cannot continue write of process %u (%s)",
                               *owner, to_string(cont));
                    reset_write(app);
                    result = cont;
                    notify = true;
                } else if (!more) {
                    written = app.write_len;
                    app.write_len = 0;
                    app.write_offset = 0;
                    notify = true;
                }
                done = app.write_callback;
                return error_code::success;
            });
            if (ec != error_code::success) {
                Log::error("console: cannot complete write of process %u (%s)",
                           *owner, to_string(ec));
            }
            // state is in use further up the stack, report once it is free
            if (ec == error_code::reserve) {
                tx_nested_ = *owner;
            }
            finish_nested();
        }

        if (!tx_owner_) {
            start_pending();
        }

        // after arbitration, so a new write from the callback has to wait its turn
        if (notify) {
            done.schedule(result, written, 0);
        }
    }

    /// completion of Transport::receive
    void received(static_buffer buffer, std::size_t rx_len, uart_status status) {
        if (!buffer) {
            Log::error("console: receive completed without buffer");
        }
        rx_slot_ = std::move(buffer);

        std::optional<process_id> owner = rx_owner_;
        bool orphaned = rx_orphaned_;
        rx_owner_.reset();
        rx_orphaned_ = false;

        if (!owner || orphaned) return;

        callback done;
        error_code result = error_code::fail;
        std::size_t count = 0;

        error_code ec = apps_.enter_existing(*owner, [&](app_state &app) {
            done = app.read_callback;
            std::size_t read_len = app.read_len;
            app.read_len = 0;

            if (status == uart_status::none || status == uart_status::aborted) {
                app_slice dest = app.read_buffer.take();
                if (dest) {
                    count = std::min({rx_len, read_len, dest.length(), rx_slot_.length()});
                    std::copy_n(rx_slot_.data(), count, dest.data());
                    result = status == uart_status::none ? error_code::success
                                                         : error_code::cancel;
                } else {
                    result = error_code::invalid;
                }
            } else {
                Log::warn("console: receive of process %u failed with status %u",
                          *owner, static_cast<unsigned>(status));
                result = error_code::fail;
            }
            return error_code::success;
        });
        if (ec != error_code::success) {
            Log::error("console: cannot complete read of process %u (%s)",
                       *owner, to_string(ec));
            if (ec == error_code::reserve) {
                rx_nested_ = *owner;
            }
            return;
        }

        done.schedule(result, count, 0);
    }

    bool tx_idle() const noexcept { return !tx_owner_; }
    bool rx_idle() const noexcept { return !rx_owner_; }

    bool attached(process_id pid) noexcept { return apps_.attached(pid); }

private:
    error_code send_new(process_id pid, app_state &app, std::size_t len) {
        bool owns_tx = tx_owner_ && *tx_owner_ == pid && !tx_orphaned_;
        if (!app.write_buffer || app.pending_write || app.write_remaining > 0 || owns_tx) {
            return error_code::busy;
        }

        app_slice slice = app.write_buffer.take();
        app.write_len = std::min(len, slice.length());
        app.write_remaining = app.write_len;
        app.write_offset = 0;

        error_code ec = send(pid, app, std::move(slice));
        if (ec != error_code::success) {
            reset_write(app);
        }
        return ec;
    }

    /// `more` is set if another chunk went to the uart
    error_code send_continue(process_id pid, app_state &app, bool &more) {
        more = false;
        if (app.write_remaining == 0) return error_code::success;

        app_slice slice = app.write_buffer.take();
        if (!slice) return error_code::reserve;

        error_code ec = send(pid, app, std::move(slice));
        more = ec == error_code::success;
        return ec;
    }

    /**
     * hands the next chunk of `slice` to the uart, or marks the
     * process pending if the uart is busy
     */
    error_code send(process_id pid, app_state &app, app_slice slice) {
        if (tx_owner_) {
            app.pending_write = true;
            app.write_buffer = std::move(slice);
            return error_code::success;
        }

        if (!tx_slot_) {
            Log::error("console: transmit buffer missing while idle");
            return error_code::reserve;
        }

        std::size_t chunk = std::min(app.write_remaining, tx_slot_.length());
        if (app.write_offset + chunk > slice.length()) {
            return error_code::reserve;
        }

        tx_owner_ = pid;
        tx_orphaned_ = false;

        static_buffer buffer = tx_slot_.take();
        std::copy_n(slice.data() + app.write_offset, chunk, buffer.data());
        app.write_offset += chunk;
        app.write_remaining -= chunk;
        if (app.write_remaining > 0) {
            app.write_buffer = std::move(slice);
        }

        Log::debug("console: process %u transmits %u bytes, %u remaining", pid,
                   static_cast<unsigned>(chunk),
                   static_cast<unsigned>(app.write_remaining));
        Transport::transmit(std::move(buffer), chunk);
        return error_code::success;
    }

    /// starts the first pending write in attachment order
    void start_pending() {
        apps_.each([&](process_id pid, app_state &app) {
            if (!app.pending_write) return false;
            app.pending_write = false;

            app_slice slice = app.write_buffer.take();
            error_code ec = slice ? send(pid, app, std::move(slice)) : error_code::reserve;
            if (ec != error_code::success) {
                Log::error("console: cannot start pending write of process %u (%s)",
                           pid, to_string(ec));
                callback cb = app.write_callback;
                reset_write(app);
                cb.schedule(ec, 0, 0);
                return false;
            }
            return true;
        });
        finish_nested();
    }

    /**
     * reports transfers whose completion arrived while the state of
     * their process was entered
     *
     * The write or read is dropped and its callback gets `reserve`.
     */
    void finish_nested() {
        if (tx_nested_) {
            process_id pid = *tx_nested_;
            callback cb;
            error_code ec = apps_.enter_existing(pid, [&](app_state &app) {
                cb = app.write_callback;
                reset_write(app);
                return error_code::success;
            });
            // still entered, the outer call reports it
            if (ec == error_code::reserve) return;
            tx_nested_.reset();
            if (ec == error_code::success) {
                cb.schedule(error_code::reserve, 0, 0);
            }
        }
        if (rx_nested_) {
            process_id pid = *rx_nested_;
            callback cb;
            error_code ec = apps_.enter_existing(pid, [&](app_state &app) {
                cb = app.read_callback;
                app.read_len = 0;
                return error_code::success;
            });
            if (ec == error_code::reserve) return;
            rx_nested_.reset();
            if (ec == error_code::success) {
                cb.schedule(error_code::reserve, 0, 0);
            }
        }
    }

    error_code receive_new(process_id pid, app_state &app, std::size_t len) {
        if (rx_owner_ || !rx_slot_) return error_code::busy;
        if (!app.read_buffer) return error_code::invalid;

        std::size_t read_len = std::min(len, app.read_buffer.length());
        // no incremental reads, a read has to fit into the receive buffer
        if (read_len == 0 || read_len > rx_slot_.length()) {
            return error_code::size;
        }

        app.read_len = read_len;
        rx_owner_ = pid;
        rx_orphaned_ = false;
        Transport::receive(rx_slot_.take(), read_len);
        return error_code::success;
    }

    static void reset_write(app_state &app) noexcept {
        app.write_buffer = app_slice{};
        app.write_len = 0;
        app.write_remaining = 0;
        app.write_offset = 0;
        app.pending_write = false;
    }

    grant<app_state, NrProcesses> apps_;

    std::optional<process_id> tx_owner_;
    bool tx_orphaned_ = false;
    std::optional<process_id> tx_nested_;
    static_buffer tx_slot_;

    std::optional<process_id> rx_owner_;
    bool rx_orphaned_ = false;
    std::optional<process_id> rx_nested_;
    static_buffer rx_slot_;
};

}
