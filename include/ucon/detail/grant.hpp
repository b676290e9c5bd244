#pragma once

#include <ucon/config.hpp>
#include <ucon/detail/process_list.hpp>
#include <ucon/error.hpp>
#include <ucon/process.hpp>

namespace ucon {

/**
 * Fixed capacity table of per-process driver state.
 *
 * State is created zero-initialized the first time a process enters
 * and destroyed by release. Only one access to an entry may be active
 * at a time; nested access is reported as error_code::reserve.
 */
template<typename T, unsigned NrProcesses = UCON_NUMBER_OF_PROCESSES>
class grant {
    struct slot_data {
        T data{};
        bool allocated = false;
        bool entered = false;
    };

    using list_t = process_list<slot_data>;
    using entry_t = typename list_t::entry_t;

public:
    /// runs `f(T &)` on the state of `pid`, creating it if necessary
    template<typename Func>
    error_code enter(process_id pid, Func &&f) {
        entry_t *entry = attached_.find(pid);
        if (!entry) {
            entry = allocate(pid);
            if (!entry) return error_code::no_memory;
        }
        return run(*entry, f);
    }

    /// like enter, but never creates state
    template<typename Func>
    error_code enter_existing(process_id pid, Func &&f) {
        entry_t *entry = attached_.find(pid);
        if (!entry) return error_code::invalid;
        return run(*entry, f);
    }

    /**
     * calls `f(process_id, T &)` for every attached process in
     * attachment order until `f` returns true
     *
     * @note entries which are entered right now are skipped
     */
    template<typename Func>
    void each(Func &&f) {
        for (auto &entry : attached_) {
            if (entry.entered) continue;
            entry.entered = true;
            bool stop = f(entry.pid, entry.data);
            entry.entered = false;
            if (stop) return;
        }
    }

    error_code release(process_id pid) noexcept {
        entry_t *entry = attached_.find(pid);
        if (!entry) return error_code::invalid;
        if (entry->entered) return error_code::reserve;
        attached_.remove(*entry);
        entry->data = T{};
        entry->allocated = false;
        return error_code::success;
    }

    bool attached(process_id pid) noexcept {
        return attached_.find(pid) != nullptr;
    }

    unsigned size() noexcept {
        unsigned n = 0;
        for (auto &entry : attached_) {
            (void)entry;
            n++;
        }
        return n;
    }

private:
    entry_t *allocate(process_id pid) noexcept {
        for (auto &entry : entries_) {
            if (!entry.allocated) {
                entry.allocated = true;
                entry.entered = false;
                entry.pid = pid;
                entry.data = T{};
                attached_.append(entry);
                return &entry;
            }
        }
        return nullptr;
    }

    template<typename Func>
    error_code run(entry_t &entry, Func &f) {
        if (entry.entered) return error_code::reserve;
        entry.entered = true;
        error_code ec = f(entry.data);
        entry.entered = false;
        return ec;
    }

    entry_t entries_[NrProcesses];
    list_t attached_;
};

}
