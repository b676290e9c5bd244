#pragma once

#include <ucon/process.hpp>

namespace ucon {

/**
 * Intrusive singly linked list of per-process entries,
 * kept in the order the processes attached.
 */
template<typename EntryData>
struct process_list {
    struct entry_t : EntryData {
        process_id pid = 0;
        entry_t *next = nullptr;
    };

    void append(entry_t &e) noexcept {
        e.next = nullptr;
        entry_t **tail = &attached_;
        while (*tail != nullptr) {
            tail = &(*tail)->next;
        }
        *tail = &e;
    }

    void remove(entry_t &e) noexcept {
        entry_t **prev_next = &attached_;
        for (entry_t *entry = attached_; entry != nullptr; entry = entry->next) {
            if (entry == &e) {
                *prev_next = e.next;
                e.next = nullptr;
                return;
            }
            prev_next = &entry->next;
        }
    }

    entry_t *find(process_id pid) noexcept {
        for (auto &entry : *this) {
            if (entry.pid == pid) return &entry;
        }
        return nullptr;
    }

    bool empty() const noexcept {
        return attached_ == nullptr;
    }

    struct iterator {
        void operator++() noexcept {
            entry_ = entry_->next;
        }

        entry_t *operator->() noexcept {
            return entry_;
        }

        entry_t &operator*() noexcept {
            return *entry_;
        }

        bool operator==(iterator const &rhs) const noexcept {
            return entry_ == rhs.entry_;
        }

        bool operator!=(iterator const &rhs) const noexcept {
            return !(*this == rhs);
        }

        entry_t *entry_;
    };

    iterator begin() noexcept {
        return {attached_};
    }

    iterator end() noexcept {
        return {nullptr};
    }

    entry_t *attached_ = nullptr;
};

}
