#pragma once

#include <cstddef>

namespace ucon {

/**
 * Move-only handle to a byte range owned by somebody else.
 *
 * The handle is either present (points to a range) or empty.
 * Moving it transfers the range and leaves the source empty,
 * so at any time at most one handle refers to the same range.
 *
 * `Tag` separates kernel owned buffers from process memory.
 */
template<typename Tag>
class owned_buffer {
public:
    constexpr owned_buffer() noexcept = default;

    constexpr owned_buffer(unsigned char *data, std::size_t length) noexcept
        : data_(data), length_(data ? length : 0) {}

    template<std::size_t N>
    constexpr explicit owned_buffer(unsigned char (&data)[N]) noexcept
        : data_(data), length_(N) {}

    owned_buffer(owned_buffer const &) = delete;
    owned_buffer &operator=(owned_buffer const &) = delete;

    constexpr owned_buffer(owned_buffer &&other) noexcept
        : data_(other.data_), length_(other.length_) {
        other.data_ = nullptr;
        other.length_ = 0;
    }

    constexpr owned_buffer &operator=(owned_buffer &&other) noexcept {
        if (this != &other) {
            data_ = other.data_;
            length_ = other.length_;
            other.data_ = nullptr;
            other.length_ = 0;
        }
        return *this;
    }

    constexpr explicit operator bool() const noexcept {
        return data_ != nullptr;
    }

    /// leaves this handle empty and returns the range it held
    constexpr owned_buffer take() noexcept {
        return owned_buffer(static_cast<owned_buffer &&>(*this));
    }

    constexpr unsigned char *data() const noexcept { return data_; }
    constexpr std::size_t length() const noexcept { return length_; }

private:
    unsigned char *data_ = nullptr;
    std::size_t length_ = 0;
};

}
