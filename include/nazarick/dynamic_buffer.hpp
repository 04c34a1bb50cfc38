/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

namespace nazarick {

/// Growable byte arena with a window of not consumed bytes.
///
///     0        begin          begin + length        capacity
///     |consumed|--- unconsumed ---|------ free ------|
///
/// Bytes are appended after the window by push() and consumed from its front
/// by pop(). begin + length <= capacity always holds.
class dynamic_buffer {
public:
    dynamic_buffer() noexcept {}
    dynamic_buffer(const dynamic_buffer &) = delete;
    void operator = (const dynamic_buffer &) = delete;

    /// Append data after the window. If free space is insufficient, capacity
    /// at least doubles (starting from MIN_CAPACITY) until window and data
    /// fit, and the window is moved to the start of new memory.
    /// Returns false if memory can't be allocated. Buffer is unchanged then.
    bool push(const char *data, size_t size) noexcept;
    bool push(std::string_view data) noexcept
    {
        return push(data.data(), data.size());
    }

    /// Consume count bytes from the front of the window.
    /// When begin passes capacity / COMPACT_DIVISOR the window is moved to
    /// offset 0 and the vacated tail is zeroed.
    /// count must not exceed length().
    void pop(size_t count) noexcept;

    /// Position of the first occurrence of s inside window, or npos.
    size_t find(std::string_view s) const noexcept;

    std::string_view view() const noexcept
    {
        return std::string_view(data_.get() + begin_, length_);
    }
    const char * data() const noexcept { return data_.get() + begin_; }
    size_t begin() const noexcept { return begin_; }
    size_t length() const noexcept { return length_; }
    size_t capacity() const noexcept { return capacity_; }
    size_t free_space() const noexcept
    {
        return capacity_ - begin_ - length_;
    }
    bool empty() const noexcept { return !length_; }

    static constexpr size_t npos = std::string_view::npos;
    /// Capacity of the first allocation and the base of all capacities.
    static constexpr size_t MIN_CAPACITY = 32;
    /// Compaction starts when more than capacity / COMPACT_DIVISOR bytes at
    /// the front are consumed.
    static constexpr size_t COMPACT_DIVISOR = 2;

private:
    void compact() noexcept;

    std::unique_ptr<char[]> data_;
    size_t capacity_ = 0;
    size_t begin_ = 0;
    size_t length_ = 0;
};

} // namespace nazarick
