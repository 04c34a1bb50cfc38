/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/dynamic_buffer.hpp>

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <new>

#include <nazarick/log.hpp>

namespace nazarick {

constexpr size_t dynamic_buffer::npos;
constexpr size_t dynamic_buffer::MIN_CAPACITY;
constexpr size_t dynamic_buffer::COMPACT_DIVISOR;

bool dynamic_buffer::push(const char *data, size_t size) noexcept
{
    if (!size)
        return true;

    if (free_space() < size) {
        size_t new_capacity = capacity_ ? 2 * capacity_ : MIN_CAPACITY;
        while (new_capacity < length_ + size) {
            if (new_capacity > SIZE_MAX / 2) {
                nazarick_log(LOG_EMERG, "Buffer size overflow");
                return false;
            }
            new_capacity *= 2;
        }

        // Value-initialized, so free space is zeroed.
        std::unique_ptr<char[]> new_data(new (std::nothrow) char[new_capacity]());
        if (!new_data) {
            nazarick_log(LOG_EMERG, "Not enough memory for buffer of %zu bytes",
                    new_capacity);
            return false;
        }
        if (length_)
            memcpy(new_data.get(), data_.get() + begin_, length_);
        data_ = std::move(new_data);
        capacity_ = new_capacity;
        begin_ = 0;
    }

    memcpy(data_.get() + begin_ + length_, data, size);
    length_ += size;
    assert(begin_ + length_ <= capacity_);
    return true;
}

void dynamic_buffer::pop(size_t count) noexcept
{
    assert(count <= length_);
    count = std::min(count, length_);
    begin_ += count;
    length_ -= count;
    if (begin_ > capacity_ / COMPACT_DIVISOR)
        compact();
}

void dynamic_buffer::compact() noexcept
{
    char *p = data_.get();
    memmove(p, p + begin_, length_);
    memset(p + length_, 0, begin_);
    begin_ = 0;
}

size_t dynamic_buffer::find(std::string_view s) const noexcept
{
    return view().find(s);
}

} // namespace nazarick
