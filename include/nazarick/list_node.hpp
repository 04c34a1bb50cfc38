/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef>
#include <iterator>

namespace nazarick {

/// Node of intrusive circular doubly linked list. T derives from
/// list_node<T>. Node which isn't linked anywhere points to itself, so it
/// serves as list head too.
template<typename T>
class list_node {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T *;
        using reference = T &;

        explicit iterator(list_node *p = nullptr) noexcept : p(p) {}
        T & operator * () const noexcept { return *p->get(); }
        T * operator -> () const noexcept { return p->get(); }
        iterator & operator ++ () noexcept
        {
            p = p->next;
            return *this;
        }
        bool operator == (const iterator &rhs) const noexcept
        {
            return p == rhs.p;
        }
        bool operator != (const iterator &rhs) const noexcept
        {
            return p != rhs.p;
        }

    private:
        list_node *p;
    };

    list_node() noexcept : next(this), prev(this) {}
    list_node(const list_node &) = delete;
    void operator = (const list_node &) = delete;

    bool empty() const noexcept { return next == this; }

    size_t size() const noexcept
    {
        size_t res = 0;
        for (const list_node *p = next; p != this; p = p->next)
            ++res;
        return res;
    }

    iterator begin() noexcept { return iterator(next); }
    iterator end() noexcept { return iterator(this); }

    void push_back(list_node *other) noexcept
    {
        other->next = this;
        other->prev = prev;
        prev->next = other;
        prev = other;
    }

    /// No-op for node which isn't linked.
    void remove_from_list() noexcept
    {
        next->prev = prev;
        prev->next = next;
        next = prev = this;
    }

private:
    T * get() noexcept
    {
        // Subtracts offset of the base.
        return static_cast<T *>(this);
    }

    list_node *next;
    list_node *prev;
};

} // namespace nazarick
