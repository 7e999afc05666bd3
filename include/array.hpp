#ifndef __ADSO_ARRAY_HPP
#define __ADSO_ARRAY_HPP

#include <cstdlib>
#include <new>
#include <type_traits>
#include <utility>

#include "base.hpp"

namespace adso {

// Dynamic array type. This is a lightweight alternative to std::vector used
// for the interpreter's stacks. There is no bounds checking; callers are
// responsible for staying within size.
template<typename t>
struct dyn_array {
    u32 capacity;
    u32 size;
    t* data;

    dyn_array()
        : capacity{16}
        , size{0}
        , data{(t*)malloc(sizeof(t)*capacity)} {
        if (data == nullptr) {
            throw std::bad_alloc{};
        }
    }
    dyn_array(const dyn_array<t>& other) = delete;
    ~dyn_array() {
        clear();
        free(data);
    }
    dyn_array& operator=(const dyn_array<t>& other) = delete;

    void ensure_capacity(u32 min_cap) {
        if (capacity >= min_cap) {
            return;
        }
        auto new_cap = capacity;
        while (new_cap < min_cap) {
            new_cap *= 2;
        }
        if constexpr (std::is_trivially_copyable<t>::value) {
            auto new_data = (t*)realloc(data, new_cap*sizeof(t));
            if (new_data == nullptr) {
                throw std::bad_alloc{};
            }
            data = new_data;
        } else {
            auto old_data = data;
            data = (t*)malloc(new_cap*sizeof(t));
            if (data == nullptr) {
                data = old_data;
                throw std::bad_alloc{};
            }
            for (u32 i = 0; i < size; ++i) {
                new(&data[i]) t{std::move(old_data[i])};
                old_data[i].~t();
            }
            free(old_data);
        }
        capacity = new_cap;
    }
    void push_back(const t& item) {
        ensure_capacity(size + 1);
        new(&data[size]) t{item};
        ++size;
    }
    void push_back(t&& item) {
        ensure_capacity(size + 1);
        new(&data[size]) t{std::move(item)};
        ++size;
    }
    // remove the last element. Must not be called on an empty array.
    void pop_back() {
        --size;
        data[size].~t();
    }
    // shrink the array to new_size elements. Does nothing if the array is
    // already smaller.
    void truncate(u32 new_size) {
        while (size > new_size) {
            pop_back();
        }
    }
    void clear() {
        truncate(0);
    }

    inline t& back() {
        return data[size-1];
    }
    inline t& operator[](u32 i) {
        return data[i];
    }
    inline const t& operator[](u32 i) const {
        return data[i];
    }

    t* begin() {
        return data;
    }
    t* end() {
        return data + size;
    }
    const t* begin() const {
        return data;
    }
    const t* end() const {
        return data + size;
    }
};

}

#endif
