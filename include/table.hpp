#ifndef __ADSO_TABLE_HPP
#define __ADSO_TABLE_HPP

#include "base.hpp"

namespace adso {

static const float REHASH_THRESHOLD = 0.3;

/// hash table using linear probing. Used for scope bindings.
template <typename K, typename T> class table {
private:
    // hash table entry
    struct entry {
        const K key;
        T val;

        entry(const K& k, const T& v) : key{k}, val{v} { }
    };

    u32 cap;
    u32 threshold;
    u32 size;
    entry **array;

    void init_array(u32 new_cap) {
        cap = new_cap;
        threshold = (u32)(REHASH_THRESHOLD * cap);
        array = new entry*[cap];
        for (u32 i = 0; i < cap; ++i) {
            array[i] = nullptr;
        }
    }

    // increase the capacity by a factor of 2. this involves recomputing all hashes
    void increase_cap() {
        auto *prev = array;
        auto old_cap = cap;

        init_array(cap*2);
        size = 0;

        // insert the old data, deleting old entries as we go
        for (u32 i = 0; i < old_cap; ++i) {
            if (prev[i] != nullptr) {
                insert(prev[i]->key, prev[i]->val);
                delete prev[i];
            }
        }
        delete[] prev;
    }

    // index of the slot holding k, or of the empty slot where it would go
    u32 probe(const K& k) const {
        u32 i = hash<K>(k) % cap;
        while (array[i] != nullptr && !(array[i]->key == k)) {
            i = (i+1) % cap;
        }
        return i;
    }

    void destroy() {
        if (array == nullptr) {
            return;
        }
        for (u32 i = 0; i < cap; ++i) {
            delete array[i];
        }
        delete[] array;
        array = nullptr;
    }

public:
    table(u32 init_cap=8)
        : size{0} {
        init_array(init_cap);
    }
    table(table<K,T>&& src)
        : cap{src.cap}
        , threshold{src.threshold}
        , size{src.size}
        , array{src.array} {
        src.array = nullptr;
        src.size = 0;
    }
    ~table() {
        destroy();
    }
    table<K,T>& operator=(const table<K,T>& src) = delete;

    // insert/overwrite an entry
    T& insert(const K& k, const T& v) {
        // threshold is < cap, so the table always has an empty slot to stop
        // the probe
        if (size + 1 > threshold) {
            increase_cap();
        }
        auto i = probe(k);
        if (array[i] == nullptr) {
            ++size;
            array[i] = new entry{k, v};
        } else {
            array[i]->val = v;
        }
        return array[i]->val;
    }

    // returns nullptr when no object is associated to the key
    T* get(const K& k) {
        auto i = probe(k);
        return array[i] == nullptr ? nullptr : &array[i]->val;
    }
    const T* get(const K& k) const {
        auto i = probe(k);
        return array[i] == nullptr ? nullptr : &array[i]->val;
    }
};

}

#endif
