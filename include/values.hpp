// values.hpp -- the runtime value representation

#ifndef __ADSO_VALUES_HPP
#define __ADSO_VALUES_HPP

#include "base.hpp"

namespace adso {

enum value_tag : u8 {
    TAG_INT,
    TAG_BOOL
};

// Values are small and always copied. Only one field of the union is valid,
// selected by tag.
struct value {
    value_tag tag;
    union {
        i64 num;
        bool b;
    } d;
};

// make values
inline value vbox_int(i64 num) {
    value res;
    res.tag = TAG_INT;
    res.d.num = num;
    return res;
}
inline value vbox_bool(bool b) {
    value res;
    res.tag = TAG_BOOL;
    res.d.b = b;
    return res;
}

// type information
inline bool vis_int(value v) {
    return v.tag == TAG_INT;
}
inline bool vis_bool(value v) {
    return v.tag == TAG_BOOL;
}

// unboxing. No type checking is done here.
inline i64 vint(value v) {
    return v.d.num;
}
inline bool vbool(value v) {
    return v.d.b;
}

// name of the value's type as written in source code, i.e. "int" or "bool"
const char* v_type_name(value v);

}

#endif
