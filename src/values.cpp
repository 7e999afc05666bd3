#include "values.hpp"

namespace adso {

const char* v_type_name(value v) {
    switch (v.tag) {
    case TAG_INT:
        return "int";
    case TAG_BOOL:
        return "bool";
    }
    return "";
}

}
