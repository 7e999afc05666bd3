#include "builtin.hpp"

namespace adso {

void builtin_print(interpreter* inter, const value* arg) {
    (*inter->get_output()) << vint(*arg) << '\n';
}

void install_builtins(interpreter& inter) {
    inter.add_builtin_function("print", string{"int"}, builtin_print);
}

}
