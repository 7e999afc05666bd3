#ifndef __ADSO_BUILTIN_HPP
#define __ADSO_BUILTIN_HPP

#include "interpret.hpp"

namespace adso {

// install all the builtin functions in the interpreter's root scope
void install_builtins(interpreter& inter);

// print(int) writes its argument and a newline to the interpreter output. The
// argument was already checked against the declared parameter type by the call.
void builtin_print(interpreter* inter, const value* arg);

}

#endif
