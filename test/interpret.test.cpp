#define BOOST_TEST_MODULE Interpreter Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "base.hpp"
#include "interpret.hpp"
#include "log.hpp"
#include "values.hpp"

using namespace adso;

// run src in a fresh interpreter. Returns the error kind (fk_none on success)
// and stores the printed output in *output.
static fault_kind run(const char* src, string* output,
        const interpreter_options& opts=interpreter_options{}) {
    logger log{nullptr, nullptr};
    std::ostringstream out;
    interpreter inter{&log, &out, opts};
    fault err;
    auto ok = inter.interpret_string(src, "<test-input>", &err);
    *output = out.str();
    BOOST_TEST(ok == !err.happened);
    return err.happened ? err.kind : fk_none;
}

static void test_output(const char* src, const char* expected) {
    string output;
    auto kind = run(src, &output);
    BOOST_TEST(string{fault_kind_name(kind)} == fault_kind_name(fk_none));
    BOOST_TEST(output == expected);
}

static void test_fault(const char* src, fault_kind expected,
        const char* expected_output="") {
    string output;
    auto kind = run(src, &output);
    BOOST_TEST(string{fault_kind_name(kind)} == fault_kind_name(expected));
    BOOST_TEST(output == expected_output);
}

BOOST_AUTO_TEST_CASE( factorial_test ) {
    test_output(
        "int fact(int n) {\n"
        "    if (n < 1) { return 1; }\n"
        "    return n * fact(n - 1);\n"
        "}\n"
        "void main() { print(fact(5)); }\n",
        "120\n");
    test_output(
        "int fact(int n) { if (n < 1) { return 1; } return n * fact(n - 1); }"
        "void main() { print(fact(0)); print(fact(1)); print(fact(20)); }",
        "1\n1\n2432902008176640000\n");
}

BOOST_AUTO_TEST_CASE( print_test ) {
    test_output("void main() { }", "");
    test_output("void main() { print(0); print(42); }", "0\n42\n");
    test_output("void main() { print(0 - 5); }", "-5\n");
    // binary expressions nest to the right
    test_output("void main() { print(10 - 3 - 2); }", "9\n");
    test_output("void main() { print(2 * 3 - 4); }", "-2\n");
}

BOOST_AUTO_TEST_CASE( wraparound_test ) {
    test_output("void main() { print(9223372036854775807 * 2); }", "-2\n");
    test_output("void main() { print(0 - 9223372036854775807); }",
            "-9223372036854775807\n");
}

BOOST_AUTO_TEST_CASE( comparison_test ) {
    test_output(
        "bool neg(int x) { return x < 0; }\n"
        "void main() {\n"
        "    if (neg(0 - 3)) { print(1); }\n"
        "    if (neg(3)) { print(2); }\n"
        "    if (1 < 1) { print(3); }\n"
        "}\n",
        "1\n");
}

BOOST_AUTO_TEST_CASE( return_test ) {
    // return inside an if leaves the whole function
    test_output(
        "int abs(int n) { if (n < 0) { return 0 - n; } return n; }\n"
        "void main() { print(abs(0 - 7)); print(abs(3)); }\n",
        "7\n3\n");
    test_output(
        "int f(int n) {\n"
        "    if (0 < n) { if (1 < n) { return 2; } return 1; }\n"
        "    return 0;\n"
        "}\n"
        "void main() { print(f(5)); print(f(1)); print(f(0)); }\n",
        "2\n1\n0\n");
    // statements after a return are skipped
    test_output(
        "int f() { print(1); return 2; print(3); }\n"
        "void main() { print(f()); }\n",
        "1\n2\n");
}

BOOST_AUTO_TEST_CASE( discarded_value_test ) {
    logger log{nullptr, nullptr};
    std::ostringstream out;
    interpreter inter{&log, &out};
    fault err;
    auto ok = inter.interpret_string(
        "int f() { print(1); return 5; }\n"
        "void main() { f(); f(); print(2); }\n",
        "<test-input>", &err);
    BOOST_TEST(ok);
    BOOST_TEST(out.str() == "1\n1\n2\n");
    BOOST_TEST(inter.stack_size() == 0);
}

BOOST_AUTO_TEST_CASE( scoping_test ) {
    // every call gets its own binding for x
    test_output(
        "int g(int x) { return x - 1; }\n"
        "int f(int x) { print(x); print(g(x * 2)); return x; }\n"
        "void main() { print(f(5)); }\n",
        "5\n9\n5\n");
    // the callee cannot see the caller's variables
    test_fault(
        "int h(int y) { return x; }\n"
        "int f(int x) { return h(1); }\n"
        "void main() { print(f(3)); }\n",
        fk_unbound_name);
    // nor the caller's caller
    test_fault(
        "void h() { print(x); }\n"
        "void g(int y) { h(); }\n"
        "void outer(int x) { g(x); }\n"
        "void main() { outer(4); }\n",
        fk_unbound_name);
}

BOOST_AUTO_TEST_CASE( definition_order_test ) {
    // functions can be called before their definition
    test_output(
        "void main() { print(later(1)); }\n"
        "int later(int x) { return x * 3; }\n",
        "3\n");
    // mutual recursion
    test_output(
        "bool even(int n) { if (n < 1) { return 0 < 1; } return odd(n - 1); }\n"
        "bool odd(int n) { if (n < 1) { return 1 < 0; } return even(n - 1); }\n"
        "void main() { if (even(10)) { print(1); } if (odd(10)) { print(2); } }\n",
        "1\n");
}

BOOST_AUTO_TEST_CASE( redefinition_test ) {
    std::ostringstream err_log;
    logger log{&err_log, nullptr};
    std::ostringstream out;
    interpreter inter{&log, &out};
    fault err;
    auto ok = inter.interpret_string(
        "int f() { return 1; }\n"
        "int f() { return 2; }\n"
        "void main() { print(f()); }\n",
        "<test-input>", &err);
    BOOST_TEST(ok);
    BOOST_TEST(out.str() == "2\n");
    BOOST_TEST(err_log.str().find("[WARNING]") != string::npos);
    BOOST_TEST(err_log.str().find("redefinition of 'f'") != string::npos);
}

BOOST_AUTO_TEST_CASE( missing_main_test ) {
    test_fault("int f() { return 1; }", fk_unbound_name);
    test_fault("int f() { return 1; } void mian() { print(1); }",
            fk_unbound_name);
}

BOOST_AUTO_TEST_CASE( arity_test ) {
    // bool passed where int is declared
    test_fault("int f(int x) { return x; } void main() { print(f(1 < 2)); }",
            fk_arity);
    test_fault("void main() { print(1 < 2); }", fk_arity);
    // too many and too few arguments
    test_fault("void g() { } void main() { g(5); }", fk_arity);
    test_fault("void g(int x) { } void main() { g(); }", fk_arity);
    test_fault("void main() { print(); }", fk_arity);
    // main is called with no argument
    test_fault("void main(int x) { print(x); }", fk_arity);
    // side effects before the mismatch are kept
    test_fault("void g() { } void main() { print(1); g(2); print(3); }",
            fk_arity, "1\n");
}

BOOST_AUTO_TEST_CASE( arity_error_message_test ) {
    logger log{nullptr, nullptr};
    std::ostringstream out;
    interpreter inter{&log, &out};
    fault err;
    inter.interpret_string(
        "void g(bool b) { }\nvoid main() {\n  g(7);\n}\n",
        "<test-input>", &err);
    BOOST_TEST(err.happened);
    BOOST_TEST(err.kind == fk_arity);
    BOOST_TEST(err.subsystem == "interpreter");
    BOOST_TEST(err.message == "argument mismatch: expected bool, got int");
    BOOST_TEST(err.origin.line == 3);
    BOOST_TEST(err.origin.col == 3);
}

BOOST_AUTO_TEST_CASE( type_test ) {
    // if condition must be a bool
    test_fault("void main() { if (5) { print(1); } }", fk_type);
    // arithmetic needs ints on both sides
    test_fault("bool t() { return 0 < 1; } void main() { print(2 * t()); }",
            fk_type);
    test_fault("void f(bool b) { print(b - 1); } void main() { f(0 < 1); }",
            fk_type);
    // void calls produce no value
    test_fault("void g() { } void main() { print(g()); }", fk_type);
    test_fault("void g() { } void main() { if (g()) { } }", fk_type);
    // functions aren't values
    test_fault("int f() { return main; } void main() { print(f()); }",
            fk_type);
}

BOOST_AUTO_TEST_CASE( return_value_test ) {
    // the returned value is the call's result even if it doesn't match the
    // declared return type
    test_output("int f() { return 0 < 1; } void main() { if (f()) { print(1); } }",
            "1\n");
    test_output("void main() { print(1); return 0; }", "1\n");
    test_output("bool f() { return 1 < 2; } bool g() { return f(); }"
            " void main() { if (g()) { print(1); } }", "1\n");
    // a mismatched result is still checked where it's used
    test_fault("int f() { return 1 < 2; } void main() { print(f()); }",
            fk_arity);

    std::ostringstream err_log;
    logger log{&err_log, nullptr};
    std::ostringstream out;
    interpreter inter{&log, &out};
    fault err;
    auto ok = inter.interpret_string(
        "int f() { return 1 < 2; } void main() { if (f()) { print(3); } }",
        "<test-input>", &err);
    BOOST_TEST(ok);
    BOOST_TEST(out.str() == "3\n");
    BOOST_TEST(err_log.str().find(
                "'f' is declared to return int but returned bool")
            != string::npos);
}

BOOST_AUTO_TEST_CASE( type_name_test ) {
    // unknown type names don't stop the program
    test_output("string f() { return 1; } void main() { print(2); }", "2\n");
    test_output("void main() { print(1); } int f(float x) { return 1; }",
            "1\n");
    // but no value has an unknown type, so calls can't match
    test_fault("int f(float x) { return 1; } void main() { print(f(1)); }",
            fk_arity);
    test_fault("void main(void x) { }", fk_arity);

    std::ostringstream err_log;
    logger log{&err_log, nullptr};
    std::ostringstream out;
    interpreter inter{&log, &out};
    fault err;
    auto ok = inter.interpret_string(
        "Int f() { return 1; } void g(float x) { } void main() { }",
        "<test-input>", &err);
    BOOST_TEST(ok);
    BOOST_TEST(err_log.str().find("unknown return type 'Int'")
            != string::npos);
    BOOST_TEST(err_log.str().find("unknown parameter type 'float'")
            != string::npos);
}

BOOST_AUTO_TEST_CASE( not_callable_test ) {
    test_fault("int f(int x) { return x(1); } void main() { print(f(2)); }",
            fk_not_callable);
    test_fault("void f(int print) { print(print); } void main() { f(1); }",
            fk_not_callable);
    test_fault("void main() { nothing(1); }", fk_unbound_name);
}

BOOST_AUTO_TEST_CASE( recursion_test ) {
    const char* loop_src =
        "int loop(int n) { return loop(n - 1); }\n"
        "void main() { print(loop(1)); }\n";
    string output;
    interpreter_options opts;
    opts.max_call_depth = 50;
    BOOST_TEST(run(loop_src, &output, opts) == fk_recursion);
    // the default limit is enforced too
    BOOST_TEST(run(loop_src, &output) == fk_recursion);

    // main plus six calls to fact
    const char* fact_src =
        "int fact(int n) { if (n < 1) { return 1; } return n * fact(n - 1); }\n"
        "void main() { print(fact(5)); }\n";
    opts.max_call_depth = 7;
    BOOST_TEST(run(fact_src, &output, opts) == fk_none);
    BOOST_TEST(output == "120\n");
    opts.max_call_depth = 6;
    BOOST_TEST(run(fact_src, &output, opts) == fk_recursion);
    BOOST_TEST(output == "");
}

static string repeat(const string& s, u32 n) {
    string res;
    for (u32 i = 0; i < n; ++i) {
        res += s;
    }
    return res;
}

BOOST_AUTO_TEST_CASE( recursion_message_test ) {
    logger log{nullptr, nullptr};
    std::ostringstream out;
    interpreter_options opts;
    opts.max_call_depth = 50;
    interpreter inter{&log, &out, opts};
    fault err;
    BOOST_TEST(!inter.interpret_string(
                "void f() { f(); } void main() { f(); }", "<test-input>", &err));
    BOOST_TEST(err.kind == fk_recursion);
    BOOST_TEST(err.message == "maximum call depth of 50 exceeded");
}

BOOST_AUTO_TEST_CASE( deep_expression_test ) {
    // 901 ones, nested to the right, alternate between 1 and 0
    auto src = "void main() { print(" + repeat("1 - ", 900) + "1); }";
    test_output(src.c_str(), "1\n");

    // too deep for the parser
    src = "void main() { print(" + repeat("1 - ", 30000) + "1); }";
    test_fault(src.c_str(), fk_parse);
    src = "int f(int x) { return x; } void main() { print("
        + repeat("f(", 5000) + "1" + repeat(")", 5000) + "); }";
    test_fault(src.c_str(), fk_parse);
    src = "void main() { " + repeat("if (0 < 1) { ", 5000) + "print(1); "
        + repeat("} ", 5000) + "}";
    test_fault(src.c_str(), fk_parse);
}

BOOST_AUTO_TEST_CASE( eval_depth_test ) {
    auto src = "void main() { print(1); print(" + repeat("1 - ", 30) + "1); }";
    logger log{nullptr, nullptr};
    std::ostringstream out;
    interpreter_options opts;
    opts.max_eval_depth = 20;
    interpreter inter{&log, &out, opts};
    fault err;
    BOOST_TEST(!inter.interpret_string(src, "<test-input>", &err));
    BOOST_TEST(err.kind == fk_recursion);
    BOOST_TEST(err.message == "maximum nesting depth of 20 exceeded");
    BOOST_TEST(out.str() == "1\n");

    // deep expressions in each of many nested calls exhaust the evaluation
    // limit before the call limit
    src = "int f(int n) { if (n < 1) { return 0; } return "
        + repeat("1 - ", 500) + "f(n - 1); }\n"
        "void main() { print(f(3000)); }\n";
    string output;
    BOOST_TEST(run(src.c_str(), &output) == fk_recursion);
    BOOST_TEST(output == "");
}

BOOST_AUTO_TEST_CASE( syntax_fault_test ) {
    test_fault("void main() { print(1 + 1); }", fk_lex);
    test_fault("void main() { print(1) }", fk_parse);
    test_fault("", fk_parse);
}

static void builtin_double(interpreter* inter, const value* arg) {
    inter->push(vbox_int(2 * vint(*arg)));
}

static void builtin_seven(interpreter* inter, const value*) {
    inter->push(vbox_int(7));
}

static void builtin_yes(interpreter* inter, const value*) {
    inter->push(vbox_bool(true));
}

BOOST_AUTO_TEST_CASE( custom_builtin_test ) {
    logger log{nullptr, nullptr};
    std::ostringstream out;
    interpreter inter{&log, &out};
    inter.add_builtin_function("double", string{"int"}, builtin_double);
    inter.add_builtin_function("seven", std::nullopt, builtin_seven);
    inter.add_builtin_function("yes", std::nullopt, builtin_yes);
    fault err;
    auto ok = inter.interpret_string(
        "void main() { print(double(21)); print(seven());"
        " if (yes()) { print(double(seven())); } }",
        "<test-input>", &err);
    BOOST_TEST(ok);
    BOOST_TEST(out.str() == "42\n7\n14\n");

    // user definitions shadow builtins of the same name
    out.str("");
    ok = inter.interpret_string(
        "int seven() { return 8; } void main() { print(seven()); }",
        "<test-input>", &err);
    BOOST_TEST(ok);
    BOOST_TEST(out.str() == "8\n");
}

BOOST_AUTO_TEST_CASE( reset_after_error_test ) {
    logger log{nullptr, nullptr};
    std::ostringstream out;
    interpreter inter{&log, &out};
    fault err;
    auto ok = inter.interpret_string(
        "int f(int n) { return n * g(); } void main() { print(f(3)); }",
        "<test-input>", &err);
    BOOST_TEST(!ok);
    BOOST_TEST(err.kind == fk_unbound_name);
    BOOST_TEST(inter.stack_size() == 0);
    BOOST_TEST(inter.get_scopes()->get_current() == ROOT_SCOPE);
    BOOST_TEST(inter.get_scopes()->depth() == 1);

    // the interpreter is still usable
    fault err2;
    ok = inter.interpret_string(
        "int g() { return 2; } void main() { print(g()); }",
        "<test-input>", &err2);
    BOOST_TEST(ok);
    BOOST_TEST(!err2.happened);
    BOOST_TEST(out.str() == "2\n");
}

BOOST_AUTO_TEST_CASE( file_test ) {
    logger log{nullptr, nullptr};
    std::ostringstream out;
    interpreter inter{&log, &out};
    fault err;
    BOOST_TEST(!inter.interpret_file("/nonexistent/dir/prog.adso", &err));
    BOOST_TEST(err.kind == fk_io);

    auto path = std::filesystem::temp_directory_path()
        / "adso_interpret_test.adso";
    {
        std::ofstream f{path};
        f << "void main() {\n  print(5);\n  print(x);\n}\n";
    }
    fault err2;
    BOOST_TEST(!inter.interpret_file(path.string(), &err2));
    std::filesystem::remove(path);
    BOOST_TEST(out.str() == "5\n");
    BOOST_TEST(err2.kind == fk_unbound_name);
    BOOST_TEST(err2.message == "unbound name 'x'");
    BOOST_TEST(err2.origin.filename == "adso_interpret_test.adso");
    BOOST_TEST(err2.origin.line == 3);
    BOOST_TEST(err2.origin.col == 9);
}

BOOST_AUTO_TEST_CASE( log_test ) {
    std::ostringstream err_log;
    std::ostringstream info_log;
    logger log{&err_log, &info_log};
    interpreter_options opts;
    opts.verbose = true;
    std::ostringstream out;
    interpreter inter{&log, &out, opts};
    fault err;
    BOOST_TEST(!inter.interpret_string("void main() { if (3) { } }",
                    "prog.adso", &err));
    BOOST_TEST(info_log.str().find("calling main") != string::npos);

    log.log_fault(err);
    BOOST_TEST(err_log.str() ==
        "[ERROR] interpreter: line 1, col 19 in prog.adso:\n"
        "\tTypeError: type error in if condition: expected bool, got int\n");
}
