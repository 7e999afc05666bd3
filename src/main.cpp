#include "base.hpp"
#include "config.h"
#include "interpret.hpp"
#include "log.hpp"
#include "parse.hpp"

#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <iostream>

using namespace adso;

namespace fs = std::filesystem;

void show_usage(std::ostream& out) {
    out <<
        "Usage: adso [options] FILE\n"
        "Description:\n"
        "  adso language interpreter, version " ADSO_VERSION ".\n"
        "  Runs the function main of the program in FILE.\n"
        "Options/Arguments:\n"
        "  -h            Show this help message and exit.\n"
        "  -p            Parse FILE and print the syntax tree instead of running it.\n"
        "  -v            Log progress messages to standard error.\n"
        "  -d depth      Set the maximum call depth.\n"
        "  FILE          Source file to interpret.\n"
        ;
}

struct driver_options {
    // source file to run
    string src = "";
    // if true, show help and exit
    bool help = false;
    // if true, print the parsed program instead of running it
    bool dump_ast = false;
    interpreter_options interp;

    // if true, the argument list was malformed and the other fields are not
    // guaranteed to be properly initialized
    bool err = false;
    string message = "";
};

// parse a positive call depth, returning false on malformed input
static bool parse_depth(const string& s, u32* res) {
    if (s.empty() || s.size() > 9) {
        return false;
    }
    u32 total = 0;
    for (auto c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        total = total*10 + (c - '0');
    }
    if (total == 0) {
        return false;
    }
    *res = total;
    return true;
}

// fill out a driver_options object based on CLI options. Sets opt->err on
// malformed command line arguments.
void process_args(int argc, char** argv, driver_options* opt) {
    int num_files = 0;
    for (int i = 1; i < argc; ++i) {
        string s{argv[i]};
        if (s.size() > 1 && s[0] == '-') {
            if (s.size() > 2 && s[1] != 'd') {
                opt->err = true;
                opt->message = "Unrecognized option: " + s;
                return;
            }
            switch(s[1]) {
            case 'h':
                opt->help = true;
                // no sense doing further processing at this point
                return;
            case 'p':
                opt->dump_ast = true;
                break;
            case 'v':
                opt->interp.verbose = true;
                break;
            case 'd': {
                // can have -d 100 or -d100 syntax
                string arg;
                if (s.size() == 2) {
                    if (i == argc - 1) {
                        opt->err = true;
                        opt->message = "Option -d requires an argument.";
                        return;
                    }
                    arg = argv[++i];
                } else {
                    arg = s.substr(2);
                }
                if (!parse_depth(arg, &opt->interp.max_call_depth)) {
                    opt->err = true;
                    opt->message = "Invalid call depth: " + arg;
                    return;
                }
            }
                break;
            default:
                opt->err = true;
                opt->message = "Unrecognized option: " + s;
                return;
            }
        } else {
            // filename
            ++num_files;
            opt->src = s;
        }
    }
    if (num_files != 1) {
        opt->err = true;
        opt->message = num_files == 0
            ? "No input file provided."
            : "Multiple input files provided.";
    }
}

// parse the file and print the rendered program
static int dump_file(const string& path, logger* log) {
    std::ifstream in{path};
    if (!in) {
        log->log_error("main", "failed to read " + path);
        return EXIT_FAILURE;
    }
    fault err;
    auto program = parse_stream(in, fs::path{path}.filename().string(), &err);
    if (!program) {
        log->log_fault(err);
        return EXIT_FAILURE;
    }
    std::cout << program->as_string();
    return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
    driver_options opt;
    process_args(argc, argv, &opt);
    if (opt.help) {
        show_usage(std::cout);
        return EXIT_SUCCESS;
    } else if (opt.err) {
        std::cerr << "Error processing command line arguments:\n  "
                  << opt.message << '\n';
        show_usage(std::cerr);
        return EXIT_FAILURE;
    }

    logger log{&std::cerr, opt.interp.verbose ? &std::cerr : nullptr};
    if (opt.dump_ast) {
        return dump_file(opt.src, &log);
    }

    interpreter inter{&log, &std::cout, opt.interp};
    fault err;
    bool ok = inter.interpret_file(opt.src, &err);
    std::cout.flush();
    if (!ok) {
        log.log_fault(err);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
