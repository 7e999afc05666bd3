#include "log.hpp"

namespace adso {

logger::logger(std::ostream* err_out, std::ostream* info_out)
    : err_out{err_out}
    , info_out{info_out} {
}

static void print_loc(std::ostream* out, const source_loc& origin) {
    (*out) << "line " << origin.line << ", col " << origin.col;
    if (!origin.filename.empty()) {
        (*out) << " in " << origin.filename;
    }
}

static void print_message(std::ostream* out,
        const char* level,
        const source_loc* origin,
        const string& subsystem,
        const string& message) {
    if (out == nullptr) {
        return;
    }
    (*out) << "[" << level << "] " << subsystem;
    if (origin != nullptr && origin->known()) {
        (*out) << ": ";
        print_loc(out, *origin);
    }
    (*out) << ":\n\t" << message << '\n';
}

void logger::log_fault(const fault& err) {
    log_error(err.origin, err.subsystem,
            string{fault_kind_name(err.kind)} + ": " + err.message);
}

void logger::log_error(const source_loc& origin,
        const string& subsystem,
        const string& message) {
    print_message(err_out, "ERROR", &origin, subsystem, message);
}

void logger::log_error(const string& subsystem,
        const string& message) {
    print_message(err_out, "ERROR", nullptr, subsystem, message);
}

void logger::log_warning(const source_loc& origin,
        const string& subsystem,
        const string& message) {
    print_message(err_out, "WARNING", &origin, subsystem, message);
}

void logger::log_warning(const string& subsystem,
        const string& message) {
    print_message(err_out, "WARNING", nullptr, subsystem, message);
}

void logger::log_info(const source_loc& origin,
        const string& subsystem,
        const string& message) {
    print_message(info_out, "INFO", &origin, subsystem, message);
}

void logger::log_info(const string& subsystem,
        const string& message) {
    print_message(info_out, "INFO", nullptr, subsystem, message);
}


}
