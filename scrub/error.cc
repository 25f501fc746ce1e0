// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <iostream>
#include <mutex>

#include <scrub/error.hh>

namespace scrub {
namespace {

struct error_state_t {
    std::mutex mtx;
    error_callback_t callback;
    bool verbose = false, quiet = false;
};

error_state_t& state () {
    static error_state_t s;
    return s;
}

} // anonymous

const char* to_string (error_category_t category) {
    switch (category) {
    case errInfo:          return "Info";
    case errWarning:       return "Warning";
    case errSyntaxWarning: return "Syntax Warning";
    case errSyntaxError:   return "Syntax Error";
    case errConfig:        return "Config Error";
    case errCommandLine:   return "Command Line Error";
    case errIO:            return "I/O Error";
    case errNotAllowed:    return "Permission Error";
    case errUnimplemented: return "Unimplemented Feature";
    case errInternal:      return "Internal Error";
    }

    return "Error";
}

void set_error_callback (error_callback_t callback) {
    std::lock_guard< std::mutex > lock (state ().mtx);
    state ().callback = std::move (callback);
}

void set_error_verbose (bool b) {
    std::lock_guard< std::mutex > lock (state ().mtx);
    state ().verbose = b;
}

void set_error_quiet (bool b) {
    std::lock_guard< std::mutex > lock (state ().mtx);
    state ().quiet = b;
}

bool error_verbose () {
    std::lock_guard< std::mutex > lock (state ().mtx);
    return state ().verbose;
}

void error_message (error_category_t category, off_t pos, const std::string& s) {
    error_callback_t callback;

    {
        std::lock_guard< std::mutex > lock (state ().mtx);

        if (category == errInfo && !state ().verbose) {
            return;
        }

        //
        // Quiet mode keeps only the messages that end a stage:
        //
        if (state ().quiet && category != errIO && category != errInternal) {
            return;
        }

        callback = state ().callback;
    }

    if (callback) {
        return callback (category, pos, s);
    }

    if (pos >= 0) {
        std::cerr << to_string (category) << " (" << pos << "): " << s << "\n";
    }
    else {
        std::cerr << to_string (category) << ": " << s << "\n";
    }
}

} // namespace scrub
