// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_ERROR_HH
#define SCRUB_SCRUB_ERROR_HH

#include <defs.hh>

#include <sys/types.h>

#include <functional>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace scrub {

enum error_category_t {
    errInfo,          // progress messages, shown in verbose mode only
    errWarning,       // recoverable problem with the input or the request
    errSyntaxWarning, // PDF syntax error which can be worked around
    errSyntaxError,   // PDF syntax error which cannot be worked around
    errConfig,        // error in the configuration file
    errCommandLine,   // error in the command line arguments
    errIO,            // error in file I/O
    errNotAllowed,    // the document forbids the operation
    errUnimplemented, // unimplemented PDF feature
    errInternal       // internal error, malfunction within the library
};

const char* to_string (error_category_t);

//
// A callback receives every message that passes the verbosity filter, in
// place of the default stderr output:
//
using error_callback_t = std::function<
    void (error_category_t, off_t, const std::string&) >;

void set_error_callback (error_callback_t);

void set_error_verbose (bool);
void set_error_quiet (bool);

bool error_verbose ();

void error_message (error_category_t, off_t, const std::string&);

template< typename ... Args >
inline void
error (error_category_t category, off_t pos, const char* fmt,
       const Args& ... args) {
    error_message (
        category, pos, fmt::vformat (fmt, fmt::make_format_args (args...)));
}

//
// Fatal failure to open, parse or save a document:
//
struct document_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace scrub

#endif // SCRUB_SCRUB_ERROR_HH
