// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <variant>

#include <boost/iostreams/device/mapped_file.hpp>
namespace io = boost::iostreams;

#include <fmt/format.h>
using fmt::format;

#include <scrub/detect.hh>
#include <scrub/engine.hh>
#include <scrub/error.hh>
#include <scrub/verify.hh>
#include <utils/string.hh>

namespace scrub {

std::vector< std::string >
verify_redaction (const fs::path& path, const std::vector< std::string >& terms,
                  const std::vector< std::string >& patterns) {
    std::vector< std::string > remaining;

    std::string text;

    try {
        auto engine = engine_t::open (path);

        for (int n = 1; n <= engine.page_count (); ++n) {
            text += engine.plain_text (n);
            text += '\n';
        }
    }
    catch (const std::exception& e) {
        remaining.push_back (format ("verification_error: {}", e.what ()));
        return remaining;
    }

    for (const auto& term : terms) {
        if (!term.empty () && icontains (text, term)) {
            remaining.push_back (format ("term: {}", term));
        }
    }

    for (const auto& pattern : patterns) {
        auto outcome = compile_pattern (pattern);

        if (auto re = std::get_if< boost::regex > (&outcome)) {
            if (boost::regex_search (text, *re)) {
                remaining.push_back (format ("regex: {}", pattern));
            }
        }
    }

    for (const auto& s : remaining) {
        error (errWarning, -1, "found after redaction: {}", s);
    }

    return remaining;
}

std::string printable_runs (const std::string& buf, size_t min_length) {
    std::string result, run;

    auto flush = [&]() {
        if (run.size () >= min_length) {
            result += run;
            result += '\n';
        }

        run.clear ();
    };

    for (auto c : buf) {
        if ((c >= 0x20 && c < 0x7F) || c == '\t') {
            run += c;
        }
        else {
            flush ();
        }
    }

    flush ();

    return result;
}

std::vector< std::string >
strings_check (const fs::path& path, const std::vector< std::string >& terms,
               size_t min_length) {
    std::string runs;

    try {
        io::mapped_file_source src (path.string ());
        runs = printable_runs (
            std::string (src.data (), src.size ()), min_length);
    }
    catch (const std::ios_base::failure& e) {
        error (errIO, -1, "{}: {}", path.string (), e.what ());
        return { };
    }

    //
    // Compressed streams hide their text from the raw scan:
    //
    try {
        const auto doc = document_t::open (path);

        for (const auto& [num, obj] : doc.objects ()) {
            if (auto stream = std::get_if< stream_pointer > (&obj)) {
                if (auto data = doc.decode (**stream)) {
                    runs += printable_runs (*data, min_length);
                }
            }
        }
    }
    catch (const document_error& e) {
        error (errWarning, -1, "streams not checked: {}", e.what ());
    }

    std::vector< std::string > found;

    for (const auto& term : terms) {
        if (!term.empty () && icontains (runs, term)) {
            found.push_back (term);
        }
    }

    return found;
}

} // namespace scrub
