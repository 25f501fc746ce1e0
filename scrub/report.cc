// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cstdint>
#include <ctime>
#include <fstream>
#include <set>

#include <fmt/chrono.h>
#include <fmt/format.h>
using fmt::format;

#include <scrub/engine.hh>
#include <scrub/error.hh>
#include <scrub/report.hh>
#include <scrub/verify.hh>
#include <utils/string.hh>

namespace scrub {
namespace detail {

//
// Text string to UTF-8: UTF-16BE with a byte order mark, else taken as
// Latin-1, close enough to PDFDocEncoding for the printable range:
//
static std::string text_string (const std::string& s) {
    std::string result;

    if (s.size () >= 2 && (unsigned char)s [0] == 0xFE &&
        (unsigned char)s [1] == 0xFF) {
        for (size_t i = 2; i + 1 < s.size (); i += 2) {
            char32_t c = ((unsigned char)s [i] << 8) | (unsigned char)s [i + 1];

            if (0xD800 <= c && c < 0xDC00 && i + 3 < s.size ()) {
                const char32_t d =
                    ((unsigned char)s [i + 2] << 8) | (unsigned char)s [i + 3];

                if (0xDC00 <= d && d < 0xE000) {
                    c = 0x10000 + ((c - 0xD800) << 10) + (d - 0xDC00);
                    i += 2;
                }
            }

            append_utf8 (result, c);
        }
    }
    else {
        for (auto c : s) {
            append_utf8 (result, char32_t ((unsigned char)c));
        }
    }

    return result;
}

static report_t rect_json (const rect_t& rect) {
    report_t node;

    node ["x0"] = rect.arr [0];
    node ["y0"] = rect.arr [1];
    node ["x1"] = rect.arr [2];
    node ["y1"] = rect.arr [3];

    return node;
}

} // namespace detail

pdf_info_t pdf_info (const fs::path& path) {
    pdf_info_t info;

    info.file_size = file_size_of (path);

    try {
        const auto doc = document_t::open (path, true);

        info.valid = true;
        info.encrypted = doc.encrypted ();

        if (!info.encrypted) {
            info.pages = int (doc.pages ().size ());
        }

        if (auto dict = doc.info ()) {
            auto get = [&](const char* key) {
                return detail::text_string (
                    doc.get< string_t > (*dict, key).value_or (string_t ()));
            };

            info.title             = get ("Title");
            info.author            = get ("Author");
            info.subject           = get ("Subject");
            info.keywords          = get ("Keywords");
            info.creator           = get ("Creator");
            info.producer          = get ("Producer");
            info.creation_date     = get ("CreationDate");
            info.modification_date = get ("ModDate");
        }
    }
    catch (const document_error& e) {
        error (errIO, -1, "{}", e.what ());
    }

    return info;
}

impact_t estimate_impact (const fs::path& path, const detect_options_t& opts) {
    impact_t impact;

    const auto matches = preview_matches (path, opts);

    impact.total_matches = matches.size ();

    std::set< int > pages;

    for (const auto& match : matches) {
        pages.insert (match.page);
        ++impact.by_page [match.page];

        switch (match.kind) {
        case match_kind_t::regex:
            ++impact.by_pattern [format ("pattern_match: {}", match.text)];
            break;

        default:
            ++impact.by_term [match.text];
            break;
        }
    }

    impact.pages_affected = pages.size ();

    if (matches.empty ()) {
        return impact;
    }

    try {
        auto engine = engine_t::open (path);

        size_t total = 0, removed = 0;

        for (int n = 1; n <= engine.page_count (); ++n) {
            total += utf8_length (engine.plain_text (n));
        }

        for (const auto& match : matches) {
            removed += utf8_length (match.text);
        }

        if (total) {
            impact.text_removed_percent = 100. * removed / total;
        }
    }
    catch (const std::exception& e) {
        impact.error = e.what ();
    }

    return impact;
}

report_t make_report (
    const fs::path& input, const fs::path& output,
    const page_rects_t& page_rects, const std::vector< std::string >& terms,
    const std::vector< std::string >& patterns) {
    report_t report;

    report ["input_file"] = input.string ();
    report ["output_file"] = output.string ();
    report ["timestamp"] = format (
        "{:%Y-%m-%dT%H:%M:%S}", fmt::localtime (std::time (0)));

    size_t total = 0, pages = 0;

    auto details = report_t::object ();

    for (const auto& [n, rects] : page_rects) {
        if (rects.empty ()) {
            continue;
        }

        total += rects.size ();
        ++pages;

        auto arr = report_t::array ();

        for (const auto& rect : rects) {
            arr.push_back (detail::rect_json (rect));
        }

        auto& page = details [format ("page_{}", n)];

        page ["redaction_count"] = rects.size ();
        page ["rectangles"] = std::move (arr);
    }

    auto& summary = report ["redaction_summary"];

    summary ["total_redactions"] = total;
    summary ["pages_modified"] = pages;
    summary ["terms_searched"] = terms.size ();
    summary ["patterns_searched"] = patterns.size ();

    const auto input_size = file_size_of (input);
    const auto output_size = file_size_of (output);

    auto& sizes = report ["file_analysis"];

    sizes ["input_size"] = input_size;
    sizes ["output_size"] = output_size;
    sizes ["size_reduction"] = fs::exists (output)
        ? std::intmax_t (input_size) - std::intmax_t (output_size)
        : std::intmax_t (0);

    report ["redaction_details"] = std::move (details);

    if (fs::exists (output)) {
        const auto remaining = verify_redaction (output, terms, patterns);

        auto& verification = report ["verification"];

        verification ["remaining_terms"] = report_t (remaining);
        verification ["verification_passed"] = remaining.empty ();
    }

    return report;
}

bool save_report (const report_t& report, const fs::path& path) {
    std::ofstream f (path);

    if (!f) {
        error (errIO, -1, "cannot write report '{}'", path.string ());
        return false;
    }

    //
    // Invalid UTF-8 in the matched text is replaced, not an error:
    //
    f << report.dump (2, ' ', false, report_t::error_handler_t::replace)
      << "\n";

    if (!f) {
        error (errIO, -1, "cannot write report '{}'", path.string ());
        return false;
    }

    return true;
}

std::string format_file_size (std::uintmax_t n) {
    static const char* units [] = { "B", "KB", "MB", "GB" };

    double size = double (n);

    for (auto unit : units) {
        if (size < 1024) {
            return format ("{:.1f} {}", size, unit);
        }

        size /= 1024;
    }

    return format ("{:.1f} TB", size);
}

} // namespace scrub
