// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_REPORT_HH
#define SCRUB_SCRUB_REPORT_HH

#include <defs.hh>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <scrub/detect.hh>
#include <scrub/geometry.hh>
#include <utils/path.hh>

namespace scrub {

struct pdf_info_t {
    bool valid = false;
    int pages = 0;
    bool encrypted = false;

    //
    // Information dictionary strings, UTF-8:
    //
    std::string title, author, subject, keywords, creator, producer;
    std::string creation_date, modification_date;

    std::uintmax_t file_size = 0;
};

//
// Never fails, an unreadable document is not valid:
//
pdf_info_t pdf_info (const fs::path&);

struct impact_t {
    size_t total_matches = 0;
    size_t pages_affected = 0;

    std::map< int, size_t > by_page;
    std::map< std::string, size_t > by_term, by_pattern;

    //
    // Matched characters over all the characters of the text:
    //
    double text_removed_percent = 0;

    std::string error;
};

impact_t estimate_impact (const fs::path&, const detect_options_t&);

using report_t = nlohmann::json;

//
// Redaction summary, file sizes, per-page rectangles and the verification
// of the output against the terms and patterns:
//
report_t make_report (
    const fs::path& input, const fs::path& output, const page_rects_t&,
    const std::vector< std::string >& terms,
    const std::vector< std::string >& patterns);

//
// Write as JSON; false, with the cause logged, on error:
//
bool save_report (const report_t&, const fs::path&);

//
// Size with one decimal and the largest fitting unit, B to TB:
//
std::string format_file_size (std::uintmax_t);

} // namespace scrub

#endif // SCRUB_SCRUB_REPORT_HH
