// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_DETECT_HH
#define SCRUB_SCRUB_DETECT_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <boost/regex.hpp>

#include <scrub/geometry.hh>
#include <scrub/match.hh>
#include <scrub/ocr.hh>
#include <scrub/text.hh>
#include <utils/path.hh>

namespace scrub {

struct engine_t;
struct page_t;

struct detect_options_t {
    std::vector< std::string > terms;
    std::vector< std::string > patterns;

    //
    // JSON file of user rectangles, none if empty:
    //
    fs::path rects_file;

    //
    // Pages with fewer characters of plain text are scanned pages:
    //
    int scanned_threshold = SCRUB_SCANNED_THRESHOLD;

    //
    // Recognizer for scanned pages, which are skipped if there is none:
    //
    ocr_engine_t* ocr = 0;
    double ocr_dpi = SCRUB_RASTER_DPI;
};

//
// Case-insensitive, multi-line Perl syntax; an invalid pattern is a skip
// with the compiler message as the reason:
//
outcome_t< boost::regex > compile_pattern (const std::string&);

//
// Displayed space to page space, through the inverse of the page rotation:
//
rect_t normalize_rect (const page_t&, const rect_t&);

bool is_scanned (engine_t&, int page, int threshold = SCRUB_SCANNED_THRESHOLD);

std::vector< text_match_t >
search_term (engine_t&, int page, const std::string&);

//
// Matches of the pattern within each line of the text, located by equal
// slices of the spans, one per code point:
//
std::vector< text_match_t >
search_pattern (const text_page_t&, const page_t&, int page,
                const boost::regex&);

//
// Term and pattern matches of a scanned page, through the recognizer:
//
std::vector< text_match_t >
search_ocr (engine_t&, int page, ocr_engine_t&, double dpi,
            const std::vector< std::string >& terms,
            const std::vector< boost::regex >& patterns);

//
// Rectangles to redact, per page: term matches, pattern matches, then user
// rectangles. Every page has an entry; a document that cannot be opened
// yields an empty map:
//
page_rects_t detect_redactions (const fs::path&, const detect_options_t&);

//
// The matches, for review, without user rectangles:
//
std::vector< text_match_t >
preview_matches (const fs::path&, const detect_options_t&);

} // namespace scrub

#endif // SCRUB_SCRUB_DETECT_HH
