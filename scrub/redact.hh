// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_REDACT_HH
#define SCRUB_SCRUB_REDACT_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <scrub/document.hh>
#include <scrub/geometry.hh>
#include <scrub/gfx.hh>
#include <scrub/redactor.hh>
#include <utils/path.hh>

namespace scrub {

struct engine_t;

enum struct fill_t { black, white, red, green, blue, gray };

//
// Case-insensitive, `grey' is `gray'; unknown names are black:
//
fill_t parse_fill (const std::string&);

const char* to_string (fill_t);
color_t to_color (fill_t);

struct redact_options_t {
    fill_t fill = fill_t::black;

    bool merge = true;
    bool remove_images = true;

    //
    // Raster fallback resolution and the font for non-embedded fonts:
    //
    double dpi = SCRUB_RASTER_DPI;
    std::string font_file;

    save_options_t save;
};

struct redact_result_t {
    //
    // Regions applied and regions that failed, pages modified:
    //
    size_t applied = 0, failed = 0, pages = 0;

    redaction_stats_t removed;
};

//
// The rectangles of a page that reach application: clipped to the page
// bounds, empty ones dropped, optionally merged:
//
std::vector< rect_t >
prepare_rects (const std::vector< rect_t >&, const rect_t& bounds, bool merge);

//
// Destructive removal on an open document, one commit per page. Pages out
// of range are skipped with a warning:
//
redact_result_t
apply_redactions (engine_t&, const page_rects_t&, const redact_options_t&);

//
// Open, apply, save; false, with the cause logged, on a fatal error:
//
bool apply_redactions (const fs::path& input, const fs::path& output,
                       const page_rects_t&, const redact_options_t& = { },
                       redact_result_t* = 0);

//
// Replace each page with rectangles by an image of itself with the
// rectangles painted over:
//
bool apply_raster_redactions (
    const fs::path& input, const fs::path& output, const page_rects_t&,
    const redact_options_t& = { }, redact_result_t* = 0);

//
// Highlight the rectangles with translucent annotations, nothing removed:
//
bool preview_redactions (
    const fs::path& input, const fs::path& output, const page_rects_t&,
    const color_t& = { 1, 1, 0 }, double opacity = .5);

} // namespace scrub

#endif // SCRUB_SCRUB_REDACT_HH
