// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_RECTS_FILE_HH
#define SCRUB_SCRUB_RECTS_FILE_HH

#include <defs.hh>

#include <istream>
#include <string>

#include <scrub/geometry.hh>
#include <utils/path.hh>

namespace scrub {

//
// User rectangles, a JSON object keyed by page number strings:
//
//   { "1": [ { "x0": 72, "y0": 100, "x1": 300, "y1": 120 } ] }
//
// Pages outside [1, page_count], non-integer keys and malformed entries are
// skipped with a warning; an unreadable file yields nothing:
//
page_rects_t load_rects (const fs::path&, int page_count);

page_rects_t parse_rects (std::istream&, int page_count,
                          const std::string& filename);

} // namespace scrub

#endif // SCRUB_SCRUB_RECTS_FILE_HH
