// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_GEOMETRY_HH
#define SCRUB_SCRUB_GEOMETRY_HH

#include <defs.hh>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <scrub/bbox.hh>

namespace scrub {

//
// Rectangle in page space: the unrotated crop box of a page, origin at its
// top-left corner, y growing downwards, in points:
//
using rect_t = bbox_t;

//
// Rectangles keyed by 1-based page number:
//
using page_rects_t = std::map< int, std::vector< rect_t > >;

//
// Intersection with the page bounds; nothing if the result is empty or not
// larger than a unit square:
//
std::optional< rect_t > clip (const rect_t&, const rect_t& bounds);

//
// Greedy coalescing of overlapping or nearly adjacent rectangles, in (y0, x0)
// order. Each pass lets the first accumulated region that qualifies absorb
// an incoming rectangle; passes repeat until no region absorbs another:
//
std::vector< rect_t > merge (std::vector< rect_t >);

//
// Distance below which two disjoint rectangles sharing an edge are merged,
// and the fraction of the smaller area two overlapping rectangles must share
// to be merged:
//
constexpr double merge_gap = 5.;
constexpr double merge_overlap = .1;

std::string to_string (const rect_t&);

} // namespace scrub

#endif // SCRUB_SCRUB_GEOMETRY_HH
