// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SPLASH_XPATH_HH
#define SCRUB_SPLASH_XPATH_HH

#include <defs.hh>

#include <vector>

#include <scrub/bbox.hh>
#include <splash/bitmap.hh>

namespace scrub {

using polygon_t = std::vector< point_t >;

struct xpath_seg_t {
    //
    // x0, y0 : first endpoint (y0 <= y1)
    // x1, y1 : second endpoint
    // dxdy   : slope, delta-x / delta-y
    //
    double x0, y0, x1, y1, dxdy;

    //
    // EO/NZWN counter increment, the direction of the original edge:
    //
    int count;
};

//
// A flattened path expanded into segments, in device space. Polygons are
// implicitly closed:
//
struct xpath_t {
    xpath_t () = default;
    explicit xpath_t (const std::vector< polygon_t >&);

    void add_segment (double x0, double y0, double x1, double y1);

    bool empty () const { return segs.empty (); }

    std::vector< xpath_seg_t > segs;
    double y_min = 0, y_max = 0;
};

//
// Outline of the stroke of the polygons, as quadrilaterals around each
// segment, to be filled with the non-zero winding rule:
//
xpath_t stroke_xpath (
    const std::vector< polygon_t >&, const std::vector< bool >& closed,
    double width);

//
// Scan-convert the path into the bitmap with four sub-scanlines per row;
// `alpha' in [0, 255] scales the coverage:
//
void fill (bitmap_t&, const xpath_t&, bool eo, rgb_t, int alpha = 255);

} // namespace scrub

#endif // SCRUB_SPLASH_XPATH_HH
