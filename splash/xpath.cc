// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <tuple>

#include <splash/xpath.hh>

#include <range/v3/all.hpp>
using namespace ranges;

//
// Sub-scanlines per pixel row:
//
#define SPLASH_AA_SIZE 4

namespace scrub {

xpath_t::xpath_t (const std::vector< polygon_t >& polygons) {
    for (const auto& polygon : polygons) {
        if (polygon.size () < 2) {
            continue;
        }

        for (size_t i = 0; i < polygon.size (); ++i) {
            const auto& a = polygon [i];
            const auto& b = polygon [(i + 1) % polygon.size ()];

            add_segment (a.x, a.y, b.x, b.y);
        }
    }
}

void xpath_t::add_segment (double x0, double y0, double x1, double y1) {
    if (y0 == y1) {
        //
        // Horizontal segments never cross a sub-scanline:
        //
        return;
    }

    int count = 1;

    if (y0 > y1) {
        std::swap (x0, x1);
        std::swap (y0, y1);
        count = -1;
    }

    if (segs.empty ()) {
        y_min = y0;
        y_max = y1;
    }
    else {
        y_min = (std::min) (y_min, y0);
        y_max = (std::max) (y_max, y1);
    }

    segs.push_back ({ x0, y0, x1, y1, (x1 - x0) / (y1 - y0), count });
}

xpath_t stroke_xpath (
    const std::vector< polygon_t >& polygons, const std::vector< bool >& closed,
    double width) {
    xpath_t xpath;

    const auto d = (std::max) (width, 1.) / 2;

    auto add_quad = [&](const point_t& a, const point_t& b) {
        const auto dx = b.x - a.x, dy = b.y - a.y;
        const auto len = std::hypot (dx, dy);

        double nx = 0, ny = d;

        if (len > 0) {
            nx = -dy / len * d;
            ny =  dx / len * d;
        }

        //
        // Square caps, the quad extends past the ends by half the width:
        //
        double ex = 0, ey = 0;

        if (len > 0) {
            ex = dx / len * d;
            ey = dy / len * d;
        }
        else {
            ex = d;
        }

        const point_t quad [] = {
            { a.x - ex + nx, a.y - ey + ny },
            { b.x + ex + nx, b.y + ey + ny },
            { b.x + ex - nx, b.y + ey - ny },
            { a.x - ex - nx, a.y - ey - ny }
        };

        for (size_t i = 0; i < 4; ++i) {
            const auto& p = quad [i];
            const auto& q = quad [(i + 1) % 4];

            xpath.add_segment (p.x, p.y, q.x, q.y);
        }
    };

    for (size_t i = 0; i < polygons.size (); ++i) {
        const auto& polygon = polygons [i];

        if (polygon.size () == 1) {
            add_quad (polygon [0], polygon [0]);
            continue;
        }

        for (size_t j = 1; j < polygon.size (); ++j) {
            add_quad (polygon [j - 1], polygon [j]);
        }

        if (i < closed.size () && closed [i] && polygon.size () > 2) {
            add_quad (polygon.back (), polygon.front ());
        }
    }

    return xpath;
}

void fill (bitmap_t& bitmap, const xpath_t& xpath, bool eo, rgb_t color,
           int alpha) {
    if (xpath.empty ()) {
        return;
    }

    const int y0 = (std::max) (0, int (std::floor (xpath.y_min)));
    const int y1 = (std::min) (bitmap.height (), int (std::ceil (xpath.y_max)));

    const int width = bitmap.width ();

    std::vector< int > coverage (width);
    std::vector< std::tuple< double, int > > crossings;

    for (int y = y0; y < y1; ++y) {
        std::fill (coverage.begin (), coverage.end (), 0);

        int x_lo = width, x_hi = -1;

        for (int k = 0; k < SPLASH_AA_SIZE; ++k) {
            const double sy = y + (k + .5) / SPLASH_AA_SIZE;

            crossings.clear ();

            for (const auto& seg : xpath.segs) {
                if (seg.y0 <= sy && sy < seg.y1) {
                    crossings.emplace_back (
                        seg.x0 + (sy - seg.y0) * seg.dxdy, seg.count);
                }
            }

            sort (crossings);

            int count = 0;

            for (size_t i = 0; i + 1 < crossings.size (); ++i) {
                count += std::get< 1 > (crossings [i]);

                const bool inside = eo ? (count & 1) : count != 0;

                if (!inside) {
                    continue;
                }

                //
                // Pixels whose centers fall in the span:
                //
                const auto a = std::get< 0 > (crossings [i]);
                const auto b = std::get< 0 > (crossings [i + 1]);

                int xa = (std::max) (0, int (std::ceil (a - .5)));
                int xb = (std::min) (width, int (std::ceil (b - .5)));

                if (xa >= xb && a < b && 0 <= a && a < width) {
                    //
                    // Thin spans still mark the pixel they fall in:
                    //
                    xa = int (a);
                    xb = xa + 1;
                }

                for (int x = xa; x < xb; ++x) {
                    ++coverage [x];
                }

                x_lo = (std::min) (x_lo, xa);
                x_hi = (std::max) (x_hi, xb);
            }
        }

        for (int x = x_lo; x < x_hi; ++x) {
            if (coverage [x]) {
                bitmap.blend (
                    x, y, color,
                    alpha * (std::min) (coverage [x], SPLASH_AA_SIZE) /
                    SPLASH_AA_SIZE);
            }
        }
    }
}

} // namespace scrub
