// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>
#include <tuple>

#include <scrub/geometry.hh>

#include <fmt/format.h>
using fmt::format;

#include <range/v3/action/stable_sort.hpp>
using namespace ranges;

namespace scrub {
namespace {

//
// Facing edges closer than the gap, with the boxes overlapping along the
// edges:
//
bool adjacent (const rect_t& lhs, const rect_t& rhs) {
    const auto& [ x0, y0, x1, y1 ] = lhs.arr;
    const auto& [ X0, Y0, X1, Y1 ] = rhs.arr;

    if (vertical_overlap (lhs, rhs) > 0 &&
        (std::fabs (x1 - X0) < merge_gap || std::fabs (x0 - X1) < merge_gap)) {
        return true;
    }

    return horizontal_overlap (lhs, rhs) > 0 &&
        (std::fabs (y1 - Y0) < merge_gap || std::fabs (y0 - Y1) < merge_gap);
}

bool mergeable (const rect_t& lhs, const rect_t& rhs) {
    const auto overlap = lhs & rhs;

    if (!empty (overlap)) {
        const auto smaller = (std::min) (area_of (lhs), area_of (rhs));

        return smaller > 0 && area_of (overlap) / smaller > merge_overlap;
    }

    return adjacent (lhs, rhs);
}

//
// One greedy pass, the first accumulated region that accepts a rectangle
// absorbs it:
//
std::vector< rect_t > merge_pass (std::vector< rect_t > xs) {
    xs |= actions::stable_sort ([](const rect_t& lhs, const rect_t& rhs) {
        return std::tie (lhs.arr [1], lhs.arr [0]) <
               std::tie (rhs.arr [1], rhs.arr [0]);
    });

    std::vector< rect_t > result;

    for (const auto& x : xs) {
        bool merged = false;

        for (auto& other : result) {
            if (mergeable (other, x)) {
                other += x;
                merged = true;
                break;
            }
        }

        if (!merged) {
            result.push_back (x);
        }
    }

    return result;
}

} // anonymous

std::optional< rect_t > clip (const rect_t& box, const rect_t& bounds) {
    const auto result = normalize (box) & bounds;

    if (empty (result) || !(area_of (result) > 1)) {
        return { };
    }

    return result;
}

std::vector< rect_t > merge (std::vector< rect_t > xs) {
    //
    // A region grown by a pass can reach one accumulated before it; passes
    // repeat until the count settles:
    //
    for (auto result = merge_pass (std::move (xs));;) {
        const auto n = result.size ();
        result = merge_pass (std::move (result));

        if (result.size () == n) {
            return result;
        }
    }
}

std::string to_string (const rect_t& x) {
    const auto& [ x0, y0, x1, y1 ] = x.arr;
    return format ("({:.2f}, {:.2f}, {:.2f}, {:.2f})", x0, y0, x1, y1);
}

} // namespace scrub
