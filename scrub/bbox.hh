// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_BBOX_HH
#define SCRUB_SCRUB_BBOX_HH

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <type_traits>

namespace scrub {

//
// Clockwise page rotations, in quarter turns:
//
enum struct rotation_t {
    none, quarter_turn, half_turn, three_quarters_turn
};

//
// Rotation from a /Rotate value, any multiple of 90, negative included:
//
inline rotation_t rotation_of (int degrees) {
    switch (((degrees % 360) + 360) % 360) {
    case  90: return rotation_t::quarter_turn;
    case 180: return rotation_t::half_turn;
    case 270: return rotation_t::three_quarters_turn;
    default:  return rotation_t::none;
    }
}

inline int degrees_of (rotation_t r) {
    return 90 * static_cast< int > (r);
}

namespace detail {

template< typename > struct basic_bbox_t;

template< typename T >
struct basic_point_t {
    using value_t = T;
    value_t x, y;

    template< typename U >
    bool in (const basic_bbox_t< U >&) const;
};

//
// Bounding box, described by 4 coordinates of two points, `top-left' and
// `bottom-right', with (0,0) at top-left and y growing downwards:
//
template< typename T >
struct basic_bbox_t {
    using value_type = T;
    using point_type = basic_point_t< T >;

    union {
        value_type arr [4];
        point_type point [2];
    };
};

template< typename T >
inline bool
operator== (const basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    return std::equal (
        lhs.arr, lhs.arr + sizeof lhs.arr / sizeof *lhs.arr, rhs.arr);
}

template< typename T >
inline bool
operator!= (const basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    return !(lhs == rhs);
}

//
// Union:
//
template< typename T >
inline basic_bbox_t< T >
operator+ (const basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    return {
        (std::min) (lhs.arr [0], rhs.arr [0]),
        (std::min) (lhs.arr [1], rhs.arr [1]),
        (std::max) (lhs.arr [2], rhs.arr [2]),
        (std::max) (lhs.arr [3], rhs.arr [3])
    };
}

template< typename T >
inline basic_bbox_t< T >&
operator+= (basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    return (lhs = lhs + rhs);
}

//
// Intersection, inverted if the boxes are disjoint:
//
template< typename T >
inline basic_bbox_t< T >
operator& (const basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    return {
        (std::max) (lhs.arr [0], rhs.arr [0]),
        (std::max) (lhs.arr [1], rhs.arr [1]),
        (std::min) (lhs.arr [2], rhs.arr [2]),
        (std::min) (lhs.arr [3], rhs.arr [3])
    };
}

template< typename T >
inline std::ostream&
operator<< (std::ostream& ss, const basic_bbox_t< T >& box) {
    return ss
        << box.arr [0] << ","
        << box.arr [1] << ","
        << box.arr [2] << ","
        << box.arr [3];
}

////////////////////////////////////////////////////////////////////////

template< typename T >
inline basic_bbox_t< T >
normalize (basic_bbox_t< T > x) {
    if (x.arr [0] > x.arr [2]) { std::swap (x.arr [0], x.arr [2]); }
    if (x.arr [1] > x.arr [3]) { std::swap (x.arr [1], x.arr [3]); }
    return x;
}

template< typename T >
inline T width_of (const basic_bbox_t< T >& x) { return x.arr [2] - x.arr [0]; }

template< typename T >
inline T height_of (const basic_bbox_t< T >& x) { return x.arr [3] - x.arr [1]; }

//
// Area of a normalized box, 0 for empty or inverted boxes:
//
template< typename T >
inline T area_of (const basic_bbox_t< T >& x) {
    const auto w = width_of (x), h = height_of (x);
    return w > 0 && h > 0 ? w * h : T{ };
}

template< typename T >
inline bool empty (const basic_bbox_t< T >& x) {
    return !(width_of (x) > 0) || !(height_of (x) > 0);
}

template< typename T >
inline T
horizontal_overlap (const basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    const auto dist =
        (std::min) (lhs.arr [2], rhs.arr [2]) -
        (std::max) (lhs.arr [0], rhs.arr [0]);
    return dist > 0 ? dist : 0;
}

template< typename T >
inline T
vertical_overlap (const basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    const auto dist =
        (std::min) (lhs.arr [3], rhs.arr [3]) -
        (std::max) (lhs.arr [1], rhs.arr [1]);
    return dist > 0 ? dist : 0;
}

template< typename T >
inline bool
overlapping (const basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    return horizontal_overlap (lhs, rhs) && vertical_overlap (lhs, rhs);
}

template< typename T >
inline T
horizontal_distance (const basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    return lhs.arr [2] < rhs.arr [0]
        ? rhs.arr [0] - lhs.arr [2]
        : rhs.arr [2] < lhs.arr [0] ? lhs.arr [0] - rhs.arr [2] : 0;
}

template< typename T >
inline T
vertical_distance (const basic_bbox_t< T >& lhs, const basic_bbox_t< T >& rhs) {
    return lhs.arr [3] < rhs.arr [1]
        ? rhs.arr [1] - lhs.arr [3]
        : rhs.arr [3] < lhs.arr [1] ? lhs.arr [1] - rhs.arr [3] : 0;
}

template< typename T >
template< typename U >
bool basic_point_t< T >::in (const basic_bbox_t< U >& box) const {
    return
        box.arr [0] <= x && x < box.arr [2] &&
        box.arr [1] <= y && y < box.arr [3];
}

template< scrub::rotation_t, typename >
struct rotate_t;

template< typename T >
struct rotate_t< scrub::rotation_t::none, T > {
    using box_type = basic_bbox_t< T >;
    box_type operator() (const box_type& x, const box_type&) const {
        return x;
    }
};

//
// In the definition of the specialization `x' stands for the box that is
// rotated, and `X' stands for the `superbox', i.e., the unrotated page that
// hosts the box. E.g., under a clockwise quarter turn the new x_min is the
// page height less the former y_max, and the new y_min is the former x_min:
//
#define SCRUB_ROTATE_DEF(type, a, b, c, d)                              \
template< typename T >                                                  \
struct rotate_t< scrub::rotation_t::type, T > {                         \
    using box_type = basic_bbox_t< T >;                                       \
    box_type operator() (const box_type& x, const box_type& X) const {  \
        const auto& [ x0, y0, x1, y1 ] = x.arr;                         \
        const auto& [ X0, Y0, X1, Y1 ] = X.arr;                         \
        (void)X0; (void)Y0;                                             \
        return { a, b, c, d };                                          \
    }                                                                   \
}

SCRUB_ROTATE_DEF (       quarter_turn, Y1 - y1,      x0, Y1 - y0,      x1);
SCRUB_ROTATE_DEF (          half_turn, X1 - x1, Y1 - y1, X1 - x0, Y1 - y0);
SCRUB_ROTATE_DEF (three_quarters_turn,      y0, X1 - x1,      y1, X1 - x0);

#undef SCRUB_ROTATE_DEF

template< scrub::rotation_t, typename >
struct unrotate_t;

template< typename T >
struct unrotate_t< scrub::rotation_t::none, T > {
    using box_type = basic_bbox_t< T >;
    box_type operator() (const box_type& x, const box_type&) const {
        return x;
    }
};

//
// The superbox is the unrotated page here as well, `x' is in the rotated
// (displayed) space:
//
#define SCRUB_UNROTATE_DEF(type, a, b, c, d)                            \
template< typename T >                                                  \
struct unrotate_t< scrub::rotation_t::type, T > {                       \
    using box_type = basic_bbox_t< T >;                                       \
    box_type operator() (const box_type& x, const box_type& X) const {  \
        const auto& [ x0, y0, x1, y1 ] = x.arr;                         \
        const auto& [ X0, Y0, X1, Y1 ] = X.arr;                         \
        (void)X0; (void)Y0;                                             \
        return { a, b, c, d };                                          \
    }                                                                   \
}

SCRUB_UNROTATE_DEF (       quarter_turn,      y0, Y1 - x1,      y1, Y1 - x0);
SCRUB_UNROTATE_DEF (          half_turn, X1 - x1, Y1 - y1, X1 - x0, Y1 - y0);
SCRUB_UNROTATE_DEF (three_quarters_turn, X1 - y1,      x0, X1 - y0,      x1);

#undef SCRUB_UNROTATE_DEF

} // namespace detail

////////////////////////////////////////////////////////////////////////

//
// The default bounding box type is the floating point specialization for
// double:
//
using bbox_t  = detail::basic_bbox_t< double >;
using bboxi_t = detail::basic_bbox_t< int >;

using point_t = detail::basic_point_t< double >;

////////////////////////////////////////////////////////////////////////

template<
    typename T, typename U,
    typename std::enable_if_t< std::is_constructible_v< T, U > >* = nullptr
    >
inline detail::basic_bbox_t< T >
to (const detail::basic_bbox_t< U >& x) {
    return detail::basic_bbox_t< T >{
        T (x.arr [0]), T (x.arr [1]), T (x.arr [2]), T (x.arr [3])
    };
}

////////////////////////////////////////////////////////////////////////

template< rotation_t rotation, typename T >
inline detail::basic_bbox_t< T >
rotate (const detail::basic_bbox_t< T >& box, const detail::basic_bbox_t< T >& superbox) {
    return detail::rotate_t< rotation, T > ()(box, superbox);
}

template< rotation_t rotation, typename T >
inline detail::basic_bbox_t< T >
unrotate (const detail::basic_bbox_t< T >& box, const detail::basic_bbox_t< T >& superbox) {
    return detail::unrotate_t< rotation, T > ()(box, superbox);
}

//
// Run-time dispatch on the rotation:
//
template< typename T >
inline detail::basic_bbox_t< T >
rotate (const detail::basic_bbox_t< T >& box, const detail::basic_bbox_t< T >& superbox,
        rotation_t rotation) {
    switch (rotation) {
    case rotation_t::quarter_turn:
        return rotate< rotation_t::quarter_turn > (box, superbox);
    case rotation_t::half_turn:
        return rotate< rotation_t::half_turn > (box, superbox);
    case rotation_t::three_quarters_turn:
        return rotate< rotation_t::three_quarters_turn > (box, superbox);
    default:
        return box;
    }
}

template< typename T >
inline detail::basic_bbox_t< T >
unrotate (const detail::basic_bbox_t< T >& box, const detail::basic_bbox_t< T >& superbox,
          rotation_t rotation) {
    switch (rotation) {
    case rotation_t::quarter_turn:
        return unrotate< rotation_t::quarter_turn > (box, superbox);
    case rotation_t::half_turn:
        return unrotate< rotation_t::half_turn > (box, superbox);
    case rotation_t::three_quarters_turn:
        return unrotate< rotation_t::three_quarters_turn > (box, superbox);
    default:
        return box;
    }
}

} // namespace scrub

#endif // SCRUB_SCRUB_BBOX_HH
