// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_MATRIX_HH
#define SCRUB_SCRUB_MATRIX_HH

#include <defs.hh>

#include <cmath>

#include <scrub/bbox.hh>

namespace scrub {

//
// Affine transformation [ a b c d e f ], applied to row vectors as in PDF:
// x' = a x + c y + e, y' = b x + d y + f:
//
struct matrix_t {
    double a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;
};

//
// Concatenation, `lhs' applied first:
//
inline matrix_t operator* (const matrix_t& lhs, const matrix_t& rhs) {
    return {
        lhs.a * rhs.a + lhs.b * rhs.c,
        lhs.a * rhs.b + lhs.b * rhs.d,
        lhs.c * rhs.a + lhs.d * rhs.c,
        lhs.c * rhs.b + lhs.d * rhs.d,
        lhs.e * rhs.a + lhs.f * rhs.c + rhs.e,
        lhs.e * rhs.b + lhs.f * rhs.d + rhs.f
    };
}

inline point_t transform (const matrix_t& m, double x, double y) {
    return { m.a * x + m.c * y + m.e, m.b * x + m.d * y + m.f };
}

inline point_t transform (const matrix_t& m, const point_t& p) {
    return transform (m, p.x, p.y);
}

//
// Transformed distance, without the translation:
//
inline point_t transform_delta (const matrix_t& m, double x, double y) {
    return { m.a * x + m.c * y, m.b * x + m.d * y };
}

//
// Bounding box of the transformed corners:
//
inline bbox_t transform (const matrix_t& m, const bbox_t& box) {
    const auto& [ x0, y0, x1, y1 ] = box.arr;

    const point_t ps [] = {
        transform (m, x0, y0), transform (m, x1, y0),
        transform (m, x0, y1), transform (m, x1, y1)
    };

    bbox_t result{ ps [0].x, ps [0].y, ps [0].x, ps [0].y };

    for (const auto& p : ps) {
        result += bbox_t{ p.x, p.y, p.x, p.y };
    }

    return result;
}

inline double determinant (const matrix_t& m) {
    return m.a * m.d - m.b * m.c;
}

inline bool invertible (const matrix_t& m) {
    return std::fabs (determinant (m)) > 1e-12;
}

//
// The inverse of a singular matrix is the identity:
//
inline matrix_t invert (const matrix_t& m) {
    const double det = determinant (m);

    if (std::fabs (det) <= 1e-12) {
        return { };
    }

    const double a =  m.d / det, b = -m.b / det;
    const double c = -m.c / det, d =  m.a / det;

    return { a, b, c, d, -(m.e * a + m.f * c), -(m.e * b + m.f * d) };
}

inline matrix_t translate (double x, double y) {
    return { 1, 0, 0, 1, x, y };
}

inline matrix_t scale (double x, double y) {
    return { x, 0, 0, y, 0, 0 };
}

//
// Length of the transformed unit vector, an approximation of the scaling
// of a matrix:
//
inline double norm (const matrix_t& m) {
    return std::sqrt (std::fabs (determinant (m)));
}

} // namespace scrub

#endif // SCRUB_SCRUB_MATRIX_HH
