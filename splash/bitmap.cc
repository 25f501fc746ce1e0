// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>
#include <ostream>
#include <stdexcept>

#include <fmt/format.h>
using fmt::format;

#include <splash/bitmap.hh>

namespace scrub {

bitmap_t::bitmap_t (int width, int height, rgb_t background)
    : width_ (width), height_ (height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument (
            format ("invalid bitmap size {}x{}", width, height));
    }

    data_.resize (row_size () * size_t (height));

    for (size_t i = 0; i < data_.size (); i += 3) {
        data_ [i]     = char (background.r);
        data_ [i + 1] = char (background.g);
        data_ [i + 2] = char (background.b);
    }
}

rgb_t bitmap_t::pixel (int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return { 0, 0, 0 };
    }

    const auto p = reinterpret_cast< const std::uint8_t* > (data_.data ()) +
        size_t (y) * row_size () + size_t (x) * 3;

    return { p [0], p [1], p [2] };
}

void bitmap_t::set (int x, int y, rgb_t c) {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return;
    }

    auto p = &data_ [size_t (y) * row_size () + size_t (x) * 3];

    p [0] = char (c.r);
    p [1] = char (c.g);
    p [2] = char (c.b);
}

void bitmap_t::blend (int x, int y, rgb_t c, int alpha) {
    if (alpha >= 255) {
        return set (x, y, c);
    }

    if (alpha <= 0) {
        return;
    }

    const auto dst = pixel (x, y);

    auto mix = [alpha](int lhs, int rhs) {
        return std::uint8_t ((lhs * alpha + rhs * (255 - alpha)) / 255);
    };

    set (x, y, { mix (c.r, dst.r), mix (c.g, dst.g), mix (c.b, dst.b) });
}

void bitmap_t::fill (int x0, int y0, int x1, int y1, rgb_t c) {
    x0 = (std::max) (x0, 0);
    y0 = (std::max) (y0, 0);

    x1 = (std::min) (x1, width_);
    y1 = (std::min) (y1, height_);

    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            set (x, y, c);
        }
    }
}

void bitmap_t::write_pnm (std::ostream& s) const {
    s << "P6\n" << width_ << " " << height_ << "\n255\n";
    s.write (data_.data (), data_.size ());
}

} // namespace scrub
