// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SPLASH_BITMAP_HH
#define SCRUB_SPLASH_BITMAP_HH

#include <defs.hh>

#include <cstdint>
#include <iosfwd>
#include <string>

namespace scrub {

struct rgb_t {
    std::uint8_t r, g, b;
};

//
// Top-down RGB8 pixel buffer, rows not padded:
//
struct bitmap_t {
    bitmap_t () = default;
    bitmap_t (int width, int height, rgb_t background = { 255, 255, 255 });

    int width () const { return width_; }
    int height () const { return height_; }

    size_t row_size () const { return size_t (width_) * 3; }

    const std::string& data () const { return data_; }

    rgb_t pixel (int x, int y) const;

    //
    // Out of bounds pixels are ignored; `alpha' in [0, 255]:
    //
    void set (int x, int y, rgb_t);
    void blend (int x, int y, rgb_t, int alpha);

    //
    // Fill the pixels of [x0, x1) x [y0, y1), clipped to the bitmap:
    //
    void fill (int x0, int y0, int x1, int y1, rgb_t);

    //
    // Binary PPM, for inspection:
    //
    void write_pnm (std::ostream&) const;

private:
    int width_ = 0, height_ = 0;
    std::string data_;
};

} // namespace scrub

#endif // SCRUB_SPLASH_BITMAP_HH
