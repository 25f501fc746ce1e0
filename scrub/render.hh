// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_RENDER_HH
#define SCRUB_SCRUB_RENDER_HH

#include <defs.hh>

#include <map>
#include <string>

#include <scrub/gfx.hh>
#include <splash/bitmap.hh>
#include <splash/ft_engine.hh>

namespace scrub {

struct page_t;

//
// Paints a content stream into a bitmap, with the bitmap pixels as device
// space. Type 3 glyphs, shadings and patterns are not painted:
//
struct render_dev_t : output_dev_t {
    //
    // `font_file' is used for fonts without an embedded program:
    //
    render_dev_t (bitmap_t&, const ft_engine_t&, const std::string& font_file);

    bool need_image_data () const override { return true; }

    void draw_glyph (const gfx_state_t&, const glyph_t&, const matrix_t&,
                     const bbox_t&, const glyph_location_t&) override;

    void fill_path (const gfx_state_t&, const path_t&, bool, size_t) override;
    void stroke_path (const gfx_state_t&, const path_t&, size_t) override;

    void draw_image (const gfx_state_t&, const image_t&, const bbox_t&,
                     size_t) override;

private:
    ft_face_pointer face_of (const font_t&);
    unsigned glyph_index (const font_t&, const ft_face_t&, bool fallback,
                          const glyph_t&) const;

    bitmap_t& bitmap_;
    const ft_engine_t& engine_;

    std::string font_file_;
    ft_face_pointer fallback_;
    bool fallback_loaded_ = false;

    std::map< const font_t*, ft_face_pointer > faces_;
};

//
// Render the page at the given resolution, white background, page space
// scaled by dpi / 72 as the pixel space:
//
bitmap_t render_page (const page_t&, double dpi,
                      const std::string& font_file = { });

} // namespace scrub

#endif // SCRUB_SCRUB_RENDER_HH
