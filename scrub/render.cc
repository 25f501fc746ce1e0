// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

#include <scrub/content.hh>
#include <scrub/error.hh>
#include <scrub/page.hh>
#include <scrub/render.hh>
#include <splash/dct.hh>
#include <splash/xpath.hh>

namespace scrub {
namespace detail {

static std::uint8_t to_byte (double x) {
    return std::uint8_t (std::lround ((std::max) (0., (std::min) (1., x)) * 255));
}

static rgb_t to_rgb8 (const color_t& c) {
    return { to_byte (c.r), to_byte (c.g), to_byte (c.b) };
}

static int to_alpha (double x) {
    return to_byte (x);
}

//
// Unpacked samples of an image row by row, each sample scaled to [0, 1]
// except for indexed spaces which keep the raw index:
//
struct samples_t {
    samples_t (const std::string& data, int width, int height, int comps,
               int bpc)
        : data (data), width (width), comps (comps), bpc (bpc),
          max ((1U << (std::min) (bpc, 16)) - 1),
          stride ((size_t (width) * comps * bpc + 7) / 8) {
        if (data.size () < stride * height) {
            error (errSyntaxWarning, -1, "image data too short");
        }
    }

    unsigned raw (int x, int y, int c) const {
        const size_t bit = (size_t (x) * comps + c) * bpc;
        const size_t off = size_t (y) * stride + bit / 8;

        if (off >= data.size ()) {
            return 0;
        }

        const unsigned byte = (unsigned char)data [off];

        switch (bpc) {
        case 8:
            return byte;

        case 16:
            return off + 1 < data.size ()
                ? (byte << 8) | (unsigned char)data [off + 1]
                : byte << 8;

        default:
            return (byte >> (8 - bpc - bit % 8)) & max;
        }
    }

    const std::string& data;
    int width, comps, bpc;
    unsigned max;
    size_t stride;
};

static colorspace_t space_of_components (int n) {
    switch (n) {
    case 3:  return { colorspace_t::rgb,  3 };
    case 4:  return { colorspace_t::cmyk, 4 };
    default: return { colorspace_t::gray, 1 };
    }
}

//
// One color per sample, or nothing for unsupported encodings:
//
static std::optional< std::vector< rgb_t > >
image_colors (const image_t& image) {
    std::string dct_data;

    colorspace_t space = image.space;
    int bpc = image.bpc;

    const std::string* data = &image.data;

    if (image.filter == "DCTDecode") {
        auto dct = decode_dct (image.data);

        if (!dct || dct->width != image.width || dct->height != image.height) {
            return { };
        }

        if (space.components != dct->components) {
            space = space_of_components (dct->components);
        }

        dct_data = std::move (dct->data);

        data = &dct_data;
        bpc = 8;
    }
    else if (!image.filter.empty ()) {
        error (errUnimplemented, -1, "{} images are not rendered", image.filter);
        return { };
    }

    if (bpc != 1 && bpc != 2 && bpc != 4 && bpc != 8 && bpc != 16) {
        error (errSyntaxError, -1, "invalid image depth {}", bpc);
        return { };
    }

    if (space.kind == colorspace_t::pattern) {
        return { };
    }

    const int comps = space.components;
    const samples_t samples (*data, image.width, image.height, comps, bpc);

    std::vector< rgb_t > colors;
    colors.reserve (size_t (image.width) * image.height);

    std::vector< double > xs (comps);

    for (int y = 0; y < image.height; ++y) {
        for (int x = 0; x < image.width; ++x) {
            if (bpc == 8 && space.kind == colorspace_t::rgb) {
                colors.push_back ({
                    std::uint8_t (samples.raw (x, y, 0)),
                    std::uint8_t (samples.raw (x, y, 1)),
                    std::uint8_t (samples.raw (x, y, 2)) });
                continue;
            }

            for (int c = 0; c < comps; ++c) {
                const auto value = samples.raw (x, y, c);

                xs [c] = space.kind == colorspace_t::indexed
                    ? double (value) : double (value) / samples.max;
            }

            colors.push_back (to_rgb8 (to_rgb (space, xs)));
        }
    }

    return colors;
}

//
// Paint the pixels whose centers fall inside the image, `fun' gets the
// sample coordinates:
//
template< typename F >
void draw_unit_square (bitmap_t& bitmap, const image_t& image,
                       const bbox_t& box, F fun) {
    if (!invertible (image.matrix)) {
        return;
    }

    const auto m = invert (image.matrix);

    const int x0 = (std::max) (0, int (std::floor (box.arr [0])));
    const int y0 = (std::max) (0, int (std::floor (box.arr [1])));
    const int x1 = (std::min) (bitmap.width (), int (std::ceil (box.arr [2])));
    const int y1 = (std::min) (bitmap.height (), int (std::ceil (box.arr [3])));

    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            const auto p = transform (m, x + .5, y + .5);

            if (p.x < 0 || p.x >= 1 || p.y < 0 || p.y >= 1) {
                continue;
            }

            //
            // The first row of samples is at the top of the unit square:
            //
            const int sx = (std::min) (image.width - 1, int (p.x * image.width));
            const int sy = (std::min) (
                image.height - 1, int ((1 - p.y) * image.height));

            fun (x, y, sx, sy);
        }
    }
}

} // namespace detail

render_dev_t::render_dev_t (
    bitmap_t& bitmap, const ft_engine_t& engine, const std::string& font_file)
    : bitmap_ (bitmap), engine_ (engine), font_file_ (font_file) { }

ft_face_pointer render_dev_t::face_of (const font_t& font) {
    auto iter = faces_.find (&font);

    if (iter != faces_.end ()) {
        return iter->second;
    }

    ft_face_pointer face;

    if (font.program_type () != font_program_t::none) {
        face = engine_.load (font.program ());

        if (!face) {
            error (errSyntaxWarning, -1,
                   "embedded font '{}' could not be loaded", font.base_name ());
        }
    }

    faces_.emplace (&font, face);

    return face;
}

unsigned render_dev_t::glyph_index (
    const font_t& font, const ft_face_t& face, bool fallback,
    const glyph_t& glyph) const {
    if (fallback) {
        return glyph.text.empty ()
            ? 0 : face.glyph_index_by_unicode (glyph.text [0]);
    }

    if (font.kind () == font_kind_t::cid) {
        return font.cid_to_gid (glyph.code);
    }

    unsigned gid = 0;

    if (font.program_type () == font_program_t::truetype) {
        if (font.symbolic ()) {
            gid = face.glyph_index_by_code (glyph.code);
        }

        if (!gid && !glyph.text.empty ()) {
            gid = face.glyph_index_by_unicode (glyph.text [0]);
        }

        if (!gid) {
            gid = face.glyph_index_by_name (font.glyph_name (glyph.code));
        }

        if (!gid) {
            gid = face.glyph_index_by_code (glyph.code);
        }
    }
    else {
        gid = face.glyph_index_by_name (font.glyph_name (glyph.code));

        if (!gid) {
            gid = face.glyph_index_by_code (glyph.code);
        }
    }

    return gid;
}

void render_dev_t::draw_glyph (
    const gfx_state_t& state, const glyph_t& glyph, const matrix_t& trm,
    const bbox_t&, const glyph_location_t&) {
    const auto& text = state.text;

    //
    // Invisible and clip-only text:
    //
    if (text.render == 3 || text.render == 7) {
        return;
    }

    if (!text.font || text.font->kind () == font_kind_t::type3) {
        return;
    }

    const auto& font = *text.font;

    bool fallback = false;
    auto face = face_of (font);

    if (!face) {
        if (!fallback_loaded_) {
            fallback_loaded_ = true;

            if (!font_file_.empty ()) {
                fallback_ = engine_.load_file (font_file_);

                if (!fallback_) {
                    error (errConfig, -1,
                           "font file '{}' could not be loaded", font_file_);
                }
            }
            else {
                error (errWarning, -1,
                       "no font file for non-embedded fonts, text is not "
                       "rendered");
            }
        }

        face = fallback_;
        fallback = true;
    }

    if (!face) {
        return;
    }

    const auto gid = glyph_index (font, *face, fallback, glyph);

    if (0 == gid) {
        return;
    }

    auto bitmap = face->render (gid, { trm.a, trm.b, trm.c, trm.d, 0, 0 });

    if (!bitmap) {
        return;
    }

    const bool stroke = text.render == 1 || text.render == 5;

    const auto color = detail::to_rgb8 (stroke ? state.stroke : state.fill);
    const auto alpha = detail::to_alpha (
        stroke ? state.stroke_alpha : state.fill_alpha);

    const int ox = int (std::lround (trm.e)) + bitmap->x;
    const int oy = int (std::lround (trm.f)) + bitmap->y;

    for (int y = 0; y < bitmap->h; ++y) {
        for (int x = 0; x < bitmap->w; ++x) {
            const int coverage = bitmap->data [size_t (y) * bitmap->w + x];

            if (coverage) {
                bitmap_.blend (ox + x, oy + y, color, coverage * alpha / 255);
            }
        }
    }
}

void render_dev_t::fill_path (
    const gfx_state_t& state, const path_t& path, bool eo, size_t) {
    if (state.fill_space.kind == colorspace_t::pattern) {
        return;
    }

    fill (bitmap_, xpath_t (path.subpaths), eo, detail::to_rgb8 (state.fill),
          detail::to_alpha (state.fill_alpha));
}

void render_dev_t::stroke_path (
    const gfx_state_t& state, const path_t& path, size_t) {
    if (state.stroke_space.kind == colorspace_t::pattern) {
        return;
    }

    const auto width = state.line_width * norm (state.ctm);

    fill (bitmap_, stroke_xpath (path.subpaths, path.closed, width), false,
          detail::to_rgb8 (state.stroke), detail::to_alpha (state.stroke_alpha));
}

void render_dev_t::draw_image (
    const gfx_state_t& state, const image_t& image, const bbox_t& box,
    size_t) {
    if (image.mask) {
        if (!image.filter.empty ()) {
            error (errUnimplemented, -1,
                   "{} image masks are not rendered", image.filter);
            return;
        }

        const detail::samples_t samples (
            image.data, image.width, image.height, 1, 1);

        const auto color = detail::to_rgb8 (state.fill);
        const auto alpha = detail::to_alpha (state.fill_alpha);

        detail::draw_unit_square (
            bitmap_, image, box, [&](int x, int y, int sx, int sy) {
                //
                // Zero samples paint, unless the decode array is inverted:
                //
                if ((samples.raw (sx, sy, 0) != 0) == image.inverted) {
                    bitmap_.blend (x, y, color, alpha);
                }
            });

        return;
    }

    auto colors = detail::image_colors (image);

    if (!colors) {
        //
        // Unsupported encodings show as a gray box:
        //
        detail::draw_unit_square (
            bitmap_, image, box, [&](int x, int y, int, int) {
                bitmap_.set (x, y, { 192, 192, 192 });
            });

        return;
    }

    const auto alpha = detail::to_alpha (state.fill_alpha);

    detail::draw_unit_square (
        bitmap_, image, box, [&](int x, int y, int sx, int sy) {
            bitmap_.blend (
                x, y, (*colors) [size_t (sy) * image.width + sx], alpha);
        });
}

////////////////////////////////////////////////////////////////////////

bitmap_t render_page (const page_t& page, double dpi,
                      const std::string& font_file) {
    const auto k = dpi / 72;
    const auto bounds = page.bounds ();

    bitmap_t bitmap (
        (std::max) (1, int (std::ceil (width_of (bounds) * k))),
        (std::max) (1, int (std::ceil (height_of (bounds) * k))));

    ft_engine_t engine;
    render_dev_t dev (bitmap, engine, font_file);

    gfx_t gfx (page.doc (), dev);
    gfx.run (parse_content (page.contents ()), page.resources (),
             page.page_matrix () * scale (k, k));

    return bitmap;
}

} // namespace scrub
