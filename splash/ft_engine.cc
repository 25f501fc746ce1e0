// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <splash/ft_engine.hh>

//
// Glyphs larger than this many pixels per em are not rendered:
//
#define SPLASH_MAX_PPEM 4096

namespace scrub {
namespace detail {

static FT_Fixed to_fixed (double x) {
    return FT_Fixed (std::lround (x * 65536));
}

} // namespace detail

ft_face_t::ft_face_t (ft_library_pointer lib, std::string data)
    : lib_ (std::move (lib)), data_ (std::move (data)) { }

ft_face_t::~ft_face_t () {
    if (face_) {
        FT_Done_Face (face_);
    }
}

bool ft_face_t::has_glyph_names () const {
    return FT_HAS_GLYPH_NAMES (face_);
}

unsigned ft_face_t::glyph_index_by_name (const char* name) const {
    if (!name || !has_glyph_names ()) {
        return 0;
    }

    return FT_Get_Name_Index (face_, const_cast< char* > (name));
}

unsigned ft_face_t::glyph_index_by_unicode (char32_t c) const {
    if (FT_Select_Charmap (face_, FT_ENCODING_UNICODE)) {
        return 0;
    }

    return FT_Get_Char_Index (face_, FT_ULong (c));
}

unsigned ft_face_t::glyph_index_by_code (unsigned code) const {
    for (int i = 0; i < face_->num_charmaps; ++i) {
        const auto cmap = face_->charmaps [i];

        if (cmap->platform_id == 3 && cmap->encoding_id == 0) {
            FT_Set_Charmap (face_, cmap);

            if (auto gid = FT_Get_Char_Index (face_, 0xF000 + code)) {
                return gid;
            }

            if (auto gid = FT_Get_Char_Index (face_, code)) {
                return gid;
            }
        }
    }

    for (int i = 0; i < face_->num_charmaps; ++i) {
        const auto cmap = face_->charmaps [i];

        if (cmap->platform_id == 1 && cmap->encoding_id == 0) {
            FT_Set_Charmap (face_, cmap);

            if (auto gid = FT_Get_Char_Index (face_, code)) {
                return gid;
            }
        }
    }

    return 0;
}

std::optional< glyph_bitmap_t >
ft_face_t::render (unsigned gid, const matrix_t& m) {
    const auto ppem = norm (m);

    if (!(ppem > 0.5) || ppem > SPLASH_MAX_PPEM) {
        return { };
    }

    if (FT_Set_Char_Size (
            face_, 0, FT_F26Dot6 (std::lround (ppem * 64)), 72, 72)) {
        return { };
    }

    //
    // FreeType output has y growing upwards:
    //
    FT_Matrix matrix;

    matrix.xx = detail::to_fixed ( m.a / ppem);
    matrix.xy = detail::to_fixed ( m.c / ppem);
    matrix.yx = detail::to_fixed (-m.b / ppem);
    matrix.yy = detail::to_fixed (-m.d / ppem);

    FT_Set_Transform (face_, &matrix, 0);

    if (FT_Load_Glyph (face_, gid, FT_LOAD_NO_BITMAP | FT_LOAD_NO_HINTING)) {
        return { };
    }

    const auto slot = face_->glyph;

    if (FT_Render_Glyph (slot, FT_RENDER_MODE_NORMAL)) {
        return { };
    }

    const auto& src = slot->bitmap;

    glyph_bitmap_t glyph{
        slot->bitmap_left, -slot->bitmap_top,
        int (src.width), int (src.rows), { } };

    glyph.data.resize (size_t (glyph.w) * glyph.h);

    for (int y = 0; y < glyph.h; ++y) {
        const auto row = src.buffer + ptrdiff_t (y) * src.pitch;

        for (int x = 0; x < glyph.w; ++x) {
            glyph.data [size_t (y) * glyph.w + x] = row [x];
        }
    }

    return glyph;
}

////////////////////////////////////////////////////////////////////////

ft_engine_t::ft_engine_t () {
    FT_Library lib;

    if (FT_Init_FreeType (&lib)) {
        throw std::runtime_error ("FreeType initialization failed");
    }

    lib_ = ft_library_pointer (lib, FT_Done_FreeType);
}

ft_face_pointer ft_engine_t::load (std::string data) const {
    if (data.empty ()) {
        return { };
    }

    //
    // The face refers to the font data, which the face object owns:
    //
    auto p = std::make_shared< ft_face_t > (lib_, std::move (data));

    if (FT_New_Memory_Face (
            lib_.get (), reinterpret_cast< const FT_Byte* > (p->data_.data ()),
            FT_Long (p->data_.size ()), 0, &p->face_)) {
        return { };
    }

    return p;
}

ft_face_pointer ft_engine_t::load_file (const fs::path& path) const {
    std::ifstream f (path, std::ios::binary);

    if (!f) {
        return { };
    }

    return load (std::string (
        std::istreambuf_iterator< char > (f),
        std::istreambuf_iterator< char > ()));
}

} // namespace scrub
