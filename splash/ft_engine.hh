// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SPLASH_FT_ENGINE_HH
#define SCRUB_SPLASH_FT_ENGINE_HH

#include <defs.hh>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <scrub/matrix.hh>
#include <utils/path.hh>

namespace scrub {

//
// Anti-aliased glyph image; (x, y) is the offset of the top-left pixel from
// the glyph origin, in device pixels:
//
struct glyph_bitmap_t {
    int x, y, w, h;
    std::vector< std::uint8_t > data;
};

using ft_library_pointer = std::shared_ptr< FT_LibraryRec_ >;

//
// A font program loaded by FreeType. The face keeps the font data and the
// library alive:
//
struct ft_face_t {
    ft_face_t (ft_library_pointer, std::string);
    ~ft_face_t ();

    ft_face_t (const ft_face_t&) = delete;
    ft_face_t& operator= (const ft_face_t&) = delete;

    bool has_glyph_names () const;

    unsigned glyph_index_by_name (const char*) const;
    unsigned glyph_index_by_unicode (char32_t) const;

    //
    // Glyph of a single-byte code through the built-in cmaps: Microsoft
    // symbol (with the 0xF000 offset), then Macintosh Roman:
    //
    unsigned glyph_index_by_code (unsigned) const;

    //
    // Render the glyph with `m' taking one em, y up, to device space, y
    // down; nothing for missing glyphs or absurd sizes:
    //
    std::optional< glyph_bitmap_t > render (unsigned, const matrix_t& m);

private:
    friend struct ft_engine_t;

    ft_library_pointer lib_;
    std::string data_;
    FT_Face face_ = 0;
};

using ft_face_pointer = std::shared_ptr< ft_face_t >;

struct ft_engine_t {
    //
    // Throws std::runtime_error if FreeType cannot be initialized:
    //
    ft_engine_t ();

    //
    // Load a font program from memory or from a file; null on failure:
    //
    ft_face_pointer load (std::string) const;
    ft_face_pointer load_file (const fs::path&) const;

private:
    ft_library_pointer lib_;
};

} // namespace scrub

#endif // SCRUB_SPLASH_FT_ENGINE_HH
