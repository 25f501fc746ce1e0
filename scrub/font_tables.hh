// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC

#ifndef SCRUB_SCRUB_FONT_TABLES_HH
#define SCRUB_SCRUB_FONT_TABLES_HH

#include <defs.hh>

#include <cstddef>

namespace scrub {

//
// Glyph names by character code, 0 for unassigned codes:
//
extern const char* standard_encoding [256];
extern const char* win_ansi_encoding [256];
extern const char* mac_roman_encoding [256];

struct glyph_unicode_t {
    const char* name;
    char32_t unicode;
};

extern const glyph_unicode_t glyph_unicode_table [];
extern const size_t glyph_unicode_table_size;

struct glyph_width_t {
    const char* name;
    int width;
};

//
// Metrics of the standard 14 fonts: glyph widths in thousandths of a text
// space unit, ascent and descent. Bold and italic styles share the metrics
// of the regular face:
//
struct builtin_font_t {
    const char* name;

    const glyph_width_t* widths;
    size_t size;

    //
    // Width of the glyphs missing from the table; the fixed pitch fonts
    // carry no table at all:
    //
    int default_width;

    int ascent, descent;
};

//
// The builtin font for a base font name, e.g., `Helvetica-Bold' or
// `ArialMT,Bold'; null if there is no match:
//
const builtin_font_t* find_builtin_font (const char*);

//
// Glyph width from a builtin font, in thousandths; the default width if the
// glyph is not in the table:
//
int builtin_width (const builtin_font_t&, const char* glyph);

//
// Unicode value of a glyph name: standard names, `uniXXXX' and `uXXXX[XX]'
// forms; 0 if unknown:
//
char32_t glyph_unicode (const char*);

//
// Reverse of the above for the standard names, null if there is none:
//
const char* glyph_name (char32_t);

} // namespace scrub

#endif // SCRUB_SCRUB_FONT_TABLES_HH
