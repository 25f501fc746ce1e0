// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_TEXT_HH
#define SCRUB_SCRUB_TEXT_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <scrub/bbox.hh>
#include <scrub/gfx.hh>

namespace scrub {

struct text_char_t {
    char32_t c;
    bbox_t box;
};

//
// Run of characters of a line sharing a font and a size:
//
struct text_span_t {
    bbox_t rect;

    std::string font;
    double size;

    //
    // UTF-8:
    //
    std::string text;

    std::vector< text_char_t > chars;
};

struct text_line_t {
    bbox_t rect;
    std::vector< text_span_t > spans;

    std::string text () const;
};

struct text_block_t {
    bbox_t rect;
    std::vector< text_line_t > lines;
};

struct text_page_t {
    std::vector< text_block_t > blocks;

    //
    // Lines separated by newlines, blocks by an empty line:
    //
    std::string plain_text () const;

    //
    // Case-insensitive search, one rectangle per hit; hits do not span
    // lines:
    //
    std::vector< bbox_t > search (const std::string&) const;
};

//
// Collects the characters drawn on a page and groups them into spans, lines
// and blocks, in content order:
//
struct text_dev_t : output_dev_t {
    void draw_glyph (const gfx_state_t&, const glyph_t&, const matrix_t&,
                     const bbox_t&, const glyph_location_t&) override;

    text_page_t take ();

private:
    struct char_t {
        text_char_t ch;
        std::string font;
        double size;
    };

    std::vector< char_t > chars_;
};

} // namespace scrub

#endif // SCRUB_SCRUB_TEXT_HH
