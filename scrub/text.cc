// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>
#include <cctype>
#include <cmath>

#include <scrub/text.hh>
#include <utils/string.hh>

namespace scrub {
namespace detail {

//
// Fraction of the font size above which a gap between two characters reads
// as a space:
//
constexpr double space_gap = .25;

static char32_t fold (char32_t c) {
    return c < 0x80 ? char32_t (std::tolower (int (c))) : c;
}

static bool same_line (const bbox_t& line, const bbox_t& prev,
                       const bbox_t& box, double size) {
    const auto h = (std::min) (height_of (line), height_of (box));

    if (vertical_overlap (line, box) < .5 * h) {
        return false;
    }

    return box.arr [0] >= prev.arr [0] - .5 * size;
}

static void add_char (text_line_t& line, const std::string& font,
                      double size, const text_char_t& ch) {
    if (line.spans.empty () ||
        line.spans.back ().font != font ||
        std::fabs (line.spans.back ().size - size) > .01) {
        line.spans.push_back ({ ch.box, font, size, { }, { } });
    }

    auto& span = line.spans.back ();

    span.rect += ch.box;
    append_utf8 (span.text, ch.c);
    span.chars.push_back (ch);

    line.rect += ch.box;
}

} // namespace detail

std::string text_line_t::text () const {
    std::string s;

    for (const auto& span : spans) {
        s += span.text;
    }

    return s;
}

std::string text_page_t::plain_text () const {
    std::string s;

    for (size_t i = 0; i < blocks.size (); ++i) {
        if (i) {
            s += '\n';
        }

        for (const auto& line : blocks [i].lines) {
            s += line.text ();
            s += '\n';
        }
    }

    return s;
}

std::vector< bbox_t > text_page_t::search (const std::string& term) const {
    std::vector< bbox_t > xs;

    const auto needle = to_utf32 (term);

    if (needle.empty ()) {
        return xs;
    }

    for (const auto& block : blocks) {
        for (const auto& line : block.lines) {
            std::vector< const text_char_t* > chars;

            for (const auto& span : line.spans) {
                for (const auto& ch : span.chars) {
                    chars.push_back (&ch);
                }
            }

            auto iter = chars.begin ();

            for (;;) {
                iter = std::search (
                    iter, chars.end (), needle.begin (), needle.end (),
                    [](const text_char_t* lhs, char32_t rhs) {
                        return detail::fold (lhs->c) == detail::fold (rhs);
                    });

                if (iter == chars.end ()) {
                    break;
                }

                bbox_t box = (*iter)->box;

                for (size_t i = 1; i < needle.size (); ++i) {
                    box += iter [i]->box;
                }

                xs.push_back (box);
                iter += needle.size ();
            }
        }
    }

    return xs;
}

void text_dev_t::draw_glyph (const gfx_state_t& state, const glyph_t& glyph,
                             const matrix_t& trm, const bbox_t& box,
                             const glyph_location_t&) {
    if (glyph.text.empty ()) {
        return;
    }

    const auto font = state.text.font ? state.text.font->base_name () : "";
    const auto size = norm (trm);

    //
    // Ligatures share the glyph box evenly:
    //
    const auto n = glyph.text.size ();
    const auto w = width_of (box) / n;

    for (size_t i = 0; i < n; ++i) {
        const bbox_t other{
            box.arr [0] + i * w, box.arr [1],
            box.arr [0] + (i + 1) * w, box.arr [3]
        };

        chars_.push_back ({ { glyph.text [i], other }, font, size });
    }
}

text_page_t text_dev_t::take () {
    std::vector< text_line_t > lines;

    for (const auto& [ch, font, size] : chars_) {
        if (!lines.empty ()) {
            auto& line = lines.back ();
            const auto& prev = line.spans.back ().chars.back ();

            if (detail::same_line (line.rect, prev.box, ch.box, size)) {
                const auto gap = ch.box.arr [0] - prev.box.arr [2];

                if (gap > detail::space_gap * size &&
                    prev.c != ' ' && ch.c != ' ') {
                    const bbox_t box{
                        prev.box.arr [2], line.rect.arr [1],
                        ch.box.arr [0], line.rect.arr [3]
                    };

                    const auto span_font = line.spans.back ().font;
                    const auto span_size = line.spans.back ().size;

                    detail::add_char (
                        line, span_font, span_size, { U' ', box });
                }

                detail::add_char (line, font, size, ch);
                continue;
            }
        }

        lines.emplace_back ();
        lines.back ().rect = ch.box;

        detail::add_char (lines.back (), font, size, ch);
    }

    text_page_t page;

    for (auto& line : lines) {
        if (!page.blocks.empty ()) {
            auto& block = page.blocks.back ();
            const auto& prev = block.lines.back ();

            const auto h = (std::max) (height_of (prev.rect), 1.);

            if (vertical_distance (prev.rect, line.rect) < h &&
                line.rect.arr [1] >= prev.rect.arr [1] &&
                horizontal_overlap (block.rect, line.rect) > 0) {
                block.rect += line.rect;
                block.lines.push_back (std::move (line));
                continue;
            }
        }

        page.blocks.push_back ({ line.rect, { } });
        page.blocks.back ().lines.push_back (std::move (line));
    }

    chars_.clear ();

    return page;
}

} // namespace scrub
