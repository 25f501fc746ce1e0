// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <cstring>

#include <scrub/document.hh>
#include <scrub/error.hh>
#include <scrub/gfx.hh>
#include <scrub/page.hh>

//
// Nesting limit of form XObjects:
//
#define SCRUB_MAX_FORM_DEPTH 32

//
// Segments per flattened Bezier curve:
//
#define SCRUB_CURVE_SEGMENTS 16

namespace scrub {
namespace detail {

static double num (const obj_t& obj) {
    return lookup< double > (obj).value_or (0);
}

static color_t cmyk_to_rgb (double c, double m, double y, double k) {
    return {
        (1 - (std::min) (1., c + k)),
        (1 - (std::min) (1., m + k)),
        (1 - (std::min) (1., y + k))
    };
}

static color_t
to_rgb (colorspace_t::kind_t kind, const std::vector< double >& xs) {
    auto at = [&](size_t i) { return i < xs.size () ? xs [i] : 0.; };

    switch (kind) {
    case colorspace_t::rgb:
        return { at (0), at (1), at (2) };

    case colorspace_t::cmyk:
        return cmyk_to_rgb (at (0), at (1), at (2), at (3));

    case colorspace_t::separation:
        return { 1 - at (0), 1 - at (0), 1 - at (0) };

    case colorspace_t::pattern:
        return { .5, .5, .5 };

    default:
        return { at (0), at (0), at (0) };
    }
}

} // namespace detail

color_t to_rgb (const colorspace_t& space, const std::vector< double >& xs) {
    if (space.kind != colorspace_t::indexed) {
        return detail::to_rgb (space.kind, xs);
    }

    const int index = (std::max) (
        0, (std::min) (space.hival, xs.empty () ? 0 : int (xs [0] + .5)));

    std::vector< double > base;

    for (int i = 0; i < space.base_components; ++i) {
        const size_t off = size_t (index) * space.base_components + i;

        base.push_back (
            off < space.palette.size ()
            ? (unsigned char)space.palette [off] / 255. : 0.);
    }

    return detail::to_rgb (space.base, base);
}

bbox_t bbox_of (const path_t& path) {
    bool first = true;
    bbox_t box{ 0, 0, 0, 0 };

    for (const auto& subpath : path.subpaths) {
        for (const auto& p : subpath) {
            const bbox_t other{ p.x, p.y, p.x, p.y };

            if (first) {
                box = other;
                first = false;
            }
            else {
                box += other;
            }
        }
    }

    return box;
}

////////////////////////////////////////////////////////////////////////

const gfx_t::operator_t gfx_t::operators [] = {
    { "\"",  3, { check_num, check_num, check_string }, &gfx_t::op_move_set_show_text },
    { "'",   1, { check_string }, &gfx_t::op_move_show_text },
    { "B",   0, { check_none }, &gfx_t::op_fill_stroke },
    { "B*",  0, { check_none }, &gfx_t::op_eofill_stroke },
    { "BDC", 2, { check_name, check_props }, &gfx_t::op_ignore },
    { "BI",  1, { check_props }, &gfx_t::op_inline_image },
    { "BMC", 1, { check_name }, &gfx_t::op_ignore },
    { "BT",  0, { check_none }, &gfx_t::op_begin_text },
    { "BX",  0, { check_none }, &gfx_t::op_ignore },
    { "CS",  1, { check_name }, &gfx_t::op_set_stroke_space },
    { "DP",  2, { check_name, check_props }, &gfx_t::op_ignore },
    { "Do",  1, { check_name }, &gfx_t::op_xobject },
    { "EMC", 0, { check_none }, &gfx_t::op_ignore },
    { "ET",  0, { check_none }, &gfx_t::op_end_text },
    { "EX",  0, { check_none }, &gfx_t::op_ignore },
    { "F",   0, { check_none }, &gfx_t::op_fill },
    { "G",   1, { check_num }, &gfx_t::op_set_stroke_gray },
    { "J",   1, { check_int }, &gfx_t::op_ignore },
    { "K",   4, { check_num, check_num, check_num, check_num }, &gfx_t::op_set_stroke_cmyk },
    { "M",   1, { check_num }, &gfx_t::op_ignore },
    { "MP",  1, { check_name }, &gfx_t::op_ignore },
    { "Q",   0, { check_none }, &gfx_t::op_restore },
    { "RG",  3, { check_num, check_num, check_num }, &gfx_t::op_set_stroke_rgb },
    { "S",   0, { check_none }, &gfx_t::op_stroke },
    { "SC",  -4, { check_num }, &gfx_t::op_set_stroke_color },
    { "SCN", -33, { check_scn }, &gfx_t::op_set_stroke_color },
    { "T*",  0, { check_none }, &gfx_t::op_text_next_line },
    { "TD",  2, { check_num, check_num }, &gfx_t::op_text_move_set },
    { "TJ",  1, { check_array }, &gfx_t::op_show_space_text },
    { "TL",  1, { check_num }, &gfx_t::op_set_text_leading },
    { "Tc",  1, { check_num }, &gfx_t::op_set_char_spacing },
    { "Td",  2, { check_num, check_num }, &gfx_t::op_text_move },
    { "Tf",  2, { check_name, check_num }, &gfx_t::op_set_font },
    { "Tj",  1, { check_string }, &gfx_t::op_show_text },
    { "Tm",  6, { check_num, check_num, check_num, check_num, check_num, check_num }, &gfx_t::op_set_text_matrix },
    { "Tr",  1, { check_int }, &gfx_t::op_set_text_render },
    { "Ts",  1, { check_num }, &gfx_t::op_set_text_rise },
    { "Tw",  1, { check_num }, &gfx_t::op_set_word_spacing },
    { "Tz",  1, { check_num }, &gfx_t::op_set_horiz_scaling },
    { "W",   0, { check_none }, &gfx_t::op_ignore },
    { "W*",  0, { check_none }, &gfx_t::op_ignore },
    { "b",   0, { check_none }, &gfx_t::op_close_fill_stroke },
    { "b*",  0, { check_none }, &gfx_t::op_close_eofill_stroke },
    { "c",   6, { check_num, check_num, check_num, check_num, check_num, check_num }, &gfx_t::op_curve_to },
    { "cm",  6, { check_num, check_num, check_num, check_num, check_num, check_num }, &gfx_t::op_concat },
    { "cs",  1, { check_name }, &gfx_t::op_set_fill_space },
    { "d",   2, { check_array, check_num }, &gfx_t::op_ignore },
    { "d0",  2, { check_num, check_num }, &gfx_t::op_ignore },
    { "d1",  6, { check_num, check_num, check_num, check_num, check_num, check_num }, &gfx_t::op_ignore },
    { "f",   0, { check_none }, &gfx_t::op_fill },
    { "f*",  0, { check_none }, &gfx_t::op_eofill },
    { "g",   1, { check_num }, &gfx_t::op_set_fill_gray },
    { "gs",  1, { check_name }, &gfx_t::op_set_ext_gstate },
    { "h",   0, { check_none }, &gfx_t::op_close_path },
    { "i",   1, { check_num }, &gfx_t::op_ignore },
    { "j",   1, { check_int }, &gfx_t::op_ignore },
    { "k",   4, { check_num, check_num, check_num, check_num }, &gfx_t::op_set_fill_cmyk },
    { "l",   2, { check_num, check_num }, &gfx_t::op_line_to },
    { "m",   2, { check_num, check_num }, &gfx_t::op_move_to },
    { "n",   0, { check_none }, &gfx_t::op_end_path },
    { "q",   0, { check_none }, &gfx_t::op_save },
    { "re",  4, { check_num, check_num, check_num, check_num }, &gfx_t::op_rectangle },
    { "rg",  3, { check_num, check_num, check_num }, &gfx_t::op_set_fill_rgb },
    { "ri",  1, { check_name }, &gfx_t::op_ignore },
    { "s",   0, { check_none }, &gfx_t::op_close_stroke },
    { "sc",  -4, { check_num }, &gfx_t::op_set_fill_color },
    { "scn", -33, { check_scn }, &gfx_t::op_set_fill_color },
    { "sh",  1, { check_name }, &gfx_t::op_ignore },
    { "v",   4, { check_num, check_num, check_num, check_num }, &gfx_t::op_curve_to1 },
    { "w",   1, { check_num }, &gfx_t::op_set_line_width },
    { "y",   4, { check_num, check_num, check_num, check_num }, &gfx_t::op_curve_to2 }
};

const gfx_t::operator_t* gfx_t::find_operator (const std::string& name) {
    const auto first = operators;
    const auto last = operators + sizeof operators / sizeof *operators;

    auto iter = std::lower_bound (
        first, last, name, [](const operator_t& lhs, const std::string& rhs) {
            return strcmp (lhs.name, rhs.c_str ()) < 0;
        });

    return iter != last && name == iter->name ? iter : 0;
}

bool gfx_t::check (const obj_t& arg, type_check_t type) {
    switch (type) {
    case check_bool:   return is< bool > (arg);
    case check_int:    return is< int > (arg);
    case check_num:    return is_number (arg);
    case check_string: return is< string_t > (arg);
    case check_name:   return is< name_t > (arg);
    case check_array:  return is< array_pointer > (arg);
    case check_props:  return is< dict_pointer > (arg) || is< name_t > (arg);
    case check_scn:    return is_number (arg) || is< name_t > (arg);
    default:
        break;
    }

    return false;
}

gfx_t::gfx_t (const document_t& doc, output_dev_t& out)
    : doc_ (doc), out_ (out) {
}

void gfx_t::run (const page_t& page) {
    run (parse_content (page.contents ()), page.resources (),
         page.page_matrix ());
}

void gfx_t::run (const ops_t& ops, const dict_pointer& resources,
                 const matrix_t& ctm) {
    states_.assign (1, gfx_state_t{ });
    states_.back ().ctm = ctm;

    resources_.assign (1, resources);

    path_ = { };
    forms_.clear ();

    for (index_ = 0; index_ < ops.size (); ++index_) {
        execute (ops [index_]);
    }

    op_ = 0;
}

void gfx_t::execute (const op_t& op) {
    auto p = find_operator (op.name);

    if (0 == p) {
        if (errors_++ < 16) {
            error (errSyntaxError, -1, "unknown operator '{}'", op.name);
        }

        return;
    }

    const obj_t* args = op.args.data ();
    int nargs = int (op.args.size ());

    if (p->nargs >= 0) {
        if (nargs < p->nargs) {
            error (errSyntaxError, -1, "too few ({}) args to '{}' operator",
                   nargs, op.name);
            return;
        }

        args += nargs - p->nargs;
        nargs = p->nargs;
    }
    else if (nargs > -p->nargs) {
        error (errSyntaxError, -1, "too many ({}) args to '{}' operator",
               nargs, op.name);
        return;
    }

    for (int i = 0; i < nargs; ++i) {
        const auto type = p->nargs < 0 ? p->check [0] : p->check [i];

        if (!check (args [i], type)) {
            error (errSyntaxError, -1,
                   "arg #{} to '{}' operator is wrong type ({})",
                   i, op.name, type_name (args [i]));
            return;
        }
    }

    op_ = &op;
    (this->*p->fun) (args, nargs);
}

//
// Graphics state operators:
//

void gfx_t::op_save (const obj_t*, int) {
    states_.push_back (state ());
}

void gfx_t::op_restore (const obj_t*, int) {
    if (states_.size () > 1) {
        states_.pop_back ();
    }
    else {
        error (errSyntaxWarning, -1, "restore without matching save");
    }
}

void gfx_t::op_concat (const obj_t* args, int) {
    using detail::num;

    const matrix_t m{
        num (args [0]), num (args [1]), num (args [2]),
        num (args [3]), num (args [4]), num (args [5])
    };

    state ().ctm = m * state ().ctm;
}

void gfx_t::op_set_line_width (const obj_t* args, int) {
    state ().line_width = detail::num (args [0]);
}

void gfx_t::op_set_ext_gstate (const obj_t* args, int) {
    const auto name = *lookup< name_t > (args [0]);
    auto dict = doc_.dict_of (lookup_resource ("ExtGState", name));

    if (!dict) {
        error (errSyntaxError, -1, "ExtGState '{}' is unknown", name);
        return;
    }

    if (auto x = doc_.get< double > (*dict, "LW")) {
        state ().line_width = *x;
    }

    if (auto x = doc_.get< double > (*dict, "ca")) {
        state ().fill_alpha = *x;
    }

    if (auto x = doc_.get< double > (*dict, "CA")) {
        state ().stroke_alpha = *x;
    }

    if (auto arr = doc_.get< array_pointer > (*dict, "Font")) {
        if ((*arr)->size () == 2) {
            auto font = doc_.dict_of ((**arr) [0]);

            auto iter = fonts_.find (font.get ());

            if (iter == fonts_.end ()) {
                iter = fonts_.emplace (
                    font.get (), font_t::load (doc_, font)).first;
            }

            state ().text.font = iter->second;
            state ().text.size = detail::num ((**arr) [1]);
        }
    }
}

//
// Color operators:
//

void gfx_t::op_set_fill_gray (const obj_t* args, int) {
    state ().fill_space = colorspace_t{ };
    state ().fill = to_rgb (state ().fill_space, { detail::num (args [0]) });
}

void gfx_t::op_set_stroke_gray (const obj_t* args, int) {
    state ().stroke_space = colorspace_t{ };
    state ().stroke = to_rgb (state ().stroke_space, { detail::num (args [0]) });
}

void gfx_t::op_set_fill_rgb (const obj_t* args, int) {
    using detail::num;

    state ().fill_space = colorspace_t{ colorspace_t::rgb, 3 };
    state ().fill = { num (args [0]), num (args [1]), num (args [2]) };
}

void gfx_t::op_set_stroke_rgb (const obj_t* args, int) {
    using detail::num;

    state ().stroke_space = colorspace_t{ colorspace_t::rgb, 3 };
    state ().stroke = { num (args [0]), num (args [1]), num (args [2]) };
}

void gfx_t::op_set_fill_cmyk (const obj_t* args, int) {
    using detail::num;

    state ().fill_space = colorspace_t{ colorspace_t::cmyk, 4 };
    state ().fill = detail::cmyk_to_rgb (
        num (args [0]), num (args [1]), num (args [2]), num (args [3]));
}

void gfx_t::op_set_stroke_cmyk (const obj_t* args, int) {
    using detail::num;

    state ().stroke_space = colorspace_t{ colorspace_t::cmyk, 4 };
    state ().stroke = detail::cmyk_to_rgb (
        num (args [0]), num (args [1]), num (args [2]), num (args [3]));
}

void gfx_t::op_set_fill_space (const obj_t* args, int) {
    state ().fill_space = lookup_colorspace (args [0]);
    state ().fill = to_rgb (state ().fill_space, { });
}

void gfx_t::op_set_stroke_space (const obj_t* args, int) {
    state ().stroke_space = lookup_colorspace (args [0]);
    state ().stroke = to_rgb (state ().stroke_space, { });
}

void gfx_t::op_set_fill_color (const obj_t* args, int nargs) {
    std::vector< double > xs;

    for (int i = 0; i < nargs; ++i) {
        if (is_number (args [i])) {
            xs.push_back (detail::num (args [i]));
        }
    }

    state ().fill = to_rgb (state ().fill_space, xs);
}

void gfx_t::op_set_stroke_color (const obj_t* args, int nargs) {
    std::vector< double > xs;

    for (int i = 0; i < nargs; ++i) {
        if (is_number (args [i])) {
            xs.push_back (detail::num (args [i]));
        }
    }

    state ().stroke = to_rgb (state ().stroke_space, xs);
}

colorspace_t gfx_t::lookup_colorspace (const obj_t& arg) const {
    obj_t obj = doc_.resolve (arg);

    if (auto p = std::get_if< name_t > (&obj)) {
        if (*p == "DeviceGray" || *p == "G" || *p == "CalGray") {
            return { colorspace_t::gray, 1 };
        }
        else if (*p == "DeviceRGB" || *p == "RGB" || *p == "CalRGB") {
            return { colorspace_t::rgb, 3 };
        }
        else if (*p == "DeviceCMYK" || *p == "CMYK") {
            return { colorspace_t::cmyk, 4 };
        }
        else if (*p == "Pattern") {
            return { colorspace_t::pattern, 1 };
        }

        obj = doc_.resolve (lookup_resource ("ColorSpace", *p));

        if (is< name_t > (obj)) {
            return lookup_colorspace (obj);
        }
    }

    auto arr = lookup< array_pointer > (obj);

    if (!arr || (*arr)->empty ()) {
        error (errSyntaxWarning, -1, "bad color space, using DeviceGray");
        return { };
    }

    const auto& xs = **arr;
    const auto family = doc_.lookup< name_t > (xs [0]).value_or (name_t ());

    if (family == "CalGray") {
        return { colorspace_t::gray, 1 };
    }
    else if (family == "CalRGB" || family == "Lab") {
        return { colorspace_t::rgb, 3 };
    }
    else if (family == "ICCBased" && xs.size () > 1) {
        auto dict = doc_.dict_of (xs [1]);
        const int n = dict ? doc_.get< int > (*dict, "N").value_or (3) : 3;

        switch (n) {
        case 1:  return { colorspace_t::gray, 1 };
        case 4:  return { colorspace_t::cmyk, 4 };
        default: return { colorspace_t::rgb, 3 };
        }
    }
    else if ((family == "Indexed" || family == "I") && xs.size () > 3) {
        const auto base = lookup_colorspace (xs [1]);

        colorspace_t space{ colorspace_t::indexed, 1 };

        space.base = base.kind == colorspace_t::indexed
            ? colorspace_t::gray : base.kind;
        space.base_components = base.components;
        space.hival = doc_.lookup< int > (xs [2]).value_or (0);

        const auto table = doc_.resolve (xs [3]);

        if (auto s = std::get_if< string_t > (&table)) {
            space.palette = *s;
        }
        else if (auto stream = std::get_if< stream_pointer > (&table)) {
            if (auto data = doc_.decode (**stream)) {
                space.palette = *data;
            }
        }

        return space;
    }
    else if (family == "Separation") {
        return { colorspace_t::separation, 1 };
    }
    else if (family == "DeviceN" && xs.size () > 1) {
        auto names = doc_.lookup< array_pointer > (xs [1]);
        return {
            colorspace_t::separation, names ? int ((*names)->size ()) : 1
        };
    }
    else if (family == "Pattern") {
        return { colorspace_t::pattern, 1 };
    }

    return lookup_colorspace (xs [0]);
}

//
// Path construction operators:
//

void gfx_t::add_point (double x, double y, bool move) {
    const auto p = transform (state ().ctm, x, y);

    if (move || path_.subpaths.empty ()) {
        path_.subpaths.emplace_back ();
        path_.closed.push_back (false);
    }

    path_.subpaths.back ().push_back (p);
    current_ = { x, y };
}

void gfx_t::op_move_to (const obj_t* args, int) {
    add_point (detail::num (args [0]), detail::num (args [1]), true);
}

void gfx_t::op_line_to (const obj_t* args, int) {
    add_point (detail::num (args [0]), detail::num (args [1]), false);
}

void gfx_t::op_curve_to (const obj_t* args, int) {
    using detail::num;

    const double x0 = current_.x, y0 = current_.y;
    const double x1 = num (args [0]), y1 = num (args [1]);
    const double x2 = num (args [2]), y2 = num (args [3]);
    const double x3 = num (args [4]), y3 = num (args [5]);

    for (int i = 1; i <= SCRUB_CURVE_SEGMENTS; ++i) {
        const double t = double (i) / SCRUB_CURVE_SEGMENTS, u = 1 - t;

        const double a = u * u * u, b = 3 * u * u * t;
        const double c = 3 * u * t * t, d = t * t * t;

        add_point (
            a * x0 + b * x1 + c * x2 + d * x3,
            a * y0 + b * y1 + c * y2 + d * y3, false);
    }
}

void gfx_t::op_curve_to1 (const obj_t* args, int) {
    const obj_t xs [] = {
        current_.x, current_.y, args [0], args [1], args [2], args [3]
    };

    op_curve_to (xs, 6);
}

void gfx_t::op_curve_to2 (const obj_t* args, int) {
    const obj_t xs [] = {
        args [0], args [1], args [2], args [3], args [2], args [3]
    };

    op_curve_to (xs, 6);
}

void gfx_t::op_close_path (const obj_t*, int) {
    if (!path_.subpaths.empty ()) {
        path_.closed.back () = true;

        const auto& first = path_.subpaths.back ().front ();
        current_ = transform (invert (state ().ctm), first);
    }
}

void gfx_t::op_rectangle (const obj_t* args, int) {
    using detail::num;

    const double x = num (args [0]), y = num (args [1]);
    const double w = num (args [2]), h = num (args [3]);

    add_point (x, y, true);
    add_point (x + w, y, false);
    add_point (x + w, y + h, false);
    add_point (x, y + h, false);

    path_.closed.back () = true;
    current_ = { x, y };
}

//
// Path painting operators:
//

void gfx_t::paint (bool fill, bool stroke, bool eo, bool close) {
    if (close && !path_.closed.empty ()) {
        path_.closed.back () = true;
    }

    if (!path_.subpaths.empty ()) {
        if (fill) {
            out_.fill_path (state (), path_, eo, index_);
        }

        if (stroke) {
            out_.stroke_path (state (), path_, index_);
        }
    }

    path_ = { };
}

void gfx_t::op_end_path (const obj_t*, int) {
    paint (false, false, false, false);
}

void gfx_t::op_stroke (const obj_t*, int) {
    paint (false, true, false, false);
}

void gfx_t::op_close_stroke (const obj_t*, int) {
    paint (false, true, false, true);
}

void gfx_t::op_fill (const obj_t*, int) {
    paint (true, false, false, false);
}

void gfx_t::op_eofill (const obj_t*, int) {
    paint (true, false, true, false);
}

void gfx_t::op_fill_stroke (const obj_t*, int) {
    paint (true, true, false, false);
}

void gfx_t::op_eofill_stroke (const obj_t*, int) {
    paint (true, true, true, false);
}

void gfx_t::op_close_fill_stroke (const obj_t*, int) {
    paint (true, true, false, true);
}

void gfx_t::op_close_eofill_stroke (const obj_t*, int) {
    paint (true, true, true, true);
}

//
// Text operators:
//

void gfx_t::op_begin_text (const obj_t*, int) {
    state ().text.tm = state ().text.tlm = matrix_t{ };
}

void gfx_t::op_end_text (const obj_t*, int) { }

void gfx_t::op_set_char_spacing (const obj_t* args, int) {
    state ().text.char_space = detail::num (args [0]);
}

void gfx_t::op_set_word_spacing (const obj_t* args, int) {
    state ().text.word_space = detail::num (args [0]);
}

void gfx_t::op_set_horiz_scaling (const obj_t* args, int) {
    state ().text.scale = detail::num (args [0]) / 100;
}

void gfx_t::op_set_text_leading (const obj_t* args, int) {
    state ().text.leading = detail::num (args [0]);
}

void gfx_t::op_set_font (const obj_t* args, int) {
    state ().text.font = lookup_font (*lookup< name_t > (args [0]));
    state ().text.size = detail::num (args [1]);
}

void gfx_t::op_set_text_render (const obj_t* args, int) {
    state ().text.render = *lookup< int > (args [0]);
}

void gfx_t::op_set_text_rise (const obj_t* args, int) {
    state ().text.rise = detail::num (args [0]);
}

void gfx_t::op_text_move (const obj_t* args, int) {
    auto& text = state ().text;

    text.tlm = translate (
        detail::num (args [0]), detail::num (args [1])) * text.tlm;
    text.tm = text.tlm;
}

void gfx_t::op_text_move_set (const obj_t* args, int nargs) {
    state ().text.leading = -detail::num (args [1]);
    op_text_move (args, nargs);
}

void gfx_t::op_set_text_matrix (const obj_t* args, int) {
    using detail::num;

    auto& text = state ().text;

    text.tm = text.tlm = {
        num (args [0]), num (args [1]), num (args [2]),
        num (args [3]), num (args [4]), num (args [5])
    };
}

void gfx_t::op_text_next_line (const obj_t*, int) {
    auto& text = state ().text;

    text.tlm = translate (0, -text.leading) * text.tlm;
    text.tm = text.tlm;
}

void gfx_t::op_show_text (const obj_t* args, int) {
    show_text (*lookup< string_t > (args [0]), 0);
}

void gfx_t::op_move_show_text (const obj_t* args, int nargs) {
    op_text_next_line (args, nargs);
    op_show_text (args, nargs);
}

void gfx_t::op_move_set_show_text (const obj_t* args, int) {
    state ().text.word_space = detail::num (args [0]);
    state ().text.char_space = detail::num (args [1]);

    op_text_next_line (args, 0);
    op_show_text (args + 2, 1);
}

void gfx_t::op_show_space_text (const obj_t* args, int) {
    const auto& arr = **lookup< array_pointer > (args [0]);

    for (size_t i = 0; i < arr.size (); ++i) {
        if (auto s = lookup< string_t > (arr [i])) {
            show_text (*s, i);
        }
        else if (is_number (arr [i])) {
            auto& text = state ().text;

            const double tx =
                -detail::num (arr [i]) / 1000 * text.size * text.scale;

            text.tm = translate (tx, 0) * text.tm;
        }
        else {
            error (errSyntaxError, -1, "element of show/space array must be "
                   "number or string");
        }
    }
}

void gfx_t::show_text (const std::string& s, size_t elem) {
    auto& text = state ().text;

    if (!text.font) {
        error (errSyntaxError, -1, "no font in show");
        text.font = lookup_font ({ });
    }

    const auto& font = *text.font;

    size_t pos = 0;

    for (const auto& glyph : font.decode (s)) {
        const matrix_t trm = matrix_t{
            text.size * text.scale, 0, 0, text.size, 0, text.rise
        } * text.tm * state ().ctm;

        const auto box = transform (
            trm, bbox_t{ 0, font.descent (), glyph.width, font.ascent () });

        out_.draw_glyph (state (), glyph, trm, box, { index_, elem, pos });

        const double tx = (
            glyph.width * text.size + text.char_space +
            (glyph.space ? text.word_space : 0)) * text.scale;

        text.tm = translate (tx, 0) * text.tm;
        pos += glyph.bytes.size ();
    }
}

font_pointer gfx_t::lookup_font (const std::string& name) {
    dict_pointer dict;

    if (!name.empty ()) {
        dict = doc_.dict_of (lookup_resource ("Font", name));

        if (!dict) {
            error (errSyntaxError, -1, "unknown font '{}'", name);
        }
    }

    auto iter = fonts_.find (dict.get ());

    if (iter == fonts_.end ()) {
        iter = fonts_.emplace (dict.get (), font_t::load (doc_, dict)).first;
    }

    return iter->second;
}

//
// XObject operators:
//

void gfx_t::op_xobject (const obj_t* args, int) {
    const auto name = *lookup< name_t > (args [0]);
    const auto obj = doc_.resolve (lookup_resource ("XObject", name));

    auto stream = lookup< stream_pointer > (obj);

    if (!stream) {
        error (errSyntaxError, -1, "XObject '{}' is unknown", name);
        return;
    }

    const auto& dict = (*stream)->dict;
    const auto subtype = doc_.get< name_t > (dict, "Subtype").value_or (
        name_t ());

    if (subtype == "Image") {
        draw_image (**stream);
    }
    else if (subtype == "Form") {
        draw_form (name, *stream);
    }
    else if (subtype != "PS") {
        error (errSyntaxError, -1, "XObject subtype '{}' is unknown", subtype);
    }
}

void gfx_t::op_inline_image (const obj_t* args, int) {
    stream_t stream;

    stream.dict = expand_inline_image (**lookup< dict_pointer > (args [0]));
    stream.data = op_->data;

    draw_image (stream);
}

void gfx_t::draw_image (const stream_t& stream) {
    const auto& dict = stream.dict;

    image_t image;

    image.width = doc_.get< int > (dict, "Width").value_or (0);
    image.height = doc_.get< int > (dict, "Height").value_or (0);
    image.bpc = doc_.get< int > (dict, "BitsPerComponent").value_or (8);
    image.mask = doc_.get< bool > (dict, "ImageMask").value_or (false);

    if (image.width <= 0 || image.height <= 0) {
        error (errSyntaxError, -1, "invalid image size");
        return;
    }

    if (image.mask) {
        image.bpc = 1;

        if (auto arr = doc_.get< array_pointer > (dict, "Decode")) {
            image.inverted = !(*arr)->empty () &&
                doc_.lookup< double > ((**arr) [0]).value_or (0) == 1;
        }
    }
    else if (auto p = dict.find ("ColorSpace")) {
        image.space = lookup_colorspace (*p);
    }
    else if (doc_.get< name_t > (dict, "Filter").value_or (name_t ()) ==
             "JPXDecode") {
        image.space = colorspace_t{ colorspace_t::rgb, 3 };
    }

    image.matrix = state ().ctm;

    if (out_.need_image_data ()) {
        auto data = doc_.decode (stream, &image.filter);

        if (!data) {
            error (errSyntaxWarning, -1, "undecodable image data");
            return;
        }

        image.data = std::move (*data);
    }

    out_.draw_image (
        state (), image, transform (state ().ctm, bbox_t{ 0, 0, 1, 1 }),
        index_);
}

void gfx_t::draw_form (const std::string& name, const stream_pointer& stream) {
    const auto& dict = stream->dict;

    matrix_t m;

    if (auto arr = doc_.get< array_pointer > (dict, "Matrix")) {
        if ((*arr)->size () == 6) {
            const auto& xs = **arr;

            m = {
                doc_.lookup< double > (xs [0]).value_or (1),
                doc_.lookup< double > (xs [1]).value_or (0),
                doc_.lookup< double > (xs [2]).value_or (0),
                doc_.lookup< double > (xs [3]).value_or (1),
                doc_.lookup< double > (xs [4]).value_or (0),
                doc_.lookup< double > (xs [5]).value_or (0)
            };
        }
    }

    bbox_t box{ 0, 0, 0, 0 };

    if (auto arr = doc_.get< array_pointer > (dict, "BBox")) {
        if ((*arr)->size () == 4) {
            for (size_t i = 0; i < 4; ++i) {
                box.arr [i] = doc_.lookup< double > ((**arr) [i]).value_or (0);
            }
        }
    }

    const auto ctm = m * state ().ctm;

    if (!out_.inline_forms ()) {
        out_.draw_form (
            state (), name, stream, transform (ctm, normalize (box)), index_);
        return;
    }

    if (forms_.size () >= SCRUB_MAX_FORM_DEPTH || forms_.count (stream.get ())) {
        error (errSyntaxError, -1, "form XObject '{}' nested too deep", name);
        return;
    }

    const auto data = doc_.decode (*stream);

    if (!data) {
        error (errSyntaxError, -1, "undecodable form XObject '{}'", name);
        return;
    }

    const auto ops = parse_content (*data);

    const auto depth = states_.size ();

    forms_.insert (stream.get ());
    states_.push_back (state ());
    state ().ctm = ctm;

    auto resources = doc_.dict_of (
        dict.has ("Resources") ? dict.at ("Resources") : obj_t{ });

    resources_.push_back (resources ? resources : resources_.back ());

    const auto save_op = op_;
    const auto save_index = index_;
    auto save_path = std::move (path_);

    path_ = { };

    for (index_ = 0; index_ < ops.size (); ++index_) {
        execute (ops [index_]);
    }

    op_ = save_op;
    index_ = save_index;
    path_ = std::move (save_path);

    resources_.pop_back ();

    //
    // Unbalanced saves in the form end with it:
    //
    states_.resize (depth);

    forms_.erase (stream.get ());
}

void gfx_t::op_ignore (const obj_t*, int) { }

obj_t gfx_t::lookup_resource (const char* category, const std::string& name) const {
    for (auto iter = resources_.rbegin (); iter != resources_.rend (); ++iter) {
        if (!*iter) {
            continue;
        }

        if (auto dict = doc_.dict_of (
                (*iter)->has (category) ? (*iter)->at (category) : obj_t{ })) {
            if (auto p = dict->find (name)) {
                return *p;
            }
        }
    }

    return null_t{ };
}

} // namespace scrub
