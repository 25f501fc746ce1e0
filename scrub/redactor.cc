// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>
#include <map>
#include <set>
#include <tuple>

#include <fmt/format.h>
using fmt::format;

#include <scrub/document.hh>
#include <scrub/error.hh>
#include <scrub/page.hh>
#include <scrub/redactor.hh>
#include <scrub/writer.hh>

//
// Nesting limit of the redacted form XObjects:
//
#define SCRUB_MAX_REDACT_DEPTH 16

namespace scrub {
namespace detail {

//
// Boxes without area, e.g., the box of a blank glyph or of a horizontal
// line, hit with their center:
//
static bool hit (const std::vector< bbox_t >& rects, const bbox_t& box) {
    for (const auto& rect : rects) {
        if (empty (box)) {
            const point_t center{
                (box.arr [0] + box.arr [2]) / 2,
                (box.arr [1] + box.arr [3]) / 2
            };

            if (rect.arr [0] <= center.x && center.x <= rect.arr [2] &&
                rect.arr [1] <= center.y && center.y <= rect.arr [3]) {
                return true;
            }
        }
        else if (overlapping (box, rect)) {
            return true;
        }
    }

    return false;
}

static matrix_t matrix_of (const document_t& doc, const dict_t& dict) {
    auto arr = doc.get< array_pointer > (dict, "Matrix");

    if (!arr || (*arr)->size () != 6) {
        return { };
    }

    double m [6];

    for (size_t i = 0; i < 6; ++i) {
        m [i] = doc.lookup< double > ((**arr) [i]).value_or (i == 0 || i == 3);
    }

    return { m [0], m [1], m [2], m [3], m [4], m [5] };
}

//
// A glyph to remove from a string and the displacement, in thousandths of
// text space units, that keeps the following glyphs in place:
//
struct removed_glyph_t {
    size_t pos, len;
    double adjust;
};

struct form_hit_t {
    std::string name;
    stream_pointer stream;
    matrix_t ctm;
};

struct redaction_dev_t : output_dev_t {
    redaction_dev_t (const std::vector< bbox_t >& rects, bool images)
        : rects (rects), images (images) { }

    bool inline_forms () const override { return false; }

    void draw_glyph (const gfx_state_t& state, const glyph_t& glyph,
                     const matrix_t&, const bbox_t& box,
                     const glyph_location_t& loc) override {
        if (!hit (rects, box)) {
            return;
        }

        const auto& text = state.text;

        const double tx = glyph.width * text.size + text.char_space +
            (glyph.space ? text.word_space : 0);

        glyphs [loc.op][loc.elem].push_back ({
            loc.pos, glyph.bytes.size (),
            text.size ? -tx / text.size * 1000 : 0. });
    }

    void fill_path (const gfx_state_t&, const path_t& path, bool,
                    size_t op) override {
        if (hit (rects, bbox_of (path))) {
            paths.insert (op);
        }
    }

    void stroke_path (const gfx_state_t& state, const path_t& path,
                      size_t op) override {
        const auto d = state.line_width * norm (state.ctm) / 2;

        auto box = bbox_of (path);

        box.arr [0] -= d;
        box.arr [1] -= d;
        box.arr [2] += d;
        box.arr [3] += d;

        if (hit (rects, box)) {
            paths.insert (op);
        }
    }

    void draw_image (const gfx_state_t&, const image_t&, const bbox_t& box,
                     size_t op) override {
        if (images && hit (rects, box)) {
            removed_images.insert (op);
        }
    }

    void draw_form (const gfx_state_t& state, const std::string& name,
                    const stream_pointer& stream, const bbox_t& box,
                    size_t op) override {
        if (hit (rects, box)) {
            forms [op] = { name, stream, state.ctm };
        }
    }

    const std::vector< bbox_t >& rects;
    bool images;

    std::map< size_t, std::map< size_t, std::vector< removed_glyph_t > > >
    glyphs;

    std::set< size_t > paths, removed_images;
    std::map< size_t, form_hit_t > forms;
};

static void push_number (array_t& arr, double x) {
    if (!arr.empty () && is_number (arr.back ())) {
        arr.back () = lookup< double > (arr.back ()).value_or (0) + x;
    }
    else {
        arr.push_back (x);
    }
}

//
// Split a string around the removed glyphs into strings and displacements:
//
static void
split_string (array_t& arr, const string_t& s,
              std::vector< removed_glyph_t > removed) {
    std::sort (removed.begin (), removed.end (), [](auto& lhs, auto& rhs) {
        return lhs.pos < rhs.pos;
    });

    size_t pos = 0;

    auto push_run = [&](size_t end) {
        if (end > pos) {
            string_t run (s.substr (pos, end - pos));
            run.hex = s.hex;

            arr.push_back (std::move (run));
        }
    };

    for (const auto& glyph : removed) {
        push_run (glyph.pos);
        push_number (arr, glyph.adjust);

        pos = glyph.pos + glyph.len;
    }

    push_run (s.size ());
}

static size_t
rewrite_text (ops_t& out, const op_t& op,
              const std::map< size_t, std::vector< removed_glyph_t > >& elems) {
    size_t n = 0;

    for (const auto& [elem, glyphs] : elems) {
        n += glyphs.size ();
    }

    auto arr = make< array_t > ();

    if (op.name == "TJ") {
        const auto& src = **lookup< array_pointer > (op.args.back ());

        for (size_t i = 0; i < src.size (); ++i) {
            auto iter = elems.find (i);

            if (iter != elems.end () && is< string_t > (src [i])) {
                split_string (*arr, std::get< string_t > (src [i]), iter->second);
            }
            else if (is_number (src [i])) {
                push_number (*arr, lookup< double > (src [i]).value_or (0));
            }
            else {
                arr->push_back (src [i]);
            }
        }
    }
    else {
        const auto& s = std::get< string_t > (op.args.back ());
        split_string (*arr, s, elems.begin ()->second);

        if (op.name == "'") {
            out.push_back ({ "T*", { }, { } });
        }
        else if (op.name == "\"") {
            const auto& args = op.args;
            const auto i = args.size () - 3;

            out.push_back ({ "Tw", { args [i] }, { } });
            out.push_back ({ "Tc", { args [i + 1] }, { } });
            out.push_back ({ "T*", { }, { } });
        }
    }

    out.push_back ({ "TJ", { arr }, { } });

    return n;
}

static bool is_drawn (const ops_t& ops, const std::string& name) {
    return std::any_of (ops.begin (), ops.end (), [&](const op_t& op) {
        return op.name == "Do" && !op.args.empty () &&
            is_name (op.args.back (), name.c_str ());
    });
}

//
// Rebuilds the local XObject dictionary of the resources: the removed and
// the redacted XObjects stay only if a surviving operator still draws them,
// the redacted clones are added:
//
static void
prune_xobjects (const document_t& doc, dict_t& resources, const ops_t& ops,
                const std::set< std::string >& dropped,
                const std::map< std::string, obj_t >& clones) {
    auto xobjects = make< dict_t > ();

    if (auto p = resources.find ("XObject")) {
        if (auto dict = doc.dict_of (*p)) {
            for (const auto& [key, value] : *dict) {
                if (clones.count (key) ||
                    (dropped.count (key) && !is_drawn (ops, key))) {
                    continue;
                }

                xobjects->emplace_back (key, value);
            }
        }
    }

    for (const auto& [key, value] : clones) {
        xobjects->emplace (key, value);
    }

    resources.emplace ("XObject", xobjects);
}

static redaction_stats_t
redact (document_t& doc, ops_t& ops, const dict_pointer& resources,
        const matrix_t& ctm, const std::vector< bbox_t >& rects,
        bool remove_images, int depth) {
    redaction_stats_t stats;

    redaction_dev_t dev (rects, remove_images);

    {
        gfx_t gfx (doc, dev);
        gfx.run (ops, resources, ctm);
    }

    //
    // Names of the removed or redacted XObjects, and the redacted form
    // clones by the name they replace:
    //
    std::set< std::string > dropped;
    std::map< std::string, obj_t > clones;

    std::vector< std::tuple< std::string, std::string > > renames;

    dict_pointer xobjects;

    if (auto p = resources->find ("XObject")) {
        xobjects = doc.dict_of (*p);
    }

    ops_t out;
    out.reserve (ops.size ());

    for (size_t i = 0; i < ops.size (); ++i) {
        auto& op = ops [i];

        if (dev.paths.count (i)) {
            out.push_back ({ "n", { }, { } });
            ++stats.paths;
            continue;
        }

        if (dev.removed_images.count (i)) {
            if (op.name == "Do" && !op.args.empty ()) {
                if (auto p = std::get_if< name_t > (&op.args.back ())) {
                    dropped.insert (*p);
                }
            }

            ++stats.images;
            continue;
        }

        if (dev.glyphs.count (i)) {
            stats.glyphs += rewrite_text (out, op, dev.glyphs [i]);
            continue;
        }

        auto iter = dev.forms.find (i);

        if (iter == dev.forms.end ()) {
            out.push_back (std::move (op));
            continue;
        }

        const auto& [name, stream, form_ctm] = iter->second;

        if (depth >= SCRUB_MAX_REDACT_DEPTH) {
            error (errSyntaxError, -1,
                   "form XObject '{}' nested too deep, removed", name);
            dropped.insert (name);
            ++stats.forms;
            continue;
        }

        const auto data = doc.decode (*stream);

        if (!data) {
            error (errSyntaxError, -1,
                   "undecodable form XObject '{}', removed", name);
            dropped.insert (name);
            ++stats.forms;
            continue;
        }

        auto form_ops = parse_content (*data);

        dict_pointer form_resources;

        if (auto p = stream->dict.find ("Resources")) {
            if (auto dict = doc.dict_of (*p)) {
                form_resources = make< dict_t > (*dict);
            }
        }

        if (!form_resources) {
            form_resources = make< dict_t > (*resources);
        }

        const auto sub = redact (
            doc, form_ops, form_resources,
            matrix_of (doc, stream->dict) * form_ctm, rects, remove_images,
            depth + 1);

        if (0 == sub.total ()) {
            out.push_back (std::move (op));
            continue;
        }

        stats += sub;
        ++stats.forms;

        //
        // A form is redacted once per placement, each clone under a new name:
        //
        auto clone = make< stream_t > ();

        clone->dict = stream->dict;
        clone->dict.erase ("Filter");
        clone->dict.erase ("DecodeParms");
        clone->dict.emplace ("Resources", form_resources);
        clone->data = serialize_content (form_ops);

        std::string other;

        for (int n = 1; ; ++n) {
            other = format ("{}R{}", name, n);

            if (!clones.count (other) && !(xobjects && xobjects->has (other))) {
                break;
            }
        }

        clones.emplace (other, doc.add (clone));
        renames.emplace_back (name, other);

        dropped.insert (name);

        op.args.back () = name_t (other);
        out.push_back (std::move (op));
    }

    //
    // The first clone takes over the original name when no surviving
    // operator draws the original:
    //
    for (const auto& [name, other] : renames) {
        if (clones.count (name) || is_drawn (out, name)) {
            continue;
        }

        clones.emplace (name, clones [other]);
        clones.erase (other);

        for (auto& op : out) {
            if (op.name == "Do" && !op.args.empty () &&
                is_name (op.args.back (), other.c_str ())) {
                op.args.back () = name_t (name);
            }
        }
    }

    if (!dropped.empty () || !clones.empty ()) {
        prune_xobjects (doc, *resources, out, dropped, clones);
    }

    ops = std::move (out);

    return stats;
}

} // namespace detail

redaction_stats_t&
operator+= (redaction_stats_t& lhs, const redaction_stats_t& rhs) {
    lhs.glyphs += rhs.glyphs;
    lhs.paths  += rhs.paths;
    lhs.images += rhs.images;
    lhs.forms  += rhs.forms;
    return lhs;
}

redaction_stats_t
redact_content (document_t& doc, ops_t& ops, const dict_pointer& resources,
                const matrix_t& ctm, const std::vector< bbox_t >& rects,
                bool remove_images) {
    return detail::redact (doc, ops, resources, ctm, rects, remove_images, 0);
}

redaction_stats_t
redact_page (page_t& page, const std::vector< redaction_t >& redactions,
             bool remove_images) {
    std::vector< bbox_t > rects;

    for (const auto& redaction : redactions) {
        rects.push_back (redaction.rect);
    }

    auto ops = parse_content (page.contents ());

    const auto stats = redact_content (
        page.doc (), ops, page.own_resources (), page.page_matrix (), rects,
        remove_images);

    //
    // Saves left open by the content are closed before the fills:
    //
    int depth = 0;

    for (const auto& op : ops) {
        if (op.name == "q") {
            ++depth;
        }
        else if (op.name == "Q" && depth > 0) {
            --depth;
        }
    }

    std::string buf = "q\n";

    buf += serialize_content (ops);

    for (; depth > 0; --depth) {
        buf += "Q\n";
    }

    buf += "Q\n";

    const auto m = page.user_matrix ();

    for (const auto& redaction : redactions) {
        const auto box = normalize (transform (m, redaction.rect));
        const auto& c = redaction.fill;

        buf += format (
            "q {} {} {} rg {} {} {} {} re f Q\n",
            format_number (c.r), format_number (c.g), format_number (c.b),
            format_number (box.arr [0]), format_number (box.arr [1]),
            format_number (width_of (box)), format_number (height_of (box)));
    }

    page.set_contents (buf);

    error (errInfo, -1,
           "page {}: removed {} glyphs, {} paths, {} images, {} forms",
           page.ref ().num, stats.glyphs, stats.paths, stats.images,
           stats.forms);

    return stats;
}

} // namespace scrub
