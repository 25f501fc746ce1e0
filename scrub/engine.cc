// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
using fmt::format;

#include <scrub/content.hh>
#include <scrub/engine.hh>
#include <scrub/error.hh>
#include <scrub/render.hh>
#include <scrub/writer.hh>

namespace scrub {
namespace detail {

static obj_t make_color (const color_t& c) {
    return make< array_t > (array_t{ c.r, c.g, c.b });
}

static color_t color_of (const document_t& doc, const dict_t& dict,
                         const char* key) {
    color_t c;

    auto arr = doc.get< array_pointer > (dict, key);

    if (arr && (*arr)->size () == 3) {
        c.r = doc.lookup< double > ((**arr) [0]).value_or (0);
        c.g = doc.lookup< double > ((**arr) [1]).value_or (0);
        c.b = doc.lookup< double > ((**arr) [2]).value_or (0);
    }

    return c;
}

static bbox_t rect_of (const document_t& doc, const dict_t& dict) {
    bbox_t box{ 0, 0, 0, 0 };

    auto arr = doc.get< array_pointer > (dict, "Rect");

    if (arr && (*arr)->size () == 4) {
        for (size_t i = 0; i < 4; ++i) {
            box.arr [i] = doc.lookup< double > ((**arr) [i]).value_or (0);
        }
    }

    return normalize (box);
}

static void append_annot (page_t& page, const ref_t& ref) {
    if (auto annots = page.annots ()) {
        annots->push_back (ref);
    }
    else {
        page.dict ().emplace ("Annots", make< array_t > (array_t{ ref }));
    }
}

} // namespace detail

engine_t engine_t::open (const fs::path& path, bool allow_encrypted) {
    return engine_t (document_t::open (path, allow_encrypted));
}

engine_t::engine_t (document_t doc)
    : doc_ (std::move (doc)), pages_ (doc_.pages ()) { }

const page_ref_t& engine_t::page_ref (int n) const {
    if (n < 1 || n > page_count ()) {
        throw std::out_of_range (
            format ("page {} out of range [1, {}]", n, page_count ()));
    }

    return pages_ [n - 1];
}

page_t engine_t::page (int n) {
    return page_t (doc_, page_ref (n));
}

text_page_t engine_t::text_layout (int n) {
    const auto page = this->page (n);

    text_dev_t dev;

    gfx_t gfx (doc_, dev);
    gfx.run (parse_content (page.contents ()), page.resources (),
             page.page_matrix () * page.display_matrix ());

    return dev.take ();
}

std::string engine_t::plain_text (int n) {
    return text_layout (n).plain_text ();
}

std::vector< bbox_t > engine_t::search (int n, const std::string& s) {
    return text_layout (n).search (s);
}

bitmap_t engine_t::render (int n, double dpi) {
    return render_page (page (n), dpi, font_file_);
}

void engine_t::add_redaction (int n, const bbox_t& rect, const color_t& fill) {
    auto page = this->page (n);

    const auto box = normalize (transform (page.user_matrix (), rect));

    auto annot = make< dict_t > ();

    annot->emplace ("Type", name_t ("Annot"));
    annot->emplace ("Subtype", name_t ("Redact"));
    annot->emplace ("Rect", make_rect (
        box.arr [0], box.arr [1], box.arr [2], box.arr [3]));
    annot->emplace ("IC", detail::make_color (fill));
    annot->emplace ("P", page.ref ());

    detail::append_annot (page, doc_.add (annot));
}

redaction_stats_t engine_t::commit_redactions (int n, bool remove_images) {
    auto page = this->page (n);

    auto annots = page.annots ();

    if (!annots) {
        return { };
    }

    std::vector< redaction_t > redactions;

    for (size_t i = annots->size (); i > 0; --i) {
        const auto dict = doc_.dict_of ((*annots) [i - 1]);

        if (!dict || doc_.get< name_t > (*dict, "Subtype").value_or (
                name_t ()) != "Redact") {
            continue;
        }

        const auto rect = normalize (transform (
            page.page_matrix (), detail::rect_of (doc_, *dict)));

        redactions.push_back ({ rect, detail::color_of (doc_, *dict, "IC") });

        annots->erase (annots->begin () + (i - 1));
    }

    if (annots->empty ()) {
        page.dict ().erase ("Annots");
    }

    if (redactions.empty ()) {
        return { };
    }

    //
    // Annotations were collected from the back:
    //
    std::reverse (redactions.begin (), redactions.end ());

    return redact_page (page, redactions, remove_images);
}

void engine_t::add_highlight (
    int n, const bbox_t& rect, const color_t& color, double opacity) {
    auto page = this->page (n);

    const auto box = normalize (transform (page.user_matrix (), rect));
    const auto& [x0, y0, x1, y1] = box.arr;

    //
    // Appearance stream, so that viewers need not synthesize one:
    //
    auto gs = make< dict_t > ();

    gs->emplace ("Type", name_t ("ExtGState"));
    gs->emplace ("ca", opacity);
    gs->emplace ("CA", opacity);
    gs->emplace ("BM", name_t ("Multiply"));

    auto resources = make< dict_t > ();
    resources->emplace ("ExtGState", make< dict_t > (dict_t{ { "GS0", gs } }));

    auto ap = make< stream_t > ();

    ap->dict.emplace ("Type", name_t ("XObject"));
    ap->dict.emplace ("Subtype", name_t ("Form"));
    ap->dict.emplace ("BBox", make_rect (x0, y0, x1, y1));
    ap->dict.emplace ("Resources", resources);

    ap->data = format (
        "/GS0 gs {} {} {} rg {} {} {} {} re f\n",
        format_number (color.r), format_number (color.g),
        format_number (color.b), format_number (x0), format_number (y0),
        format_number (x1 - x0), format_number (y1 - y0));

    auto annot = make< dict_t > ();

    annot->emplace ("Type", name_t ("Annot"));
    annot->emplace ("Subtype", name_t ("Highlight"));
    annot->emplace ("Rect", make_rect (x0, y0, x1, y1));
    annot->emplace ("QuadPoints", make< array_t > (
        array_t{ x0, y1, x1, y1, x0, y0, x1, y0 }));
    annot->emplace ("C", detail::make_color (color));
    annot->emplace ("CA", opacity);
    annot->emplace ("P", page.ref ());
    annot->emplace ("AP", make< dict_t > (dict_t{ { "N", doc_.add (ap) } }));

    detail::append_annot (page, doc_.add (annot));
}

void engine_t::rasterize_page (int n, const bitmap_t& bitmap) {
    auto page = this->page (n);

    auto image = make< stream_t > ();

    image->dict.emplace ("Type", name_t ("XObject"));
    image->dict.emplace ("Subtype", name_t ("Image"));
    image->dict.emplace ("Width", bitmap.width ());
    image->dict.emplace ("Height", bitmap.height ());
    image->dict.emplace ("ColorSpace", name_t ("DeviceRGB"));
    image->dict.emplace ("BitsPerComponent", 8);

    image->data = bitmap.data ();

    auto xobjects = make< dict_t > ();
    xobjects->emplace ("Im0", doc_.add (image));

    auto resources = make< dict_t > ();
    resources->emplace ("XObject", xobjects);

    const auto box = page.crop_box ();

    page.dict ().emplace ("Resources", resources);
    page.dict ().erase ("Annots");

    page.set_contents (format (
        "q {} 0 0 {} {} {} cm /Im0 Do Q\n",
        format_number (width_of (box)), format_number (height_of (box)),
        format_number (box.arr [0]), format_number (box.arr [1])));
}

void engine_t::save (const fs::path& path, const save_options_t& opts) const {
    doc_.save (path, opts);
}

} // namespace scrub
