// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_ENGINE_HH
#define SCRUB_SCRUB_ENGINE_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <scrub/bbox.hh>
#include <scrub/document.hh>
#include <scrub/gfx.hh>
#include <scrub/page.hh>
#include <scrub/redactor.hh>
#include <scrub/text.hh>
#include <splash/bitmap.hh>

namespace scrub {

//
// Page level operations over an open document. Pages are numbered from 1;
// rectangles are in page space unless stated otherwise. An invalid page
// number throws std::out_of_range:
//
struct engine_t {
    //
    // Throws document_error:
    //
    static engine_t open (const fs::path&, bool allow_encrypted = false);

    explicit engine_t (document_t);

    int page_count () const { return int (pages_.size ()); }

    page_t page (int);

    //
    // Text of the page, in displayed space:
    //
    text_page_t text_layout (int);
    std::string plain_text (int);

    //
    // Case-insensitive search of the page text, displayed space:
    //
    std::vector< bbox_t > search (int, const std::string&);

    bitmap_t render (int, double dpi);

    //
    // Mark a region for redaction with a /Redact annotation:
    //
    void add_redaction (int, const bbox_t&, const color_t&);

    //
    // Apply and remove the /Redact annotations of the page:
    //
    redaction_stats_t commit_redactions (int, bool remove_images);

    //
    // Translucent /Highlight annotation over the region:
    //
    void add_highlight (int, const bbox_t&, const color_t&, double opacity);

    //
    // Replace the page content with the bitmap, stretched over the crop
    // box; resources and annotations of the page are dropped:
    //
    void rasterize_page (int, const bitmap_t&);

    void save (const fs::path&, const save_options_t& = { }) const;

    //
    // Font used to render text in fonts without an embedded program:
    //
    void font_file (const std::string& s) { font_file_ = s; }

    document_t& doc () { return doc_; }
    const document_t& doc () const { return doc_; }

private:
    const page_ref_t& page_ref (int) const;

    document_t doc_;
    std::vector< page_ref_t > pages_;
    std::string font_file_;
};

} // namespace scrub

#endif // SCRUB_SCRUB_ENGINE_HH
