// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_REDACTOR_HH
#define SCRUB_SCRUB_REDACTOR_HH

#include <defs.hh>

#include <cstddef>
#include <vector>

#include <scrub/ast.hh>
#include <scrub/bbox.hh>
#include <scrub/content.hh>
#include <scrub/gfx.hh>

namespace scrub {

struct document_t;
struct page_t;

//
// Region to clear, in page space, and the color it is painted with:
//
struct redaction_t {
    bbox_t rect;
    color_t fill;
};

struct redaction_stats_t {
    size_t glyphs = 0, paths = 0, images = 0, forms = 0;

    size_t total () const { return glyphs + paths + images + forms; }
};

redaction_stats_t& operator+= (redaction_stats_t&, const redaction_stats_t&);

//
// Remove from the operations everything drawn inside the rectangles (device
// space of `ctm'). Form XObjects drawn inside are replaced by redacted
// copies; the XObject dictionary of `resources' is rebuilt without the
// removed images and the replaced forms:
//
redaction_stats_t
redact_content (document_t&, ops_t&, const dict_pointer& resources,
                const matrix_t& ctm, const std::vector< bbox_t >&,
                bool remove_images);

//
// Redact the page content and paint the regions over it:
//
redaction_stats_t
redact_page (page_t&, const std::vector< redaction_t >&, bool remove_images);

} // namespace scrub

#endif // SCRUB_SCRUB_REDACTOR_HH
