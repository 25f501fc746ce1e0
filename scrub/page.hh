// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_PAGE_HH
#define SCRUB_SCRUB_PAGE_HH

#include <defs.hh>

#include <string>

#include <scrub/ast.hh>
#include <scrub/bbox.hh>
#include <scrub/document.hh>
#include <scrub/matrix.hh>

namespace scrub {

//
// View of a leaf of the page tree. Edits go straight into the document
// objects:
//
struct page_t {
    page_t (document_t&, const page_ref_t&);

    const ref_t& ref () const { return ref_.ref; }

    dict_t& dict () { return *ref_.dict; }
    const dict_t& dict () const { return *ref_.dict; }

    //
    // Entry of the page or of the nearest ancestor carrying it, resolved:
    //
    obj_t inherited (const std::string&) const;

    //
    // Boxes in default user space, normalized; the crop box is clipped to
    // the media box:
    //
    bbox_t media_box () const;
    bbox_t crop_box () const;

    rotation_t rotation () const;

    //
    // The page in page space: (0, 0, crop box width, crop box height):
    //
    bbox_t bounds () const;

    //
    // Default user space to page space, and back:
    //
    matrix_t page_matrix () const;
    matrix_t user_matrix () const { return invert (page_matrix ()); }

    //
    // Page space to displayed space, the page as shown after its rotation,
    // and the page in displayed space:
    //
    matrix_t display_matrix () const;
    bbox_t display_bounds () const;

    dict_pointer resources () const;

    //
    // Make the page carry its own resources dictionary, shallow copy of the
    // inherited one, and return it:
    //
    dict_pointer own_resources ();

    //
    // The content streams, decoded and concatenated; undecodable parts are
    // left out with a warning:
    //
    std::string contents () const;
    void set_contents (const std::string&);

    //
    // The resolved /Annots array, null if there is none:
    //
    array_pointer annots () const;

    document_t& doc () { return doc_; }
    const document_t& doc () const { return doc_; }

private:
    document_t& doc_;
    page_ref_t ref_;
};

} // namespace scrub

#endif // SCRUB_SCRUB_PAGE_HH
