// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <optional>
#include <vector>

#include <scrub/error.hh>
#include <scrub/page.hh>

namespace scrub {
namespace detail {

static std::optional< bbox_t >
box_of (const document_t& doc, const obj_t& obj) {
    auto arr = doc.lookup< array_pointer > (obj);

    if (!arr || (*arr)->size () != 4) {
        return { };
    }

    bbox_t box;

    for (size_t i = 0; i < 4; ++i) {
        auto x = doc.lookup< double > ((**arr) [i]);

        if (!x) {
            return { };
        }

        box.arr [i] = *x;
    }

    return normalize (box);
}

} // namespace detail

page_t::page_t (document_t& doc, const page_ref_t& ref)
    : doc_ (doc), ref_ (ref) {
}

obj_t page_t::inherited (const std::string& key) const {
    dict_pointer dict = ref_.dict;

    for (int depth = 0; dict && depth < 64; ++depth) {
        if (auto p = dict->find (key)) {
            return doc_.resolve (*p);
        }

        auto parent = dict->find ("Parent");

        if (0 == parent) {
            break;
        }

        dict = doc_.dict_of (*parent);
    }

    return null_t{ };
}

bbox_t page_t::media_box () const {
    if (auto box = detail::box_of (doc_, inherited ("MediaBox"))) {
        if (!empty (*box)) {
            return *box;
        }
    }

    error (errSyntaxWarning, -1, "invalid page media box, using letter size");
    return bbox_t{ 0, 0, 612, 792 };
}

bbox_t page_t::crop_box () const {
    const auto media = media_box ();

    if (auto box = detail::box_of (doc_, inherited ("CropBox"))) {
        const auto clipped = *box & media;

        if (!empty (clipped)) {
            return clipped;
        }
    }

    return media;
}

rotation_t page_t::rotation () const {
    return rotation_of (lookup< int > (inherited ("Rotate")).value_or (0));
}

bbox_t page_t::bounds () const {
    const auto box = crop_box ();
    return bbox_t{ 0, 0, width_of (box), height_of (box) };
}

matrix_t page_t::page_matrix () const {
    const auto box = crop_box ();
    return { 1, 0, 0, -1, -box.arr [0], box.arr [3] };
}

matrix_t page_t::display_matrix () const {
    const auto box = bounds ();
    const auto w = width_of (box), h = height_of (box);

    switch (rotation ()) {
    case rotation_t::quarter_turn:
        return { 0, 1, -1, 0, h, 0 };

    case rotation_t::half_turn:
        return { -1, 0, 0, -1, w, h };

    case rotation_t::three_quarters_turn:
        return { 0, -1, 1, 0, 0, w };

    default:
        return { };
    }
}

bbox_t page_t::display_bounds () const {
    const auto box = bounds ();

    switch (rotation ()) {
    case rotation_t::quarter_turn:
    case rotation_t::three_quarters_turn:
        return bbox_t{ 0, 0, height_of (box), width_of (box) };

    default:
        return box;
    }
}

dict_pointer page_t::resources () const {
    auto obj = inherited ("Resources");

    if (auto p = std::get_if< dict_pointer > (&obj)) {
        return *p;
    }

    return make< dict_t > ();
}

dict_pointer page_t::own_resources () {
    auto p = ref_.dict->find ("Resources");

    if (p) {
        if (auto q = std::get_if< dict_pointer > (p)) {
            return *q;
        }
    }

    auto copy = make< dict_t > (*resources ());
    ref_.dict->emplace ("Resources", copy);

    return copy;
}

std::string page_t::contents () const {
    std::string buf;

    auto p = ref_.dict->find ("Contents");

    if (0 == p) {
        return buf;
    }

    std::vector< obj_t > parts;

    const auto obj = doc_.resolve (*p);

    if (auto arr = std::get_if< array_pointer > (&obj)) {
        parts = **arr;
    }
    else {
        parts.push_back (obj);
    }

    for (const auto& part : parts) {
        auto stream = doc_.lookup< stream_pointer > (part);

        if (!stream) {
            error (errSyntaxWarning, -1, "page content is not a stream");
            continue;
        }

        if (auto data = doc_.decode (**stream)) {
            buf += *data;
            buf += '\n';
        }
        else {
            error (errSyntaxError, -1, "undecodable page content stream");
        }
    }

    return buf;
}

void page_t::set_contents (const std::string& data) {
    auto stream = make< stream_t > ();
    stream->data = data;

    ref_.dict->emplace ("Contents", doc_.add (stream));
}

array_pointer page_t::annots () const {
    auto p = ref_.dict->find ("Annots");

    if (0 == p) {
        return { };
    }

    auto arr = doc_.lookup< array_pointer > (*p);
    return arr ? *arr : array_pointer{ };
}

} // namespace scrub
