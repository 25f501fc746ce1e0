// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <fstream>
#include <optional>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include <scrub/error.hh>
#include <scrub/rects_file.hh>

namespace scrub {
namespace detail {

static std::optional< int > page_number (const std::string& s) {
    if (s.empty () || s.size () > 9) {
        return { };
    }

    int n = 0;

    for (auto c : s) {
        if (c < '0' || c > '9') {
            return { };
        }

        n = n * 10 + (c - '0');
    }

    return n;
}

static std::optional< rect_t > rect_of (const json& node) {
    static const char* keys [] = { "x0", "y0", "x1", "y1" };

    if (!node.is_object ()) {
        return { };
    }

    rect_t rect{ };

    for (size_t i = 0; i < 4; ++i) {
        const auto iter = node.find (keys [i]);

        if (iter == node.end () || !iter->is_number ()) {
            return { };
        }

        rect.arr [i] = iter->get< double > ();
    }

    return rect;
}

} // namespace detail

page_rects_t parse_rects (std::istream& f, int page_count,
                          const std::string& filename) {
    json root;

    try {
        f >> root;
    }
    catch (const json::parse_error& e) {
        error (errWarning, -1, "{}: invalid rectangles file: {}",
               filename, e.what ());
        return { };
    }

    if (!root.is_object ()) {
        error (errWarning, -1, "{}: invalid rectangles file: not an object",
               filename);
        return { };
    }

    page_rects_t result;

    for (const auto& item : root.items ()) {
        const auto& key = item.key ();
        const auto& entries = item.value ();

        const auto page = detail::page_number (key);

        if (!page) {
            error (errWarning, -1, "{}: '{}' is not a page number", filename,
                   key);
            continue;
        }

        if (*page < 1 || *page > page_count) {
            error (errWarning, -1,
                   "{}: page {} is not in the document ({} pages), skipped",
                   filename, *page, page_count);
            continue;
        }

        auto& rects = result [*page];

        if (!entries.is_array ()) {
            error (errWarning, -1,
                   "{}: rectangles of page {} are not a list, skipped",
                   filename, *page);
            continue;
        }

        for (const auto& entry : entries) {
            if (auto rect = detail::rect_of (entry)) {
                rects.push_back (*rect);
            }
            else {
                error (errWarning, -1,
                       "{}: malformed rectangle on page {}, skipped",
                       filename, *page);
            }
        }
    }

    return result;
}

page_rects_t load_rects (const fs::path& path, int page_count) {
    std::ifstream f (path);

    if (!f) {
        error (errWarning, -1, "cannot read rectangles file '{}'",
               path.string ());
        return { };
    }

    return parse_rects (f, page_count, path.string ());
}

} // namespace scrub
