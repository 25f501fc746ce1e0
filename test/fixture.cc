// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <unistd.h>

#include <atomic>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
using fmt::format;

#include <scrub/writer.hh>

#include <test/fixture.hh>

namespace scrub {
namespace test {

static std::string escape (const std::string& s) {
    std::string result;

    for (auto c : s) {
        if (c == '(' || c == ')' || c == '\\') {
            result += '\\';
        }

        result += c;
    }

    return result;
}

std::string text_content (const std::vector< text_run_t >& runs) {
    std::string s;

    for (const auto& [x, y, text] : runs) {
        s += format ("BT /F1 12 Tf {} {} Td ({}) Tj ET\n",
                     format_number (x), format_number (y), escape (text));
    }

    return s;
}

builder_t::builder_t () {
    font_ = doc_.add (make< dict_t > (dict_t{
        { "Type",     name_t ("Font")            },
        { "Subtype",  name_t ("Type1")           },
        { "BaseFont", name_t ("Helvetica")       },
        { "Encoding", name_t ("WinAnsiEncoding") }
    }));

    pages_ = doc_.add (make< dict_t > (dict_t{
        { "Type",  name_t ("Pages")          },
        { "Kids",  make< array_t > ()        },
        { "Count", 0                         }
    }));

    catalog_ = doc_.add (make< dict_t > (dict_t{
        { "Type",  name_t ("Catalog") },
        { "Pages", pages_             }
    }));

    doc_.trailer ().emplace ("Root", catalog_);
}

int builder_t::add_page (const std::vector< text_run_t >& runs, int rotate,
                         double width, double height) {
    return add_page (text_content (runs), rotate, width, height);
}

int builder_t::add_page (const std::string& content, int rotate,
                         double width, double height) {
    auto stream = make< stream_t > ();

    stream->dict.emplace ("Length", int (content.size ()));
    stream->data = content;

    const auto contents = doc_.add (stream);

    auto resources = make< dict_t > (dict_t{
        { "Font", make< dict_t > (dict_t{ { "F1", font_ } }) }
    });

    auto page = make< dict_t > (dict_t{
        { "Type",      name_t ("Page")                   },
        { "Parent",    pages_                            },
        { "MediaBox",  make_rect (0, 0, width, height)   },
        { "Resources", resources                         },
        { "Contents",  contents                          }
    });

    if (rotate) {
        page->emplace ("Rotate", rotate);
    }

    const auto ref = doc_.add (page);
    page_refs_.push_back (ref);

    auto pages = doc_.dict_of (pages_);

    std::get< array_pointer > ((*pages) ["Kids"])->push_back (ref);
    pages->emplace ("Count", int (page_refs_.size ()));

    return int (page_refs_.size ());
}

ref_t builder_t::add_annot (int n, dict_t dict) {
    auto page = doc_.dict_of (page_refs_.at (n - 1));

    if (!page->has ("Annots")) {
        page->emplace ("Annots", make< array_t > ());
    }

    dict.emplace ("P", page_refs_.at (n - 1));

    const auto ref = doc_.add (make< dict_t > (std::move (dict)));
    std::get< array_pointer > ((*page) ["Annots"])->push_back (ref);

    return ref;
}

ref_t builder_t::add_xobject (int n, const std::string& name,
                              stream_pointer stream) {
    auto page = doc_.dict_of (page_refs_.at (n - 1));
    auto& resources = std::get< dict_pointer > ((*page) ["Resources"]);

    if (!resources->has ("XObject")) {
        resources->emplace ("XObject", make< dict_t > ());
    }

    stream->dict.emplace ("Length", int (stream->data.size ()));

    const auto ref = doc_.add (stream);
    std::get< dict_pointer > ((*resources) ["XObject"])->emplace (name, ref);

    return ref;
}

void builder_t::set_info (dict_t dict) {
    const auto ref = doc_.add (make< dict_t > (std::move (dict)));
    doc_.trailer ().emplace ("Info", ref);
}

void builder_t::set_catalog (const std::string& key, obj_t obj, bool indirect) {
    auto catalog = doc_.dict_of (catalog_);

    if (indirect) {
        catalog->emplace (key, doc_.add (std::move (obj)));
    }
    else {
        catalog->emplace (key, std::move (obj));
    }
}

void builder_t::set_page (int n, const std::string& key, obj_t obj) {
    doc_.dict_of (page_refs_.at (n - 1))->emplace (key, std::move (obj));
}

document_t builder_t::build (const save_options_t& opts) const {
    return document_t::load (doc_.serialize (opts));
}

void builder_t::save (const fs::path& path, const save_options_t& opts) const {
    doc_.save (path, opts);
}

temp_dir_t::temp_dir_t () {
    static std::atomic< int > counter{ 0 };

    dir_ = fs::temp_directory_path () /
        format ("scrub-test-{}-{}", getpid (), counter++);

    fs::create_directories (dir_);
}

temp_dir_t::~temp_dir_t () {
    std::error_code ec;
    fs::remove_all (dir_, ec);
}

log_capture_t::log_capture_t () {
    set_error_callback ([this](error_category_t category, off_t,
                               const std::string& s) {
        messages.emplace_back (category, s);
    });
}

log_capture_t::~log_capture_t () {
    set_error_callback (nullptr);
}

size_t log_capture_t::count (
    error_category_t category, const std::string& text) const {
    size_t n = 0;

    for (const auto& [other, s] : messages) {
        n += other == category && s.find (text) != std::string::npos;
    }

    return n;
}

fs::path temp_dir_t::path (const std::string& name) const {
    return dir_ / name;
}

} // namespace test
} // namespace scrub
