// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_TEST_FIXTURE_HH
#define SCRUB_TEST_FIXTURE_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <tuple>

#include <scrub/document.hh>
#include <scrub/error.hh>
#include <utils/path.hh>

namespace scrub {
namespace test {

//
// Text shown at (x, y), default user space, 12 point Helvetica:
//
struct text_run_t {
    double x, y;
    std::string text;
};

//
// Builds small documents in memory. Pages are US Letter unless told
// otherwise, all share one Helvetica font resource, /F1:
//
struct builder_t {
    builder_t ();

    //
    // New page with the runs, returns its 1-based number:
    //
    int add_page (const std::vector< text_run_t >&, int rotate = 0,
                  double width = 612, double height = 792);

    //
    // New page with the given content stream, unfiltered:
    //
    int add_page (const std::string& content, int rotate = 0,
                  double width = 612, double height = 792);

    //
    // Append an indirect annotation to the page:
    //
    ref_t add_annot (int page, dict_t);

    //
    // Named XObject in the page resources, stored as an indirect object:
    //
    ref_t add_xobject (int page, const std::string& name, stream_pointer);

    void set_info (dict_t);

    //
    // Catalog entry, the value stored as an indirect object if asked:
    //
    void set_catalog (const std::string& key, obj_t, bool indirect = false);

    //
    // Page dictionary entry:
    //
    void set_page (int page, const std::string& key, obj_t);

    document_t& doc () { return doc_; }

    //
    // Written and read back, as a reader would see it:
    //
    document_t build (const save_options_t& = { }) const;

    void save (const fs::path&, const save_options_t& = { }) const;

private:
    document_t doc_;

    ref_t catalog_, pages_, font_;
    std::vector< ref_t > page_refs_;
};

//
// Content stream showing the runs with /F1:
//
std::string text_content (const std::vector< text_run_t >&);

//
// Fresh directory under the system temporary directory, removed with its
// contents on destruction:
//
struct temp_dir_t {
    temp_dir_t ();
    ~temp_dir_t ();

    temp_dir_t (const temp_dir_t&) = delete;
    temp_dir_t& operator= (const temp_dir_t&) = delete;

    fs::path path (const std::string&) const;

private:
    fs::path dir_;
};

//
// Collects the messages logged during its lifetime instead of printing them:
//
struct log_capture_t {
    log_capture_t ();
    ~log_capture_t ();

    //
    // Messages of the category containing the text:
    //
    size_t count (error_category_t, const std::string& = { }) const;

    std::vector< std::tuple< error_category_t, std::string > > messages;
};

} // namespace test
} // namespace scrub

#endif // SCRUB_TEST_FIXTURE_HH
