// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE sanitize

#include <defs.hh>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <scrub/engine.hh>
#include <scrub/page.hh>
#include <scrub/sanitize.hh>

#include <test/fixture.hh>

using namespace scrub;

//
// A document carrying one or more items of each kind the sweep removes:
//
static void populate (test::builder_t& builder) {
    builder.add_page ({ { 72, 720, "First page of the document" } });
    builder.add_page ({ { 72, 720, "Second page of the document" } });

    auto& doc = builder.doc ();

    builder.set_info (dict_t{
        { "Author",   string_t ("Jane Doe")       },
        { "Title",    string_t ("Annual review")  },
        { "Producer", string_t ("Office suite")   }
    });

    auto xmp = make< stream_t > ();

    xmp->dict.emplace ("Type", name_t ("Metadata"));
    xmp->dict.emplace ("Subtype", name_t ("XML"));
    xmp->data = "<x:xmpmeta xmlns:x='adobe:ns:meta/'/>";
    xmp->dict.emplace ("Length", int (xmp->data.size ()));

    builder.set_catalog ("Metadata", xmp, true);

    builder.set_catalog ("OpenAction", make< dict_t > (dict_t{
        { "S",  name_t ("JavaScript")        },
        { "JS", string_t ("app.alert('hi')") }
    }));

    const auto a = doc.add (make< dict_t > (dict_t{
        { "Type", name_t ("Filespec") }, { "F", string_t ("a.txt") } }));

    const auto b = doc.add (make< dict_t > (dict_t{
        { "Type", name_t ("Filespec") }, { "F", string_t ("b.txt") } }));

    builder.set_catalog ("Names", make< dict_t > (dict_t{
        { "JavaScript", make< dict_t > (dict_t{
                { "Names", make< array_t > () } }) },
        { "EmbeddedFiles", make< dict_t > (dict_t{
                { "Names", make< array_t > (array_t{
                        string_t ("a.txt"), a, string_t ("b.txt"), b }) } }) }
    }), true);

    builder.set_page (1, "AA", make< dict_t > (dict_t{
        { "O", make< dict_t > (dict_t{ { "S", name_t ("JavaScript") } }) }
    }));

    auto thumb = make< stream_t > ();
    thumb->dict.emplace ("Width", 1);
    thumb->dict.emplace ("Height", 1);
    thumb->dict.emplace ("Length", 3);
    thumb->data = std::string (3, '\xFF');

    builder.set_page (1, "Thumb", doc.add (thumb));
    builder.set_page (2, "PieceInfo", make< dict_t > ());

    builder.add_annot (1, dict_t{
        { "Subtype", name_t ("FileAttachment") },
        { "FS", a }
    });

    builder.add_annot (1, dict_t{
        { "Subtype", name_t ("Link") },
        { "A", make< dict_t > (dict_t{
                { "S",   name_t ("URI")                  },
                { "URI", string_t ("https://example.com") } }) }
    });

    builder.add_annot (2, dict_t{
        { "Subtype", name_t ("Link") },
        { "A", make< dict_t > (dict_t{
                { "S", name_t ("GoTo") },
                { "D", make< array_t > (array_t{ 0, name_t ("Fit") }) } }) }
    });

    const auto w1 = builder.add_annot (2, dict_t{
        { "Subtype", name_t ("Widget") }, { "FT", name_t ("Tx") },
        { "T", string_t ("name") } });

    const auto w2 = builder.add_annot (2, dict_t{
        { "Subtype", name_t ("Widget") }, { "FT", name_t ("Btn") },
        { "T", string_t ("agree") } });

    builder.set_catalog ("AcroForm", make< dict_t > (dict_t{
        { "Fields", make< array_t > (array_t{ w1, w2 }) } }));

    builder.add_annot (2, dict_t{
        { "Subtype",  name_t ("Text")                 },
        { "Contents", string_t ("Reviewer comment")   }
    });
}

static size_t count_annots (document_t& doc, int n) {
    const auto pages = doc.pages ();

    if (auto arr = doc.get< array_pointer > (*pages [n - 1].dict, "Annots")) {
        return (*arr)->size ();
    }

    return 0;
}

BOOST_AUTO_TEST_SUITE(sanitize_)

BOOST_AUTO_TEST_CASE(analysis) {
    test::builder_t builder;
    populate (builder);

    const auto doc = builder.build ();
    const auto analysis = analyze_security (doc);

    BOOST_TEST (analysis.metadata.size () == 4U);
    BOOST_TEST (analysis.metadata.back () == "XMP_metadata");
    BOOST_TEST (analysis.javascript);
    BOOST_TEST (analysis.embedded_files == 2U);
    BOOST_TEST (analysis.links == 2U);
    BOOST_TEST (analysis.forms);
    BOOST_TEST (analysis.annotations == 6U);
    BOOST_TEST (analysis.thumbnails == 1U);
    BOOST_TEST (!analysis.encrypted);
    BOOST_TEST (analysis.warnings.size () == 5U);
}

BOOST_AUTO_TEST_CASE(clean_analysis) {
    test::builder_t builder;
    builder.add_page ({ { 72, 720, "Plain page" } });

    const auto analysis = analyze_security (builder.build ());

    BOOST_TEST (analysis.metadata.empty ());
    BOOST_TEST (!analysis.javascript);
    BOOST_TEST (analysis.embedded_files == 0U);
    BOOST_TEST (analysis.annotations == 0U);
    BOOST_TEST (analysis.warnings.empty ());
}

BOOST_AUTO_TEST_CASE(stages) {
    test::builder_t builder;
    populate (builder);

    auto doc = builder.build ();

    BOOST_TEST (remove_metadata (doc) == 4U);
    BOOST_TEST (remove_scripts (doc) == 3U);
    BOOST_TEST (remove_embedded_files (doc) == 3U);
    BOOST_TEST (remove_links (doc) == 1U);
    BOOST_TEST (remove_forms (doc) == 4U);
    BOOST_TEST (remove_thumbnails (doc) == 2U);

    //
    // What is left, the internal link and the comment:
    //
    BOOST_TEST (count_annots (doc, 1) == 0U);
    BOOST_TEST (count_annots (doc, 2) == 2U);

    BOOST_TEST (remove_annotations (doc) == 2U);
    BOOST_TEST (count_annots (doc, 2) == 0U);

    const auto catalog = doc.catalog ();

    BOOST_TEST (!catalog->has ("Metadata"));
    BOOST_TEST (!catalog->has ("OpenAction"));
    BOOST_TEST (!catalog->has ("Names"));
    BOOST_TEST (!catalog->has ("AcroForm"));

    BOOST_TEST (!doc.trailer ().has ("Info"));
    BOOST_TEST (!doc.info ());
}

BOOST_AUTO_TEST_CASE(sweep) {
    test::builder_t builder;
    populate (builder);

    auto doc = builder.build ();

    const auto report = sanitize (doc);

    BOOST_TEST (report.metadata == 4U);
    BOOST_TEST (report.scripts == 3U);
    BOOST_TEST (report.embedded_files == 3U);
    BOOST_TEST (report.links == 1U);
    BOOST_TEST (report.forms == 4U);
    BOOST_TEST (report.thumbnails == 2U);
    BOOST_TEST (report.annotations == 2U);
    BOOST_TEST (report.total () == 19U);

    //
    // Nothing left to remove the second time around:
    //
    BOOST_TEST (sanitize (doc).total () == 0U);

    const auto analysis = analyze_security (doc);

    BOOST_TEST (analysis.metadata.empty ());
    BOOST_TEST (!analysis.javascript);
    BOOST_TEST (analysis.embedded_files == 0U);
    BOOST_TEST (analysis.links == 0U);
    BOOST_TEST (!analysis.forms);
    BOOST_TEST (analysis.annotations == 0U);
    BOOST_TEST (analysis.thumbnails == 0U);
    BOOST_TEST (analysis.warnings.empty ());
}

BOOST_AUTO_TEST_CASE(selected_stages) {
    test::builder_t builder;
    populate (builder);

    auto doc = builder.build ();

    sanitize_options_t opts;

    opts.metadata = false;
    opts.annotations = false;

    const auto report = sanitize (doc, opts);

    BOOST_TEST (report.metadata == 0U);
    BOOST_TEST (report.annotations == 0U);
    BOOST_TEST (report.links == 1U);

    BOOST_TEST (doc.info ()->size () == 3U);
    BOOST_TEST (count_annots (doc, 2) == 2U);
}

BOOST_AUTO_TEST_CASE(files) {
    test::temp_dir_t dir;
    test::builder_t builder;

    populate (builder);
    builder.save (dir.path ("in.pdf"));

    sanitize_report_t report;

    BOOST_TEST_REQUIRE (hard_sanitize (
        dir.path ("in.pdf"), dir.path ("out.pdf"), { }, &report));

    BOOST_TEST (report.total () == 19U);

    auto engine = engine_t::open (dir.path ("out.pdf"));

    BOOST_TEST (engine.page_count () == 2);
    BOOST_TEST (engine.plain_text (2) == "Second page of the document\n");
    BOOST_TEST (!engine.doc ().trailer ().has ("Info"));

    const auto analysis = analyze_security (dir.path ("out.pdf"));
    BOOST_TEST (analysis.warnings.empty ());

    //
    // The unreachable file specifications and scripts are gone:
    //
    BOOST_TEST (engine.doc ().objects ().size () <
                builder.build ().objects ().size ());
}

BOOST_AUTO_TEST_CASE(quick) {
    test::temp_dir_t dir;
    test::builder_t builder;

    populate (builder);
    builder.save (dir.path ("in.pdf"));

    BOOST_TEST_REQUIRE (quick_sanitize (
        dir.path ("in.pdf"), dir.path ("out.pdf")));

    const auto analysis = analyze_security (dir.path ("out.pdf"));

    BOOST_TEST (analysis.metadata.empty ());

    //
    // Everything else stays:
    //
    BOOST_TEST (analysis.javascript);
    BOOST_TEST (analysis.embedded_files == 2U);
    BOOST_TEST (analysis.annotations == 6U);
}

BOOST_AUTO_TEST_CASE(failures) {
    test::temp_dir_t dir;
    test::log_capture_t log;

    BOOST_TEST (!hard_sanitize (dir.path ("missing.pdf"), dir.path ("out.pdf")));
    BOOST_TEST (!quick_sanitize (dir.path ("missing.pdf"), dir.path ("out.pdf")));
    BOOST_TEST (log.count (errIO) == 2U);

    const auto analysis = analyze_security (dir.path ("missing.pdf"));

    BOOST_TEST_REQUIRE (analysis.warnings.size () == 1U);
    BOOST_TEST (analysis.warnings [0].find ("Error analyzing PDF") == 0U);
}

BOOST_AUTO_TEST_SUITE_END()
