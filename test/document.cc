// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE document

#include <defs.hh>

#include <fstream>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <scrub/document.hh>
#include <scrub/error.hh>
#include <scrub/page.hh>

#include <test/fixture.hh>

using namespace scrub;

BOOST_AUTO_TEST_SUITE(document)

BOOST_AUTO_TEST_CASE(pages) {
    test::builder_t builder;

    builder.add_page ({ { 72, 720, "first page" } });
    builder.add_page ({ { 72, 720, "second page" } }, 90, 595, 842);

    auto doc = builder.build ();
    const auto xs = doc.pages ();

    BOOST_TEST_REQUIRE (xs.size () == 2U);

    {
        const page_t page (doc, xs [0]);

        BOOST_TEST (degrees_of (page.rotation ()) == 0);
        BOOST_TEST (page.bounds () == (bbox_t{ 0, 0, 612, 792 }));
        BOOST_TEST (page.contents ().find ("(first page) Tj") !=
                    std::string::npos);
    }

    {
        const page_t page (doc, xs [1]);

        BOOST_TEST (degrees_of (page.rotation ()) == 90);
        BOOST_TEST (page.bounds () == (bbox_t{ 0, 0, 595, 842 }));
        BOOST_TEST (page.display_bounds () == (bbox_t{ 0, 0, 842, 595 }));
    }
}

BOOST_AUTO_TEST_CASE(inherited_attributes) {
    test::builder_t builder;
    builder.add_page ({ { 72, 720, "text" } });

    auto& doc = builder.doc ();

    auto page = doc.pages ().front ();
    page.dict->erase ("MediaBox");

    auto pages = doc.dict_of (*page.dict->find ("Parent"));
    pages->emplace ("MediaBox", make_rect (0, 0, 400, 300));
    pages->emplace ("Rotate", 180);

    const page_t view (doc, page);

    BOOST_TEST (view.media_box () == (bbox_t{ 0, 0, 400, 300 }));
    BOOST_TEST (degrees_of (view.rotation ()) == 180);
}

BOOST_AUTO_TEST_CASE(crop_box) {
    test::builder_t builder;
    builder.add_page ({ { 72, 720, "text" } });
    builder.set_page (1, "CropBox", make_rect (50, 60, 700, 500));

    auto doc = builder.build ();
    const page_t page (doc, doc.pages ().front ());

    //
    // Clipped to the media box; page space is anchored at its top-left:
    //
    BOOST_TEST (page.crop_box () == (bbox_t{ 50, 60, 612, 500 }));
    BOOST_TEST (page.bounds () == (bbox_t{ 0, 0, 562, 440 }));

    const auto p = transform (page.page_matrix (), 50, 500);
    BOOST_TEST (p.x == 0);
    BOOST_TEST (p.y == 0);

    const auto q = transform (page.page_matrix (), 612, 60);
    BOOST_TEST (q.x == 562);
    BOOST_TEST (q.y == 440);
}

BOOST_AUTO_TEST_CASE(info) {
    test::builder_t builder;
    builder.add_page ({ { 72, 720, "text" } });

    builder.set_info (dict_t{
        { "Title",  string_t ("Quarterly report") },
        { "Author", string_t ("J. Doe")           }
    });

    const auto doc = builder.build ();
    const auto info = doc.info ();

    BOOST_TEST_REQUIRE (bool (info));
    BOOST_TEST (doc.get< string_t > (*info, "Title").value_or (string_t ()) ==
                "Quarterly report");
    BOOST_TEST (doc.get< string_t > (*info, "Author").value_or (string_t ()) ==
                "J. Doe");
    BOOST_TEST (doc.get< string_t > (*info, "Subject").absent ());
}

BOOST_AUTO_TEST_CASE(garbage_collection) {
    test::builder_t builder;
    builder.add_page ({ { 72, 720, "text" } });

    builder.doc ().add (string_t ("unreachable"));

    const auto n = builder.doc ().objects ().size ();

    save_options_t opts;

    opts.garbage_collect = false;
    BOOST_TEST (builder.build (opts).objects ().size () == n);

    opts.garbage_collect = true;
    BOOST_TEST (builder.build (opts).objects ().size () == n - 1);

    BOOST_TEST (builder.doc ().serialize ().find ("unreachable") ==
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(compression) {
    test::builder_t builder;
    builder.add_page ({ { 72, 720, "compressed text" } });

    save_options_t opts;

    opts.compress = true;
    BOOST_TEST (builder.doc ().serialize (opts).find ("compressed text") ==
                std::string::npos);

    auto doc = builder.build (opts);
    const page_t page (doc, doc.pages ().front ());
    BOOST_TEST (page.contents ().find ("(compressed text) Tj") !=
                std::string::npos);

    opts.compress = false;
    BOOST_TEST (builder.doc ().serialize (opts).find ("compressed text") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(save_and_open) {
    test::temp_dir_t dir;

    test::builder_t builder;
    builder.add_page ({ { 72, 720, "saved text" } });
    builder.save (dir.path ("saved.pdf"));

    auto doc = document_t::open (dir.path ("saved.pdf"));

    BOOST_TEST (doc.pages ().size () == 1U);
    BOOST_TEST (doc.catalog ()->is ("Catalog"));

    //
    // The temporary file is gone:
    //
    size_t count = 0;

    for (const auto& entry : fs::directory_iterator (dir.path ("."))) {
        (void)entry;
        ++count;
    }

    BOOST_TEST (count == 1U);
}

BOOST_AUTO_TEST_CASE(open_failures) {
    test::temp_dir_t dir;

    BOOST_CHECK_THROW (
        document_t::open (dir.path ("missing.pdf")), document_error);

    {
        std::ofstream f (dir.path ("empty.pdf").string ());
    }

    BOOST_CHECK_THROW (
        document_t::open (dir.path ("empty.pdf")), document_error);

    {
        std::ofstream f (dir.path ("text.pdf").string ());
        f << "this is not a PDF file\n";
    }

    BOOST_CHECK_THROW (
        document_t::open (dir.path ("text.pdf")), document_error);
}

BOOST_AUTO_TEST_CASE(encrypted) {
    test::builder_t builder;
    builder.add_page ({ { 72, 720, "text" } });

    builder.doc ().trailer ().emplace (
        "Encrypt", builder.doc ().add (make< dict_t > (dict_t{
            { "Filter", name_t ("Standard") },
            { "V",      2                   },
            { "R",      3                   }
        })));

    const auto buf = builder.doc ().serialize ();

    BOOST_CHECK_THROW (document_t::load (buf), document_error);

    const auto doc = document_t::load (buf, true);
    BOOST_TEST (doc.encrypted ());
}

BOOST_AUTO_TEST_CASE(clone_is_deep) {
    auto dict = make< dict_t > (dict_t{
        { "Kids", make< array_t > (array_t{ 1, 2 }) }
    });

    auto copy = clone (dict);

    std::get< array_pointer > ((*dict) ["Kids"])->push_back (3);

    const auto& other = *std::get< dict_pointer > (copy);
    BOOST_TEST (other.get< array_pointer > ("Kids").value->size () == 2U);
}

BOOST_AUTO_TEST_SUITE_END()
