// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE text

#include <defs.hh>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <scrub/engine.hh>
#include <scrub/text.hh>

#include <test/fixture.hh>

using namespace scrub;

BOOST_AUTO_TEST_SUITE(text)

BOOST_AUTO_TEST_CASE(lines) {
    test::builder_t builder;

    builder.add_page ({
        { 72, 720, "First line"  },
        { 72, 700, "Second line" }
    });

    engine_t engine (builder.build ());

    const auto text = engine.text_layout (1);

    BOOST_TEST_REQUIRE (text.blocks.size () == 1U);
    BOOST_TEST_REQUIRE (text.blocks [0].lines.size () == 2U);

    BOOST_TEST (text.blocks [0].lines [0].text () == "First line");
    BOOST_TEST (text.blocks [0].lines [1].text () == "Second line");

    BOOST_TEST (engine.plain_text (1) == "First line\nSecond line\n");
}

BOOST_AUTO_TEST_CASE(inferred_space) {
    test::builder_t builder;

    builder.add_page ({
        {  72, 720, "Name:"    },
        { 150, 720, "Jane Doe" }
    });

    engine_t engine (builder.build ());

    BOOST_TEST (engine.plain_text (1) == "Name: Jane Doe\n");
}

BOOST_AUTO_TEST_CASE(kerning) {
    test::builder_t builder;

    builder.add_page (
        "BT /F1 12 Tf 72 720 Td [(Wo) 20 (rld)] TJ ET\n");

    engine_t engine (builder.build ());

    BOOST_TEST (engine.plain_text (1) == "World\n");
}

BOOST_AUTO_TEST_CASE(search) {
    test::builder_t builder;

    builder.add_page ({
        { 72, 720, "Hello World, hello again" }
    });

    engine_t engine (builder.build ());

    const auto xs = engine.search (1, "HELLO");

    BOOST_TEST_REQUIRE (xs.size () == 2U);

    //
    // Displayed space, y grows downwards from the top of the page:
    //
    for (const auto& x : xs) {
        BOOST_TEST (x.arr [1] < 72);
        BOOST_TEST (x.arr [3] > 72);
        BOOST_TEST (x.arr [3] < 80);
        BOOST_TEST (width_of (x) > 20);
    }

    BOOST_TEST (xs [0].arr [0] >= 71.9);
    BOOST_TEST (xs [0].arr [2] <= xs [1].arr [0]);

    BOOST_TEST (engine.search (1, "absent").empty ());
    BOOST_TEST (engine.search (1, "").empty ());
}

BOOST_AUTO_TEST_CASE(search_does_not_span_lines) {
    test::builder_t builder;

    builder.add_page ({
        { 72, 720, "end of" },
        { 72, 700, "line"   }
    });

    engine_t engine (builder.build ());

    BOOST_TEST (engine.search (1, "of line").empty ());
    BOOST_TEST (engine.search (1, "line").size () == 1U);
}

BOOST_AUTO_TEST_CASE(blocks) {
    test::builder_t builder;

    builder.add_page ({
        { 72, 720, "Top block"    },
        { 72, 300, "Bottom block" }
    });

    engine_t engine (builder.build ());

    const auto text = engine.text_layout (1);

    BOOST_TEST (text.blocks.size () == 2U);
    BOOST_TEST (engine.plain_text (1) == "Top block\n\nBottom block\n");
}

BOOST_AUTO_TEST_CASE(page_numbers) {
    test::builder_t builder;
    builder.add_page ({ { 72, 720, "text" } });

    engine_t engine (builder.build ());

    BOOST_TEST (engine.page_count () == 1);
    BOOST_CHECK_THROW (engine.text_layout (0), std::out_of_range);
    BOOST_CHECK_THROW (engine.text_layout (2), std::out_of_range);
}

BOOST_AUTO_TEST_SUITE_END()
