// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE geometry

#include <defs.hh>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <scrub/geometry.hh>

BOOST_AUTO_TEST_SUITE(geometry)

static const scrub::rect_t letter{ 0, 0, 612, 792 };

static const std::vector< std::tuple< scrub::rect_t, scrub::rect_t > >
clip_dataset = {
    { {  72, 100, 300, 120 }, {  72, 100, 300, 120 } },
    { { 300, 120,  72, 100 }, {  72, 100, 300, 120 } },
    { { -50, -10, 100,  20 }, {   0,   0, 100,  20 } },
    { { 600, 780, 700, 900 }, { 600, 780, 612, 792 } },
};

BOOST_DATA_TEST_CASE(
    clip_, data::make (clip_dataset), rect, result) {
    const auto value = scrub::clip (rect, letter);

    BOOST_TEST_REQUIRE (bool (value));
    BOOST_TEST (*value == result);
}

static const std::vector< scrub::rect_t >
dropped_dataset = {
    { 700, 100, 800, 120 },
    { 100, 100, 100, 120 },
    { 100, 100, 100.5, 101 },
    { -20, -20, -10, -10 },
    { 611.5, 791.5, 700, 900 }
};

BOOST_DATA_TEST_CASE(
    clip_dropped, data::make (dropped_dataset), rect) {
    BOOST_TEST (!scrub::clip (rect, letter));
}

BOOST_AUTO_TEST_CASE(clip_within_bounds) {
    using namespace scrub;

    for (double x = -100; x < 700; x += 37) {
        for (double y = -100; y < 900; y += 53) {
            const rect_t rect{ x, y, x + 150, y + 40 };

            if (auto value = clip (rect, letter)) {
                BOOST_TEST (value->arr [0] >= 0);
                BOOST_TEST (value->arr [1] >= 0);
                BOOST_TEST (value->arr [2] <= 612);
                BOOST_TEST (value->arr [3] <= 792);
                BOOST_TEST (area_of (*value) > 1);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(merge_adjacent) {
    using namespace scrub;

    const auto result = merge ({
        { 100, 100, 200, 120 }, { 202, 100, 300, 120 }
    });

    BOOST_TEST_REQUIRE (result.size () == 1U);
    BOOST_TEST (result [0] == (rect_t{ 100, 100, 300, 120 }));
}

BOOST_AUTO_TEST_CASE(merge_stacked) {
    using namespace scrub;

    const auto result = merge ({
        { 100, 100, 200, 120 }, { 150, 123, 250, 140 }
    });

    BOOST_TEST_REQUIRE (result.size () == 1U);
    BOOST_TEST (result [0] == (rect_t{ 100, 100, 250, 140 }));
}

BOOST_AUTO_TEST_CASE(merge_overlapping) {
    using namespace scrub;

    const auto result = merge ({ { 0, 0, 10, 10 }, { 5, 0, 15, 10 } });

    BOOST_TEST_REQUIRE (result.size () == 1U);
    BOOST_TEST (result [0] == (rect_t{ 0, 0, 15, 10 }));
}

BOOST_AUTO_TEST_CASE(merge_slight_overlap) {
    using namespace scrub;

    //
    // Overlapping boxes only merge past the overlap ratio, their proximity
    // does not count:
    //
    const auto result = merge ({ { 0, 0, 100, 100 }, { 97, 0, 200, 100 } });

    BOOST_TEST_REQUIRE (result.size () == 2U);
    BOOST_TEST (result [0] == (rect_t{  0, 0, 100, 100 }));
    BOOST_TEST (result [1] == (rect_t{ 97, 0, 200, 100 }));
}

BOOST_AUTO_TEST_CASE(merge_distant) {
    using namespace scrub;

    const auto result = merge ({
        { 300, 300, 400, 320 }, { 100, 100, 200, 120 }
    });

    //
    // Not merged, in reading order:
    //
    BOOST_TEST_REQUIRE (result.size () == 2U);
    BOOST_TEST (result [0] == (rect_t{ 100, 100, 200, 120 }));
    BOOST_TEST (result [1] == (rect_t{ 300, 300, 400, 320 }));
}

BOOST_AUTO_TEST_CASE(merge_chain) {
    using namespace scrub;

    //
    // The outer rectangles are joined through the middle one:
    //
    const auto result = merge ({
        { 100, 100, 150, 120 }, { 400, 100, 450, 120 }, { 152, 100, 398, 120 }
    });

    BOOST_TEST_REQUIRE (result.size () == 1U);
    BOOST_TEST (result [0] == (rect_t{ 100, 100, 450, 120 }));
}

BOOST_AUTO_TEST_CASE(merge_empty) {
    BOOST_TEST (scrub::merge ({ }).empty ());
}

static const std::vector< std::vector< scrub::rect_t > >
idempotence_dataset = {
    { },
    { { 10, 10, 20, 20 } },
    { { 10, 10, 20, 20 }, { 21, 10, 40, 20 }, { 100, 100, 120, 110 } },
    { { 72, 540, 320, 565 }, { 100, 100, 400, 130 }, { 90, 128, 200, 150 },
      { 400, 100, 403, 130 }, { 50, 700, 60, 710 }, { 55, 705, 65, 715 } },
    { { 0, 0, 5, 5 }, { 9, 0, 14, 5 }, { 18, 0, 23, 5 }, { 27, 0, 32, 5 } },
};

BOOST_AUTO_TEST_CASE(merge_idempotent) {
    using namespace scrub;

    for (const auto& rects : idempotence_dataset) {
        const auto once = merge (rects);
        const auto twice = merge (once);

        BOOST_TEST (once == twice, boost::test_tools::per_element ());
    }
}

BOOST_AUTO_TEST_CASE(to_string_) {
    BOOST_TEST (scrub::to_string (scrub::rect_t{ 1, 2.5, 3.25, 4 }) ==
                "(1.00, 2.50, 3.25, 4.00)");
}

BOOST_AUTO_TEST_SUITE_END()
