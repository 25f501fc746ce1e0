// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE bbox

#include <defs.hh>

#include <iostream>
#include <exception>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <scrub/bbox.hh>

BOOST_AUTO_TEST_SUITE(box)

static const std::vector<
    std::tuple<
        scrub::bbox_t, scrub::bbox_t,
        scrub::bbox_t, scrub::bbox_t, scrub::bbox_t > >
rotate_dataset{
    { {  20, 400,  80, 600 }, {   0,   0, 200, 800 },
      { 200,  20, 400,  80 }, { 120, 200, 180, 400 }, { 400, 120, 600, 180 } },
    { {   2,  10,  14,  16 }, {   0,   0, 100, 200 },
      { 184,   2, 190,  14 }, {  86, 184,  98, 190 }, {  10,  86,  16,  98 } }
};

BOOST_DATA_TEST_CASE(
    rotate_, data::make (rotate_dataset),
    box, superbox, result90, result180, result270) {

    using namespace scrub;

    {
        auto value = rotate< rotation_t::none > (box, superbox);
        BOOST_TEST (value == box);
    }

    {
        auto value = rotate< rotation_t::quarter_turn > (box, superbox);
        BOOST_TEST (value == result90);
    }

    {
        auto value = rotate< rotation_t::half_turn > (box, superbox);
        BOOST_TEST (value == result180);
    }

    {
        auto value = rotate< rotation_t::three_quarters_turn > (box, superbox);
        BOOST_TEST (value == result270);
    }
}

BOOST_DATA_TEST_CASE(
    unrotate_, data::make (rotate_dataset),
    box, superbox, result90, result180, result270) {

    using namespace scrub;

    BOOST_TEST (box == unrotate (result90,  superbox, rotation_t::quarter_turn));
    BOOST_TEST (box == unrotate (result180, superbox, rotation_t::half_turn));
    BOOST_TEST (box == unrotate (
                    result270, superbox, rotation_t::three_quarters_turn));

    BOOST_TEST (box == unrotate (box, superbox, rotation_t::none));
}

static const std::vector< std::tuple< int, int > >
rotation_dataset = {
    {    0,   0 }, {   90,  90 }, {  180, 180 }, {  270, 270 },
    {  360,   0 }, {  450,  90 }, {  -90, 270 }, { -180, 180 },
    {   45,   0 }
};

BOOST_DATA_TEST_CASE(
    rotation_of_, data::make (rotation_dataset), degrees, result) {
    BOOST_TEST (result == scrub::degrees_of (scrub::rotation_of (degrees)));
}

static const std::vector<
    std::tuple< scrub::bbox_t, scrub::bbox_t >
    >
normalize_dataset = {
    { {   1, 2, 0, 4 }, { 0, 2, 1, 4 } },
    { {   1, 4, 0, 2 }, { 0, 2, 1, 4 } },
    { {   0, 4, 1, 2 }, { 0, 2, 1, 4 } }
};

BOOST_DATA_TEST_CASE(
    normalize_, data::make (normalize_dataset), box, result) {
    BOOST_TEST (scrub::detail::normalize (box) == result);
}

static const std::vector<
    std::tuple< scrub::bbox_t, scrub::bbox_t, double >
    >
horizontal_overlap_dataset = {
    { { 10,  5, 20, 10 }, { 30, 15, 40, 20 },  0 },
    { { 10,  5, 30, 10 }, { 30, 15, 40, 20 },  0 },
    { { 10,  5, 31, 10 }, { 30, 15, 40, 20 },  1 },
    { { 10,  5, 35, 10 }, { 30, 15, 40, 20 },  5 },
    { { 10,  5, 52, 10 }, { 30, 15, 40, 20 }, 10 },
    { { 32,  5, 52, 10 }, { 30, 15, 40, 20 },  8 },
    { { 40,  5, 52, 10 }, { 30, 15, 40, 20 },  0 }
};

BOOST_DATA_TEST_CASE(
    horizontal_overlap_, data::make (horizontal_overlap_dataset),
    lhs, rhs, result) {
    BOOST_TEST (scrub::detail::horizontal_overlap (lhs, rhs) == result);
}

static const std::vector<
    std::tuple< scrub::bbox_t, scrub::bbox_t, double >
    >
vertical_distance_dataset = {
    { { 16,  2, 24,  9 }, {  2, 10, 14, 18 }, 1 },
    { { 16,  2, 24, 10 }, {  2, 10, 14, 18 }, 0 },
    { { 16,  2, 24, 17 }, {  2, 10, 14, 18 }, 0 },
    { { 16, 18, 24, 45 }, {  2, 10, 14, 18 }, 0 },
    { { 16, 21, 24, 45 }, {  2, 10, 14, 18 }, 3 },
};

BOOST_DATA_TEST_CASE(
    vertical_distance_, data::make (vertical_distance_dataset),
    lhs, rhs, result) {
    BOOST_TEST (scrub::detail::vertical_distance (lhs, rhs) == result);
}

BOOST_AUTO_TEST_CASE(area_of_) {
    using namespace scrub;

    BOOST_TEST (24 == area_of (bbox_t{ 2, 10, 14, 12 }));
    BOOST_TEST ( 0 == area_of (bbox_t{ 2, 10,  2, 12 }));
    BOOST_TEST ( 0 == area_of (bbox_t{ 4, 10,  2, 12 }));

    BOOST_TEST (empty (bbox_t{ 2, 10, 2, 12 }));
    BOOST_TEST (!empty (bbox_t{ 2, 10, 3, 12 }));
}

BOOST_AUTO_TEST_SUITE_END()
