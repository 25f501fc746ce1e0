// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE content

#include <defs.hh>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <scrub/content.hh>

using namespace scrub;

BOOST_AUTO_TEST_SUITE(content)

BOOST_AUTO_TEST_CASE(operators) {
    const auto ops = parse_content (
        "q 1 0 0 1 72 720 cm\n"
        "BT /F1 12 Tf 0 0 Td (Hello) Tj [(W) 120 (orld)] TJ ET\n"
        "0 0 100 100 re f n Q");

    std::vector< std::string > names;

    for (const auto& op : ops) {
        names.push_back (op.name);
    }

    const std::vector< std::string > expected{
        "q", "cm", "BT", "Tf", "Td", "Tj", "TJ", "ET", "re", "f", "n", "Q"
    };

    BOOST_TEST (names == expected, boost::test_tools::per_element ());

    BOOST_TEST_REQUIRE (ops [1].args.size () == 6U);
    BOOST_TEST (std::get< int > (ops [1].args [4]) == 72);

    BOOST_TEST_REQUIRE (ops [3].args.size () == 2U);
    BOOST_TEST (is_name (ops [3].args [0], "F1"));

    BOOST_TEST_REQUIRE (ops [6].args.size () == 1U);
    BOOST_TEST (std::get< array_pointer > (ops [6].args [0])->size () == 3U);
}

BOOST_AUTO_TEST_CASE(quote_operators) {
    const auto ops = parse_content ("BT (a) ' 1 2 (b) \" ET");

    BOOST_TEST_REQUIRE (ops.size () == 4U);
    BOOST_TEST (ops [1].name == "'");
    BOOST_TEST (ops [2].name == "\"");
    BOOST_TEST (ops [2].args.size () == 3U);
}

BOOST_AUTO_TEST_CASE(inline_image) {
    const std::string data ("\x00\xFF\x10\x20", 4);

    const auto ops = parse_content (
        "q BI /W 2 /H 2 /BPC 8 /CS /G ID " + data + "\nEI Q");

    BOOST_TEST_REQUIRE (ops.size () == 3U);
    BOOST_TEST (ops [1].name == "BI");
    BOOST_TEST (ops [1].data == data);
    BOOST_TEST (ops [2].name == "Q");

    const auto dict = expand_inline_image (
        *std::get< dict_pointer > (ops [1].args [0]));

    BOOST_TEST (dict.get< int > ("Width").value_or (0) == 2);
    BOOST_TEST (dict.get< int > ("BitsPerComponent").value_or (0) == 8);
    BOOST_TEST (is_name (dict.at ("ColorSpace"), "DeviceGray"));
}

BOOST_AUTO_TEST_CASE(inline_image_with_filter) {
    //
    // The size is unknown, the data ends before `EI':
    //
    const auto ops = parse_content (
        "BI /W 4 /H 4 /F /AHx ID 00FF00FF>\nEI Q");

    BOOST_TEST_REQUIRE (ops.size () == 2U);
    BOOST_TEST (ops [0].data == "00FF00FF>");
}

BOOST_AUTO_TEST_CASE(garbage) {
    const auto ops = parse_content ("q } 1 0 0 1 0 0 cm Q 12");

    BOOST_TEST_REQUIRE (ops.size () == 3U);
    BOOST_TEST (ops [1].name == "cm");
}

BOOST_AUTO_TEST_CASE(serialize) {
    const std::string s =
        "q\n1 0 0 1 72 720 cm\nBT\n/F1 12 Tf\n(Hello) Tj\nET\nQ\n";

    const auto ops = parse_content (s);
    const auto other = parse_content (serialize_content (ops));

    BOOST_TEST_REQUIRE (ops.size () == other.size ());
    BOOST_TEST (serialize_content (ops) == serialize_content (other));
    BOOST_TEST (serialize_content (ops [4]) == "(Hello) Tj");
}

BOOST_AUTO_TEST_SUITE_END()
