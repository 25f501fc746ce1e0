// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE iostreams

#include <iostream>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <boost/iostreams/filtering_stream.hpp>
namespace io = boost::iostreams;

#include <iostreams/container_source.hh>
#include <iostreams/container_sink.hh>
#include <iostreams/ascii85_input_filter.hh>
#include <iostreams/asciihex_input_filter.hh>
#include <iostreams/asciihex_output_filter.hh>
#include <iostreams/filters.hh>
#include <iostreams/runlength_input_filter.hh>

BOOST_AUTO_TEST_SUITE(filters)

static const std::vector< std::tuple< std::string, std::string > >
asciihex_dataset = {
    {                 ">",                         "" },
    {              "00>",     std::string(  "\0", 1) },
    {            "AA AA>",          "\xAA\xAA"        },
    {      "48656C6C6F>",          "Hello"            },
    {       "4\n8 6 5 >",          "He"               },
    {                "A>",          "\xA0"            },
    {        "41 garbage",          "A"               },
};

BOOST_DATA_TEST_CASE(
    asciihex_input, data::make(asciihex_dataset), input, result)
{
    using namespace scrub::iostreams;
    BOOST_TEST(result == filter_input(input, asciihex_input_filter_t()));
}

static const std::vector< std::tuple< std::string, std::string > >
asciihex_output_dataset = {
    {          "",     ">" },
    {      "\xA0",   "A0>" },
    {  "\xA0\x72",  "A072>" },
};

BOOST_DATA_TEST_CASE(
    asciihex_output, data::make(asciihex_output_dataset), output, result)
{
    std::string buf;
    io::filtering_ostream str;

    str.push(scrub::iostreams::asciihex_output_filter_t());
    str.push(scrub::iostreams::container_sink_t< std::string >(buf));

    for (auto c : output)
        str.put(c);

    boost::iostreams::close(str);

    BOOST_TEST(result == buf);
    BOOST_TEST(!str.bad());
}

static const std::vector< std::tuple< std::string, std::string > >
ascii85_dataset = {
    {                 "~>",               "" },
    {   "87cURD_*#TDfTZ)~>",  "Hello, world" },
    {   "87cUR D_*#T\nDfTZ)~>",  "Hello, world" },
    {                "z~>", std::string("\0\0\0\0", 4) },
    {               "87~>",              "H" },
};

BOOST_DATA_TEST_CASE(
    ascii85_input, data::make(ascii85_dataset), input, result)
{
    using namespace scrub::iostreams;
    BOOST_TEST(result == filter_input(input, ascii85_input_filter_t()));
}

static const std::vector< std::tuple< std::string, std::string > >
runlength_dataset = {
    {                        "\x80",          "" },
    {              "\x02" "abc\x80",       "abc" },
    {        "\x02" "abc\xFE" "z\x80",  "abczzz" },
    {       std::string("\0x", 2),           "x" },
};

BOOST_DATA_TEST_CASE(
    runlength_input, data::make(runlength_dataset), input, result)
{
    using namespace scrub::iostreams;
    BOOST_TEST(result == filter_input(input, runlength_input_filter_t()));
}

BOOST_AUTO_TEST_CASE(flate)
{
    using namespace scrub::iostreams;

    std::string text;

    for (int i = 0; i < 100; ++i)
        text += "BT /F1 12 Tf 72 720 Td (SSN: 123-45-6789) Tj ET\n";

    const auto packed = deflate(text);

    BOOST_TEST(packed.size() < text.size());
    BOOST_TEST(inflate(packed) == text);
}

BOOST_AUTO_TEST_CASE(flate_corrupt)
{
    using namespace scrub::iostreams;
    BOOST_CHECK_THROW(inflate("not a zlib stream"), std::exception);
}

BOOST_AUTO_TEST_CASE(lzw)
{
    using namespace scrub::iostreams;

    const std::string input = "\x80\x0B\x60\x50\x22\x0C\x0C\x85\x01";
    BOOST_TEST(lzw_decode(input) == "-----A---B");
}

BOOST_AUTO_TEST_CASE(png_up)
{
    using namespace scrub::iostreams;

    //
    // Two rows of three bytes, each behind the PNG `Up' tag:
    //
    const std::string input = "\x02\x01\x02\x03\x02\x01\x01\x01";
    BOOST_TEST(unpredict(input, 12, 1, 8, 3) == "\x01\x02\x03\x02\x03\x04");
}

BOOST_AUTO_TEST_CASE(tiff)
{
    using namespace scrub::iostreams;

    const std::string input = "\x01\x01\x01\x05\x01\x01";
    BOOST_TEST(unpredict(input, 2, 1, 8, 3) == "\x01\x02\x03\x05\x06\x07");
}

BOOST_AUTO_TEST_SUITE_END()
