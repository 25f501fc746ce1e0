// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE parser

#include <defs.hh>

#include <string>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <scrub/ast.hh>
#include <scrub/parser.hh>
#include <scrub/writer.hh>

static bool parse_any (const std::string& s, scrub::obj_t& obj) {
    auto first = s.c_str (), iter = first, last = first + s.size ();
    return scrub::parser::any (first, iter, last, obj);
}

BOOST_AUTO_TEST_SUITE(parser)

static const std::vector< std::tuple< std::string, std::string > >
string_dataset = {
    { "(Hello)",                   "Hello"                     },
    { "(a (nested) string)",       "a (nested) string"         },
    { "(escaped \\(paren\\))",     "escaped (paren)"           },
    { "(tab\\tnewline\\n)",        "tab\tnewline\n"            },
    { "(\\101\\102C)",             "ABC"                       },
    { "(line \\\ncontinued)",      "line continued"            },
    { "<48656C6C6F>",              "Hello"                     },
    { "<48 65 6c 6c 6f>",          "Hello"                     },
    { "<414>",                     "A@"                        },
    { "<>",                        ""                          },
};

BOOST_DATA_TEST_CASE(
    string_, data::make (string_dataset), input, result) {
    using namespace scrub;

    obj_t obj;

    BOOST_TEST_REQUIRE (parse_any (input, obj));
    BOOST_TEST_REQUIRE (is< string_t > (obj));
    BOOST_TEST (std::get< string_t > (obj) == result);
}

static const std::vector< std::tuple< std::string, std::string > >
name_dataset = {
    { "/Type",          "Type"        },
    { "/A#20B",         "A B"         },
    { "/",              ""            },
    { "/F1 12 Tf",      "F1"          },
    { "/Name/Other",    "Name"        },
};

BOOST_DATA_TEST_CASE(
    name_, data::make (name_dataset), input, result) {
    using namespace scrub;

    obj_t obj;

    BOOST_TEST_REQUIRE (parse_any (input, obj));
    BOOST_TEST_REQUIRE (is< name_t > (obj));
    BOOST_TEST (std::get< name_t > (obj) == result);
}

BOOST_AUTO_TEST_CASE(numbers) {
    using namespace scrub;

    obj_t obj;

    BOOST_TEST_REQUIRE (parse_any ("42", obj));
    BOOST_TEST (std::get< int > (obj) == 42);

    BOOST_TEST_REQUIRE (parse_any ("-17", obj));
    BOOST_TEST (std::get< int > (obj) == -17);

    BOOST_TEST_REQUIRE (parse_any ("2.5", obj));
    BOOST_TEST (std::get< double > (obj) == 2.5);

    BOOST_TEST_REQUIRE (parse_any (".5", obj));
    BOOST_TEST (std::get< double > (obj) == .5);

    BOOST_TEST_REQUIRE (parse_any ("-.25", obj));
    BOOST_TEST (std::get< double > (obj) == -.25);
}

BOOST_AUTO_TEST_CASE(keywords) {
    using namespace scrub;

    obj_t obj;

    BOOST_TEST_REQUIRE (parse_any ("true", obj));
    BOOST_TEST (std::get< bool > (obj) == true);

    BOOST_TEST_REQUIRE (parse_any ("false", obj));
    BOOST_TEST (std::get< bool > (obj) == false);

    BOOST_TEST_REQUIRE (parse_any ("null", obj));
    BOOST_TEST (is_null (obj));
}

BOOST_AUTO_TEST_CASE(reference) {
    using namespace scrub;

    obj_t obj;

    BOOST_TEST_REQUIRE (parse_any ("12 0 R", obj));
    BOOST_TEST_REQUIRE (is< ref_t > (obj));
    BOOST_TEST (std::get< ref_t > (obj).num == 12);
    BOOST_TEST (std::get< ref_t > (obj).gen == 0);
}

BOOST_AUTO_TEST_CASE(array) {
    using namespace scrub;

    obj_t obj;

    BOOST_TEST_REQUIRE (parse_any ("[1 2.5 /N (s) [3] 4 0 R]", obj));
    BOOST_TEST_REQUIRE (is< array_pointer > (obj));

    const auto& arr = *std::get< array_pointer > (obj);

    BOOST_TEST_REQUIRE (arr.size () == 6U);
    BOOST_TEST (std::get< int > (arr [0]) == 1);
    BOOST_TEST (std::get< double > (arr [1]) == 2.5);
    BOOST_TEST (is_name (arr [2], "N"));
    BOOST_TEST (std::get< string_t > (arr [3]) == "s");
    BOOST_TEST (std::get< array_pointer > (arr [4])->size () == 1U);
    BOOST_TEST (std::get< ref_t > (arr [5]).num == 4);
}

BOOST_AUTO_TEST_CASE(dictionary) {
    using namespace scrub;

    obj_t obj;

    BOOST_TEST_REQUIRE (parse_any (
        "<< /Type /Page /Count 3 /Empty null /Kids [ 1 0 R ] "
        "/Sub << /A (x) >> >>", obj));
    BOOST_TEST_REQUIRE (is< dict_pointer > (obj));

    const auto& dict = *std::get< dict_pointer > (obj);

    BOOST_TEST (dict.is ("Page"));
    BOOST_TEST (dict.get< int > ("Count").value_or (0) == 3);
    BOOST_TEST (!dict.has ("Empty"));
    BOOST_TEST (dict.get< array_pointer > ("Kids").present ());
    BOOST_TEST (dict.get< dict_pointer > ("Sub").present ());

    //
    // Typed lookups tell a missing entry from one of another type:
    //
    BOOST_TEST (dict.get< int > ("Missing").absent ());
    BOOST_TEST (dict.get< int > ("Type").mismatch ());
}

BOOST_AUTO_TEST_CASE(malformed) {
    using namespace scrub;

    obj_t obj;

    BOOST_TEST (!parse_any ("(unterminated", obj));
    BOOST_TEST (!parse_any ("<4X>", obj));
    BOOST_TEST (!parse_any (")", obj));
    BOOST_TEST (!parse_any ("", obj));
}

BOOST_AUTO_TEST_CASE(write_back) {
    using namespace scrub;

    obj_t obj;

    const std::string s = "<< /A [ 1 2.5 /N ] /B (x\\(y) /C 3 0 R >>";
    BOOST_TEST_REQUIRE (parse_any (s, obj));

    obj_t other;
    BOOST_TEST_REQUIRE (parse_any (to_string (obj), other));

    BOOST_TEST (to_string (obj) == to_string (other));

    const auto& dict = *std::get< dict_pointer > (other);
    BOOST_TEST (dict.get< string_t > ("B").value_or (string_t ()) == "x(y");
}

BOOST_AUTO_TEST_SUITE_END()
