// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE detect

#include <defs.hh>

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <scrub/detect.hh>
#include <scrub/engine.hh>
#include <scrub/patterns.hh>
#include <scrub/rects_file.hh>

#include <test/fixture.hh>

using namespace scrub;

static const std::string ssn_pattern = R"(\b\d{3}-\d{2}-\d{4}\b)";

static void write_file (const fs::path& path, const std::string& s) {
    std::ofstream f (path.string ());
    f << s;
}

BOOST_AUTO_TEST_SUITE(detect)

BOOST_AUTO_TEST_CASE(nothing_to_find) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page ({ { 72, 720, "Page one has some text" } });
    builder.add_page ({ { 72, 720, "Page two has some text" } });
    builder.add_page ({ { 72, 720, "Page three has some text" } });

    builder.save (dir.path ("in.pdf"));

    const auto result = detect_redactions (dir.path ("in.pdf"), { });

    BOOST_TEST_REQUIRE (result.size () == 3U);

    for (int n = 1; n <= 3; ++n) {
        BOOST_TEST_REQUIRE (result.count (n) == 1U);
        BOOST_TEST (result.at (n).empty ());
    }
}

BOOST_AUTO_TEST_CASE(terms_and_patterns) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page ({
        { 72, 720, "Name: Jane Doe" },
        { 72, 700, "SSN: 123-45-6789" }
    });

    builder.add_page ({ { 72, 720, "Second page, nothing here" } });
    builder.save (dir.path ("in.pdf"));

    detect_options_t opts;

    opts.terms = { "Jane Doe" };
    opts.patterns = { ssn_pattern };

    const auto result = detect_redactions (dir.path ("in.pdf"), opts);

    BOOST_TEST_REQUIRE (result.size () == 2U);
    BOOST_TEST (result.at (1).size () == 2U);
    BOOST_TEST (result.at (2).empty ());

    //
    // Page space of an unrotated letter page, the term on the upper line:
    //
    const auto& term = result.at (1) [0];
    const auto& ssn = result.at (1) [1];

    BOOST_TEST (term.arr [1] < 72);
    BOOST_TEST (term.arr [3] > 72);
    BOOST_TEST (ssn.arr [1] < 92);
    BOOST_TEST (ssn.arr [3] > 92);
    BOOST_TEST (ssn.arr [0] > 72);
}

BOOST_AUTO_TEST_CASE(invalid_pattern) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page ({ { 72, 700, "SSN: 123-45-6789" } });
    builder.save (dir.path ("in.pdf"));

    detect_options_t opts;
    opts.patterns = { "[unclosed", ssn_pattern, "(?<bad" };

    test::log_capture_t log;

    const auto matches = preview_matches (dir.path ("in.pdf"), opts);

    BOOST_TEST_REQUIRE (matches.size () == 1U);
    BOOST_TEST (matches [0].text == "123-45-6789");
    BOOST_TEST (matches [0].page == 1);
    BOOST_TEST (to_string (matches [0].kind) == std::string ("regex"));

    BOOST_TEST (log.count (errWarning, "invalid pattern") == 2U);
}

BOOST_AUTO_TEST_CASE(invalid_pattern_among_valid) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page ({
        { 72, 720, "SSN: 123-45-6789" },
        { 72, 700, "Email: jane.doe@example.com" },
        { 72, 680, "DOB: 01/02/1980" }
    });

    builder.save (dir.path ("in.pdf"));

    detect_options_t opts;

    opts.patterns = {
        ssn_pattern,
        R"([\w.+-]+@[\w-]+\.[\w.]+)",
        "[unclosed",
        R"(\b\d{2}/\d{2}/\d{4}\b)"
    };

    test::log_capture_t log;

    const auto matches = preview_matches (dir.path ("in.pdf"), opts);

    std::set< std::string > texts;

    for (const auto& match : matches) {
        texts.insert (match.text);
    }

    const std::set< std::string > expected = {
        "123-45-6789", "jane.doe@example.com", "01/02/1980"
    };

    BOOST_TEST (matches.size () == 3U);
    BOOST_TEST (texts == expected, boost::test_tools::per_element ());

    BOOST_TEST (log.count (errWarning, "invalid pattern") == 1U);

    //
    // The rectangles of the valid patterns are all there:
    //
    const auto rects = detect_redactions (dir.path ("in.pdf"), opts);

    BOOST_TEST_REQUIRE (rects.count (1) == 1U);
    BOOST_TEST (rects.at (1).size () == 3U);
}

BOOST_AUTO_TEST_CASE(compile_pattern_outcome) {
    BOOST_TEST (std::holds_alternative< skip_t > (compile_pattern ("(")));
    BOOST_TEST (std::holds_alternative< boost::regex > (
                    compile_pattern (ssn_pattern)));

    //
    // Case-insensitive:
    //
    const auto re = std::get< boost::regex > (compile_pattern ("secret"));
    BOOST_TEST (boost::regex_search (std::string ("TOP SECRET"), re));
}

BOOST_AUTO_TEST_CASE(rects_file) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page ({ { 72, 720, "A single page of text" } });
    builder.save (dir.path ("in.pdf"));

    write_file (dir.path ("rects.json"), R"({
  "1": [ { "x0": 72, "y0": 540, "x1": 320, "y1": 565 } ],
  "2": [ { "x0": 50, "y0": 200, "x1": 250, "y1": 220 } ]
})");

    detect_options_t opts;
    opts.rects_file = dir.path ("rects.json");

    test::log_capture_t log;

    const auto result = detect_redactions (dir.path ("in.pdf"), opts);

    BOOST_TEST_REQUIRE (result.size () == 1U);
    BOOST_TEST_REQUIRE (result.at (1).size () == 1U);
    BOOST_TEST (result.at (1) [0] == (rect_t{ 72, 540, 320, 565 }));

    BOOST_TEST (log.count (errWarning, "page 2") == 1U);
}

BOOST_AUTO_TEST_CASE(rects_parse) {
    test::log_capture_t log;

    std::istringstream ss (R"({
  "1": [ { "x0": 1, "y0": 2, "x1": 30, "y1": 40 },
         { "x0": 1, "y0": 2 } ],
  "3": [ { "x0": 5, "y0": 6, "x1": 70, "y1": 80 } ],
  "0": [ { "x0": 5, "y0": 6, "x1": 70, "y1": 80 } ],
  "first": [ ]
})");

    const auto result = parse_rects (ss, 3, "rects.json");

    BOOST_TEST_REQUIRE (result.size () == 2U);
    BOOST_TEST (result.at (1).size () == 1U);
    BOOST_TEST (result.at (3).size () == 1U);

    BOOST_TEST (log.count (errWarning, "malformed rectangle") == 1U);
    BOOST_TEST (log.count (errWarning, "page 0") == 1U);
    BOOST_TEST (log.count (errWarning, "not a page number") == 1U);
}

BOOST_AUTO_TEST_CASE(rects_invalid_json) {
    test::log_capture_t log;

    std::istringstream ss ("{ \"1\": [ ");

    BOOST_TEST (parse_rects (ss, 1, "rects.json").empty ());
    BOOST_TEST (log.count (errWarning, "invalid rectangles file") == 1U);
}

BOOST_AUTO_TEST_CASE(unrotated_page) {
    test::builder_t builder;
    builder.add_page ({ { 72, 720, "Confidential" } });

    engine_t engine (builder.build ());

    const auto rects = engine.search (1, "confidential");
    const auto matches = search_term (engine, 1, "confidential");

    BOOST_TEST_REQUIRE (rects.size () == 1U);
    BOOST_TEST_REQUIRE (matches.size () == 1U);

    BOOST_TEST (matches [0].rect == rects [0]);
    BOOST_TEST (normalize_rect (engine.page (1), rects [0]) == rects [0]);
}

BOOST_AUTO_TEST_CASE(rotated_page) {
    test::builder_t builder;

    //
    // Text running up the page reads left to right once the page is turned
    // a quarter clockwise:
    //
    builder.add_page (
        "BT /F1 12 Tf 0 1 -1 0 300 200 Tm (Confidential) Tj ET\n", 90);

    engine_t engine (builder.build ());

    const auto matches = search_term (engine, 1, "confidential");

    BOOST_TEST_REQUIRE (matches.size () == 1U);

    const auto& rect = matches [0].rect;

    //
    // Back in page space the match is a tall, narrow box starting at the
    // text origin, (300, 792 - 200):
    //
    BOOST_TEST (height_of (rect) > width_of (rect));
    BOOST_TEST (std::fabs (rect.arr [3] - 592) < 1);
    BOOST_TEST (rect.arr [0] < 300);
    BOOST_TEST (rect.arr [2] > 300);
    BOOST_TEST (rect.arr [2] < 305);

    const auto bounds = engine.page (1).bounds ();

    BOOST_TEST (rect.arr [0] >= bounds.arr [0]);
    BOOST_TEST (rect.arr [1] >= bounds.arr [1]);
}

BOOST_AUTO_TEST_CASE(scanned_page) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page ({ { 72, 720, "Scan" } });
    builder.save (dir.path ("in.pdf"));

    detect_options_t opts;
    opts.terms = { "Scan" };

    const auto result = detect_redactions (dir.path ("in.pdf"), opts);

    BOOST_TEST_REQUIRE (result.size () == 1U);
    BOOST_TEST (result.at (1).empty ());

    engine_t engine (builder.build ());

    BOOST_TEST (is_scanned (engine, 1));
    BOOST_TEST (!is_scanned (engine, 1, 3));
}

namespace {

struct fake_ocr_t : ocr_engine_t {
    std::vector< ocr_result_t >
    recognize (const bitmap_t& bitmap, int, double,
               double page_height) override {
        calls++;

        width = bitmap.width ();
        height = page_height;

        return {
            { "Account",     rect_t{ 100, 100, 160, 120 }, 95 },
            { "123-45-6789", rect_t{ 170, 100, 250, 120 }, 91 }
        };
    }

    int calls = 0;
    int width = 0;
    double height = 0;
};

} // anonymous

BOOST_AUTO_TEST_CASE(recognized_page) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page ("");
    builder.save (dir.path ("in.pdf"));

    fake_ocr_t ocr;

    detect_options_t opts;

    opts.terms = { "account" };
    opts.patterns = { ssn_pattern };
    opts.ocr = &ocr;
    opts.ocr_dpi = 36;

    const auto matches = preview_matches (dir.path ("in.pdf"), opts);

    BOOST_TEST (ocr.calls == 1);
    BOOST_TEST (ocr.width == 306);
    BOOST_TEST (ocr.height == 792);

    BOOST_TEST_REQUIRE (matches.size () == 2U);
    BOOST_TEST (to_string (matches [0].kind) == std::string ("ocr"));
    BOOST_TEST (matches [0].rect == (rect_t{ 100, 100, 160, 120 }));
    BOOST_TEST (matches [1].text == "123-45-6789");
}

BOOST_AUTO_TEST_CASE(unreadable_document) {
    test::temp_dir_t dir;
    test::log_capture_t log;

    write_file (dir.path ("in.pdf"), "not a PDF file");

    detect_options_t opts;
    opts.terms = { "anything" };

    BOOST_TEST (detect_redactions (dir.path ("in.pdf"), opts).empty ());
    BOOST_TEST (detect_redactions (dir.path ("missing.pdf"), opts).empty ());
    BOOST_TEST (log.count (errIO) == 2U);
}

static const std::vector< std::tuple< std::string, std::string, bool > >
pattern_dataset = {
    { "ssn",          "SSN 123-45-6789",              true  },
    { "ssn",          "SSN 123456789",                false },
    { "ssn_nohyphen", "SSN 123456789",                true  },
    { "email",        "write to jane.doe@example.com", true  },
    { "phone",        "call (555) 123-4567",          true  },
    { "credit_card",  "card 4111 1111 1111 1111",     true  },
    { "ip_address",   "host 192.168.0.1",             true  },
    { "date",         "born 12/31/1999",              true  },
    { "zip_code",     "Springfield, IL 62704-1234",   true  },
    { "zip_code",     "no digits here",               false },
};

BOOST_DATA_TEST_CASE(
    common_patterns_, data::make (pattern_dataset), name, text, result) {
    const auto source = common_pattern (name);

    BOOST_TEST_REQUIRE (bool (source));

    const auto re = std::get< boost::regex > (compile_pattern (*source));
    BOOST_TEST (boost::regex_search (text, re) == result);
}

BOOST_AUTO_TEST_CASE(common_pattern_table) {
    BOOST_TEST (common_patterns ().size () == 8U);
    BOOST_TEST (!common_pattern ("passport"));
}

BOOST_AUTO_TEST_SUITE_END()
