// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE report

#include <defs.hh>

#include <fstream>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <scrub/redact.hh>
#include <scrub/report.hh>
#include <scrub/verify.hh>

#include <test/fixture.hh>

using namespace scrub;

static const std::vector< test::text_run_t > sample_runs = {
    { 72, 720, "Name: Jane Doe" },
    { 72, 700, "SSN: 123-45-6789" }
};

static const std::vector< std::string > sample_terms = { "Jane Doe" };

static const std::vector< std::string > sample_patterns = {
    R"(\b\d{3}-\d{2}-\d{4}\b)"
};

BOOST_AUTO_TEST_SUITE(report)

static const std::vector< std::tuple< std::uintmax_t, std::string > >
size_dataset = {
    { 0,                         "0.0 B"    },
    { 1023,                      "1023.0 B" },
    { 1024,                      "1.0 KB"   },
    { 1536,                      "1.5 KB"   },
    { 1048576,                   "1.0 MB"   },
    { 5ULL << 30,                "5.0 GB"   },
    { 2ULL << 40,                "2.0 TB"   },
};

BOOST_DATA_TEST_CASE(file_sizes, data::make (size_dataset), size, result) {
    BOOST_TEST (format_file_size (size) == result);
}

BOOST_AUTO_TEST_CASE(printable) {
    const std::string buf ("ab\x01" "abcd\x02xyz\tzy\x7F" "12");

    BOOST_TEST (printable_runs (buf, 4) == "abcd\nxyz\tzy\n");
    BOOST_TEST (printable_runs (buf, 2) == "ab\nabcd\nxyz\tzy\n12\n");
    BOOST_TEST (printable_runs ("", 4).empty ());
}

BOOST_AUTO_TEST_CASE(strings) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page ({ { 72, 720, "The secret plan" } });

    //
    // Compressed, the text is only visible in the decoded streams:
    //
    builder.save (dir.path ("in.pdf"));

    const auto found = strings_check (
        dir.path ("in.pdf"), { "SECRET PLAN", "public", "" });

    BOOST_TEST_REQUIRE (found.size () == 1U);
    BOOST_TEST (found [0] == "SECRET PLAN");

    test::log_capture_t log;

    BOOST_TEST (strings_check (dir.path ("missing.pdf"), { "x" }).empty ());
    BOOST_TEST (log.count (errIO) == 1U);
}

BOOST_AUTO_TEST_CASE(verification) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page (sample_runs);
    builder.save (dir.path ("in.pdf"));

    test::log_capture_t log;

    const auto remaining = verify_redaction (
        dir.path ("in.pdf"), { "jane doe", "John Roe" },
        { sample_patterns [0], "[invalid" });

    BOOST_TEST_REQUIRE (remaining.size () == 2U);
    BOOST_TEST (remaining [0] == "term: jane doe");
    BOOST_TEST (remaining [1] == std::string ("regex: ") + sample_patterns [0]);

    BOOST_TEST (log.count (errWarning, "found after redaction") == 2U);

    const auto failed = verify_redaction (dir.path ("missing.pdf"), { }, { });

    BOOST_TEST_REQUIRE (failed.size () == 1U);
    BOOST_TEST (failed [0].find ("verification_error: ") == 0U);
}

BOOST_AUTO_TEST_CASE(info) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page (sample_runs);
    builder.add_page ({ { 72, 720, "Second page" } });

    builder.set_info (dict_t{
        { "Title",        string_t (std::string ("\xFE\xFF\x00H\x00i\xD8\x3D\xDE\x00", 10)) },
        { "Author",       string_t ("Jos\xE9")            },
        { "Producer",     string_t ("Office suite")       },
        { "CreationDate", string_t ("D:20200101120000Z")  }
    });

    builder.save (dir.path ("in.pdf"));

    const auto info = pdf_info (dir.path ("in.pdf"));

    BOOST_TEST (info.valid);
    BOOST_TEST (!info.encrypted);
    BOOST_TEST (info.pages == 2);
    BOOST_TEST (info.title == "Hi\xF0\x9F\x98\x80");
    BOOST_TEST (info.author == "Jos\xC3\xA9");
    BOOST_TEST (info.producer == "Office suite");
    BOOST_TEST (info.creation_date == "D:20200101120000Z");
    BOOST_TEST (info.subject.empty ());
    BOOST_TEST (info.file_size == fs::file_size (dir.path ("in.pdf")));

    test::log_capture_t log;

    const auto missing = pdf_info (dir.path ("missing.pdf"));

    BOOST_TEST (!missing.valid);
    BOOST_TEST (missing.pages == 0);
    BOOST_TEST (missing.file_size == 0U);
    BOOST_TEST (log.count (errIO) == 1U);
}

BOOST_AUTO_TEST_CASE(impact) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page (sample_runs);
    builder.add_page ({ { 72, 720, "Nothing on the second page" } });
    builder.save (dir.path ("in.pdf"));

    detect_options_t opts;

    opts.terms = sample_terms;
    opts.patterns = sample_patterns;

    const auto impact = estimate_impact (dir.path ("in.pdf"), opts);

    BOOST_TEST (impact.error.empty ());
    BOOST_TEST (impact.total_matches == 2U);
    BOOST_TEST (impact.pages_affected == 1U);

    BOOST_TEST_REQUIRE (impact.by_page.size () == 1U);
    BOOST_TEST (impact.by_page.at (1) == 2U);

    BOOST_TEST_REQUIRE (impact.by_term.size () == 1U);
    BOOST_TEST (impact.by_term.at ("Jane Doe") == 1U);

    BOOST_TEST_REQUIRE (impact.by_pattern.size () == 1U);
    BOOST_TEST (impact.by_pattern.at ("pattern_match: 123-45-6789") == 1U);

    //
    // 19 matched characters out of the text of both pages:
    //
    BOOST_TEST (impact.text_removed_percent > 20);
    BOOST_TEST (impact.text_removed_percent < 40);

    const auto none = estimate_impact (dir.path ("in.pdf"), { });

    BOOST_TEST (none.total_matches == 0U);
    BOOST_TEST (none.text_removed_percent == 0);
}

BOOST_AUTO_TEST_CASE(report_contents) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page (sample_runs);
    builder.add_page ({ { 72, 720, "Second page" } });
    builder.save (dir.path ("in.pdf"));

    const page_rects_t rects = {
        { 1, { rect_t{ 300, 300, 400, 350 }, rect_t{ 300, 400, 420, 450 } } },
        { 2, { } }
    };

    BOOST_TEST_REQUIRE (apply_redactions (
        dir.path ("in.pdf"), dir.path ("out.pdf"), rects));

    const auto r = make_report (
        dir.path ("in.pdf"), dir.path ("out.pdf"), rects, sample_terms,
        sample_patterns);

    BOOST_TEST (r ["input_file"] == dir.path ("in.pdf").string ());

    const auto timestamp = r ["timestamp"].get< std::string > ();

    BOOST_TEST_REQUIRE (timestamp.size () == 19U);
    BOOST_TEST (timestamp [10] == 'T');

    const auto& summary = r ["redaction_summary"];

    BOOST_TEST (summary ["total_redactions"] == 2);
    BOOST_TEST (summary ["pages_modified"] == 1);
    BOOST_TEST (summary ["terms_searched"] == 1);
    BOOST_TEST (summary ["patterns_searched"] == 1);

    const auto& sizes = r ["file_analysis"];

    BOOST_TEST (sizes ["input_size"].is_number_unsigned ());
    BOOST_TEST (sizes ["input_size"].get< std::uintmax_t > () ==
                fs::file_size (dir.path ("in.pdf")));
    BOOST_TEST (sizes ["output_size"].get< std::uintmax_t > () ==
                fs::file_size (dir.path ("out.pdf")));
    BOOST_TEST (sizes ["size_reduction"].is_number_integer ());

    const auto& details = r ["redaction_details"];

    BOOST_TEST (details.size () == 1U);
    BOOST_TEST (details ["page_1"]["redaction_count"] == 2);

    const auto& rectangles = details ["page_1"]["rectangles"];

    BOOST_TEST_REQUIRE (rectangles.is_array ());
    BOOST_TEST_REQUIRE (rectangles.size () == 2U);
    BOOST_TEST (rectangles [0]["x1"].is_number ());
    BOOST_TEST (rectangles [0]["x1"].get< double > () == 400);

    //
    // The rectangles miss the text, all of it remains:
    //
    const auto& verification = r ["verification"];

    BOOST_TEST_REQUIRE (verification ["verification_passed"].is_boolean ());
    BOOST_TEST (!verification ["verification_passed"].get< bool > ());

    BOOST_TEST_REQUIRE (verification ["remaining_terms"].is_array ());
    BOOST_TEST (verification ["remaining_terms"].size () == 2U);
}

BOOST_AUTO_TEST_CASE(report_without_output) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page (sample_runs);
    builder.save (dir.path ("in.pdf"));

    const auto r = make_report (
        dir.path ("in.pdf"), dir.path ("out.pdf"), { }, { }, { });

    BOOST_TEST (r ["redaction_summary"]["total_redactions"] == 0);
    BOOST_TEST (r ["file_analysis"]["output_size"] == 0);
    BOOST_TEST (r ["file_analysis"]["size_reduction"] == 0);
    BOOST_TEST (r ["redaction_details"].is_object ());
    BOOST_TEST (r ["redaction_details"].empty ());
    BOOST_TEST (!r.contains ("verification"));
}

BOOST_AUTO_TEST_CASE(saved_report) {
    test::temp_dir_t dir;
    test::builder_t builder;

    builder.add_page (sample_runs);
    builder.save (dir.path ("in.pdf"));

    const page_rects_t rects = {
        { 1, { rect_t{ 72, 60, 300, 110 } } }
    };

    BOOST_TEST_REQUIRE (apply_redactions (
        dir.path ("in.pdf"), dir.path ("out.pdf"), rects));

    const auto r = make_report (
        dir.path ("in.pdf"), dir.path ("out.pdf"), rects, { }, { });

    BOOST_TEST_REQUIRE (save_report (r, dir.path ("report.json")));

    std::ifstream f (dir.path ("report.json"));
    BOOST_TEST_REQUIRE (bool (f));

    const auto other = json::parse (f);

    BOOST_TEST (other == r);

    //
    // Numbers, booleans and empty lists keep their JSON types:
    //
    BOOST_TEST (other ["redaction_summary"]["total_redactions"].is_number ());
    BOOST_TEST (other ["redaction_details"]["page_1"]["rectangles"][0]["y1"]
                .is_number ());
    BOOST_TEST (other ["verification"]["verification_passed"].is_boolean ());
    BOOST_TEST (other ["verification"]["verification_passed"].get< bool > ());
    BOOST_TEST (other ["verification"]["remaining_terms"].is_array ());
    BOOST_TEST (other ["verification"]["remaining_terms"].empty ());

    test::log_capture_t log;

    BOOST_TEST (!save_report (r, dir.path ("no/such/dir/report.json")));
    BOOST_TEST (log.count (errIO) == 1U);
}

BOOST_AUTO_TEST_SUITE_END()
