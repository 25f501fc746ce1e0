// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE params

#include <defs.hh>

#include <fstream>
#include <sstream>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <scrub/params.hh>

#include <test/fixture.hh>

using namespace scrub;

static global_params_t parse (const std::string& s) {
    global_params_t params;

    std::istringstream ss (s);
    params.parse (ss, "scrubrc");

    return params;
}

BOOST_AUTO_TEST_SUITE(params)

BOOST_AUTO_TEST_CASE(defaults) {
    const global_params_t params;

    BOOST_TEST (params.fill_color == "black");
    BOOST_TEST (params.raster_resolution == 300);
    BOOST_TEST (params.scanned_threshold == 10);
    BOOST_TEST (params.remove_images);
    BOOST_TEST (params.merge_rectangles);
    BOOST_TEST (params.sanitize_metadata);
    BOOST_TEST (params.preview_opacity == .5);
    BOOST_TEST (params.font_file.empty ());
    BOOST_TEST (!params.err_quiet);
}

BOOST_AUTO_TEST_CASE(commands) {
    test::log_capture_t log;

    const auto params = parse (
        "# redaction\n"
        "fillColor          gray\n"
        "rasterResolution   150\n"
        "scannedTextThreshold 25\n"
        "removeImages       no\n"
        "mergeRectangles    no\n"
        "\n"
        "   # sanitization\n"
        "sanitizeLinks      no\n"
        "sanitizeThumbnails no\n"
        "compressStreams    no\n"
        "previewColor       0 .5 1\n"
        "previewOpacity     0.25\n"
        "fontFile           \"/usr/share/fonts/My Sans.ttf\"\n"
        "errQuiet           yes\n");

    BOOST_TEST (log.messages.empty ());

    BOOST_TEST (params.fill_color == "gray");
    BOOST_TEST (params.raster_resolution == 150);
    BOOST_TEST (params.scanned_threshold == 25);
    BOOST_TEST (!params.remove_images);
    BOOST_TEST (!params.merge_rectangles);
    BOOST_TEST (!params.sanitize_links);
    BOOST_TEST (!params.sanitize_thumbnails);
    BOOST_TEST (!params.compress_streams);
    BOOST_TEST (params.sanitize_forms);
    BOOST_TEST (params.preview_color [0] == 0);
    BOOST_TEST (params.preview_color [1] == .5);
    BOOST_TEST (params.preview_color [2] == 1);
    BOOST_TEST (params.preview_opacity == .25);
    BOOST_TEST (params.font_file == "/usr/share/fonts/My Sans.ttf");
    BOOST_TEST (params.err_quiet);
}

static const std::vector< std::tuple< std::string, std::string > >
bad_dataset = {
    { "removeImages maybe",         "removeImages"     },
    { "removeImages",               "removeImages"     },
    { "rasterResolution high",      "rasterResolution" },
    { "rasterResolution 1 2",       "rasterResolution" },
    { "previewOpacity .5.",         "previewOpacity"   },
    { "previewColor 1 1",           "previewColor"     },
    { "previewColor 1 2 0",         "previewColor"     },
    { "previewColor 1 x 0",         "previewColor"     },
    { "fillColor",                  "fillColor"        },
    { "include",                    "include"          },
    { "frobnicate yes",             "frobnicate"       },
};

BOOST_DATA_TEST_CASE(bad_commands, data::make (bad_dataset), line, cmd) {
    test::log_capture_t log;

    const auto params = parse (line + "\n");

    BOOST_TEST (log.count (errConfig, cmd) == 1U);
    BOOST_TEST (log.count (errConfig, "scrubrc:1") == 1U);

    //
    // Settings are left alone:
    //
    BOOST_TEST (params.remove_images);
    BOOST_TEST (params.raster_resolution == 300);
    BOOST_TEST (params.preview_opacity == .5);
    BOOST_TEST (params.preview_color [2] == 0);
}

BOOST_AUTO_TEST_CASE(includes) {
    test::temp_dir_t dir;

    {
        std::ofstream f (dir.path ("site.rc").string ());
        f << "fillColor red\nrasterResolution 72\n";
    }

    test::log_capture_t log;

    const auto params = parse (
        "fillColor blue\n"
        "include " + dir.path ("site.rc").string () + "\n"
        "include " + dir.path ("missing.rc").string () + "\n"
        "rasterResolution 96\n");

    BOOST_TEST (params.fill_color == "red");
    BOOST_TEST (params.raster_resolution == 96);

    BOOST_TEST (log.count (errConfig, "Couldn't find included") == 1U);
}

BOOST_AUTO_TEST_CASE(recursive_include) {
    test::temp_dir_t dir;

    {
        std::ofstream f (dir.path ("loop.rc").string ());
        f << "include " << dir.path ("loop.rc").string () << "\n";
    }

    test::log_capture_t log;

    global_params_t params;
    params.parse_file (dir.path ("loop.rc"));

    BOOST_TEST (log.count (errConfig, "nest too deeply") == 1U);
}

BOOST_AUTO_TEST_CASE(files) {
    test::temp_dir_t dir;

    {
        std::ofstream f (dir.path ("scrubrc").string ());
        f << "fillColor white\n";
    }

    global_params_t params;
    params.load (dir.path ("scrubrc"));

    BOOST_TEST (params.fill_color == "white");

    BOOST_CHECK_THROW (
        params.parse_file (dir.path ("missing.rc")), std::runtime_error);

    test::log_capture_t log;

    global_params_t other;
    other.load (dir.path ("missing.rc"));

    BOOST_TEST (log.count (errConfig, "Couldn't open config file") == 1U);
}

BOOST_AUTO_TEST_SUITE_END()
