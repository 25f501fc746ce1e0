// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_PARAMS_HH
#define SCRUB_SCRUB_PARAMS_HH

#include <defs.hh>

#include <array>
#include <istream>
#include <string>
#include <vector>

#include <utils/path.hh>

namespace scrub {

//
// Settings read from the configuration file. The file is line oriented, one
// command per line followed by its arguments; `#' starts a comment line:
//
//   fillColor         black
//   rasterResolution  300
//   removeImages      yes
//   previewColor      1 1 0
//   include           /etc/scrub.d/site.rc
//
struct global_params_t {
    //
    // Look for the named file, then for ~/.scrubrc, then for the system-wide
    // file; a missing file leaves the defaults in place:
    //
    void load (const fs::path& = { });

    void parse_file (const fs::path&);
    void parse (std::istream&, const std::string& filename);
    void parse_line (const std::string&, const std::string& filename, int line);

    std::string fill_color = "black";

    int raster_resolution = SCRUB_RASTER_DPI;
    int scanned_threshold = SCRUB_SCANNED_THRESHOLD;

    bool remove_images = true;
    bool merge_rectangles = true;
    bool remove_annotations = true;
    bool compress_streams = true;

    bool sanitize_metadata = true;
    bool sanitize_scripts = true;
    bool sanitize_embedded_files = true;
    bool sanitize_links = true;
    bool sanitize_forms = true;
    bool sanitize_thumbnails = true;

    std::array< double, 3 > preview_color{ 1, 1, 0 };
    double preview_opacity = 0.5;

    // fallback font for rasterizing text set in non-embedded fonts
    std::string font_file;

    bool err_quiet = false;

private:
    using tokens_type = std::vector< std::string >;

    void parse_yes_no (const char*, bool&, const tokens_type&,
                       const std::string&, int);

    void parse_integer (const char*, int&, const tokens_type&,
                        const std::string&, int);

    void parse_float (const char*, double&, const tokens_type&,
                      const std::string&, int);

    void parse_string (const char*, std::string&, const tokens_type&,
                       const std::string&, int);

    void parse_color (const char*, std::array< double, 3 >&,
                      const tokens_type&, const std::string&, int);

    int depth_ = 0;
};

} // namespace scrub

#endif // SCRUB_SCRUB_PARAMS_HH
