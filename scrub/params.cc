// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cctype>
#include <fstream>

#include <scrub/error.hh>
#include <scrub/params.hh>

#include <utils/parseargs.hh>

namespace scrub {
namespace {

std::vector< std::string > tokenize (const std::string& s) {
    std::vector< std::string > xs;

    for (size_t i = 0, n = s.size (); i < n;) {
        for (; i < n && isspace ((unsigned char)s [i]); ++i) ;

        if (i == n) {
            break;
        }

        size_t first = i, last;

        if (s [i] == '"' || s [i] == '\'') {
            const char quote = s [i];

            for (last = ++first; last < n && s [last] != quote; ++last) ;
            i = last < n ? last + 1 : last;
        }
        else {
            for (last = i + 1; last < n && !isspace ((unsigned char)s [last]);
                 ++last) ;
            i = last;
        }

        xs.emplace_back (s.substr (first, last - first));
    }

    return xs;
}

void bad_command (const char* cmd, const std::string& filename, int line) {
    error (errConfig, -1, "Bad '{}' config file command ({}:{})",
           cmd, filename, line);
}

} // anonymous

void global_params_t::load (const fs::path& cfg) {
    std::vector< fs::path > candidates;

    if (!cfg.empty ()) {
        candidates.emplace_back (expand_path (cfg));
    }

    candidates.emplace_back (home_path () / SCRUB_SCRUBRC);
    candidates.emplace_back (SCRUB_SYSTEM_SCRUBRC);

    for (const auto& path : candidates) {
        std::ifstream f (path);

        if (f) {
            error (errInfo, -1, "reading configuration from {}", path.string ());
            return parse (f, path.string ());
        }

        if (path == candidates.front () && !cfg.empty ()) {
            error (errConfig, -1, "Couldn't open config file '{}'",
                   path.string ());
        }
    }
}

void global_params_t::parse_file (const fs::path& path) {
    std::ifstream f (path);

    if (!f) {
        throw std::runtime_error ("cannot open " + path.string ());
    }

    parse (f, path.string ());
}

void global_params_t::parse (std::istream& f, const std::string& filename) {
    std::string s;

    for (int line = 1; std::getline (f, s); ++line) {
        parse_line (s, filename, line);
    }
}

void global_params_t::parse_line (
    const std::string& buf, const std::string& filename, int line) {
    const auto tokens = tokenize (buf);

    if (tokens.empty () || tokens [0][0] == '#') {
        return;
    }

    const auto& cmd = tokens [0];

    if (cmd == "include") {
        if (tokens.size () != 2) {
            return bad_command ("include", filename, line);
        }

        std::ifstream f (expand_path (tokens [1]));

        if (!f) {
            error (errConfig, -1,
                   "Couldn't find included config file: '{}' ({}:{})",
                   tokens [1], filename, line);
            return;
        }

        if (depth_ > 8) {
            error (errConfig, -1, "Config file includes nest too deeply "
                   "({}:{})", filename, line);
            return;
        }

        ++depth_;
        parse (f, tokens [1]);
        --depth_;
    }
    else if (cmd == "fillColor") {
        parse_string ("fillColor", fill_color, tokens, filename, line);
    }
    else if (cmd == "rasterResolution") {
        parse_integer (
            "rasterResolution", raster_resolution, tokens, filename, line);
    }
    else if (cmd == "scannedTextThreshold") {
        parse_integer (
            "scannedTextThreshold", scanned_threshold, tokens, filename, line);
    }
    else if (cmd == "removeImages") {
        parse_yes_no ("removeImages", remove_images, tokens, filename, line);
    }
    else if (cmd == "mergeRectangles") {
        parse_yes_no (
            "mergeRectangles", merge_rectangles, tokens, filename, line);
    }
    else if (cmd == "removeAnnotations") {
        parse_yes_no (
            "removeAnnotations", remove_annotations, tokens, filename, line);
    }
    else if (cmd == "compressStreams") {
        parse_yes_no (
            "compressStreams", compress_streams, tokens, filename, line);
    }
    else if (cmd == "sanitizeMetadata") {
        parse_yes_no (
            "sanitizeMetadata", sanitize_metadata, tokens, filename, line);
    }
    else if (cmd == "sanitizeScripts") {
        parse_yes_no (
            "sanitizeScripts", sanitize_scripts, tokens, filename, line);
    }
    else if (cmd == "sanitizeEmbeddedFiles") {
        parse_yes_no (
            "sanitizeEmbeddedFiles", sanitize_embedded_files, tokens,
            filename, line);
    }
    else if (cmd == "sanitizeLinks") {
        parse_yes_no ("sanitizeLinks", sanitize_links, tokens, filename, line);
    }
    else if (cmd == "sanitizeForms") {
        parse_yes_no ("sanitizeForms", sanitize_forms, tokens, filename, line);
    }
    else if (cmd == "sanitizeThumbnails") {
        parse_yes_no (
            "sanitizeThumbnails", sanitize_thumbnails, tokens, filename, line);
    }
    else if (cmd == "previewColor") {
        parse_color ("previewColor", preview_color, tokens, filename, line);
    }
    else if (cmd == "previewOpacity") {
        parse_float (
            "previewOpacity", preview_opacity, tokens, filename, line);
    }
    else if (cmd == "fontFile") {
        parse_string ("fontFile", font_file, tokens, filename, line);
    }
    else if (cmd == "errQuiet") {
        parse_yes_no ("errQuiet", err_quiet, tokens, filename, line);
    }
    else {
        error (errConfig, -1, "Unknown config file command '{}' ({}:{})",
               cmd, filename, line);
    }
}

void global_params_t::parse_yes_no (
    const char* cmd, bool& flag, const tokens_type& tokens,
    const std::string& filename, int line) {
    if (tokens.size () != 2) {
        return bad_command (cmd, filename, line);
    }

    if (tokens [1] == "yes") {
        flag = true;
    }
    else if (tokens [1] == "no") {
        flag = false;
    }
    else {
        bad_command (cmd, filename, line);
    }
}

void global_params_t::parse_integer (
    const char* cmd, int& value, const tokens_type& tokens,
    const std::string& filename, int line) {
    if (tokens.size () != 2 || !isInt (tokens [1].c_str ())) {
        return bad_command (cmd, filename, line);
    }

    value = std::stoi (tokens [1]);
}

void global_params_t::parse_float (
    const char* cmd, double& value, const tokens_type& tokens,
    const std::string& filename, int line) {
    if (tokens.size () != 2 || !isFP (tokens [1].c_str ())) {
        return bad_command (cmd, filename, line);
    }

    value = std::stod (tokens [1]);
}

void global_params_t::parse_string (
    const char* cmd, std::string& value, const tokens_type& tokens,
    const std::string& filename, int line) {
    if (tokens.size () != 2) {
        return bad_command (cmd, filename, line);
    }

    value = tokens [1];
}

void global_params_t::parse_color (
    const char* cmd, std::array< double, 3 >& value, const tokens_type& tokens,
    const std::string& filename, int line) {
    if (tokens.size () != 4) {
        return bad_command (cmd, filename, line);
    }

    std::array< double, 3 > rgb;

    for (size_t i = 0; i < 3; ++i) {
        if (!isFP (tokens [i + 1].c_str ())) {
            return bad_command (cmd, filename, line);
        }

        rgb [i] = std::stod (tokens [i + 1]);

        if (rgb [i] < 0 || rgb [i] > 1) {
            return bad_command (cmd, filename, line);
        }
    }

    value = rgb;
}

} // namespace scrub
