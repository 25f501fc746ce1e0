// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cstdio>
#include <cstring>

#include <string>
#include <vector>

#include <boost/scope_exit.hpp>

#include <fmt/format.h>
using fmt::format;

#include <scrub/detect.hh>
#include <scrub/error.hh>
#include <scrub/params.hh>
#include <scrub/patterns.hh>
#include <scrub/redact.hh>
#include <scrub/report.hh>
#include <scrub/sanitize.hh>
#include <scrub/verify.hh>
#include <utils/parseargs.hh>
#include <utils/path.hh>

using namespace scrub;

static std::vector< std::string > terms;
static std::vector< std::string > regexes;
static std::vector< std::string > patternNames;
static char rectsFileName [1024] = "";
static char fillName [32] = "";
static char previewFileName [1024] = "";
static char reportFileName [1024] = "";
static char cfgFileName [1024] = "";
static int resolution = 0;
static bool verifyOutput = false;
static bool rasterize = false;
static bool keepAnnots = false;
static bool metaOnly = false;
static bool verbose = false;
static bool quiet = false;
static bool printVersion = false;
static bool printHelp = false;

static ArgDesc redactArgDesc [] = {
    { "-term", argStringList, &terms, 0, "text to redact (repeatable)" },
    { "-regex", argStringList, &regexes, 0,
      "regular expression to redact (repeatable)" },
    { "-pattern", argStringList, &patternNames, 0,
      "common pattern to redact, by name (repeatable)" },
    { "-rects", argString, rectsFileName, sizeof (rectsFileName),
      "JSON file of rectangles to redact, by page" },
    { "-fill", argString, fillName, sizeof (fillName),
      "fill color: black, white, red, green, blue, gray" },
    { "-verify", argFlag, &verifyOutput, 0,
      "look for the terms and patterns in the output" },
    { "-raster", argFlag, &rasterize, 0,
      "replace the redacted pages by images" },
    { "-dpi", argInt, &resolution, 0, "resolution of the page images" },
    { "-preview", argString, previewFileName, sizeof (previewFileName),
      "also write a copy with the regions highlighted" },
    { "-report", argString, reportFileName, sizeof (reportFileName),
      "write a JSON report of the redaction" },
    { "-keep-annots", argFlag, &keepAnnots, 0,
      "keep the annotations of the document" },
    { "-cfg", argString, cfgFileName, sizeof (cfgFileName),
      "configuration file to use in place of .scrubrc" },
    { "-v", argFlag, &verbose, 0, "print progress messages" },
    { "-q", argFlag, &quiet, 0, "don't print any messages or errors" },
    { "-version", argFlag, &printVersion, 0,
      "print copyright and version info" },
    { "-h", argFlag, &printHelp, 0, "print usage information" },
    { "-help", argFlag, &printHelp, 0, "print usage information" },
    { "--help", argFlag, &printHelp, 0, "print usage information" },
    { }
};

static ArgDesc sanitizeArgDesc [] = {
    { "-meta-only", argFlag, &metaOnly, 0,
      "remove the metadata only, keep everything else" },
    { "-keep-annots", argFlag, &keepAnnots, 0,
      "keep the annotations of the document" },
    { "-cfg", argString, cfgFileName, sizeof (cfgFileName),
      "configuration file to use in place of .scrubrc" },
    { "-v", argFlag, &verbose, 0, "print progress messages" },
    { "-q", argFlag, &quiet, 0, "don't print any messages or errors" },
    { "-h", argFlag, &printHelp, 0, "print usage information" },
    { "-help", argFlag, &printHelp, 0, "print usage information" },
    { "--help", argFlag, &printHelp, 0, "print usage information" },
    { }
};

static ArgDesc analyzeArgDesc [] = {
    { "-cfg", argString, cfgFileName, sizeof (cfgFileName),
      "configuration file to use in place of .scrubrc" },
    { "-v", argFlag, &verbose, 0, "print progress messages" },
    { "-h", argFlag, &printHelp, 0, "print usage information" },
    { "-help", argFlag, &printHelp, 0, "print usage information" },
    { "--help", argFlag, &printHelp, 0, "print usage information" },
    { }
};

static ArgDesc patternsArgDesc [] = {
    { "-h", argFlag, &printHelp, 0, "print usage information" },
    { "-help", argFlag, &printHelp, 0, "print usage information" },
    { "--help", argFlag, &printHelp, 0, "print usage information" },
    { }
};

static int usage (const char* command, const char* otherArgs, ArgDesc* args) {
    fprintf (stderr, "pdfscrub version %s\n", PACKAGE_VERSION);
    fprintf (stderr, "%s\n", SCRUB_COPYRIGHT);

    if (!printVersion) {
        printUsage (command, otherArgs, args);
    }

    return 99;
}

static sanitize_options_t
make_sanitize_options (const global_params_t& params) {
    sanitize_options_t opts;

    opts.metadata       = params.sanitize_metadata;
    opts.scripts        = params.sanitize_scripts;
    opts.embedded_files = params.sanitize_embedded_files;
    opts.links          = params.sanitize_links;
    opts.forms          = params.sanitize_forms;
    opts.thumbnails     = params.sanitize_thumbnails;
    opts.annotations    = params.remove_annotations && !keepAnnots;

    opts.save.compress = params.compress_streams;

    return opts;
}

static void print_sanitize_report (const sanitize_report_t& report) {
    printf ("Metadata:        %zu\n", report.metadata);
    printf ("Scripts:         %zu\n", report.scripts);
    printf ("Embedded files:  %zu\n", report.embedded_files);
    printf ("Links:           %zu\n", report.links);
    printf ("Forms:           %zu\n", report.forms);
    printf ("Thumbnails:      %zu\n", report.thumbnails);
    printf ("Annotations:     %zu\n", report.annotations);
    printf ("Total removed:   %zu\n", report.total ());
}

//
// Common pattern names to their expressions; false if a name is unknown:
//
static bool
resolve_patterns (std::vector< std::string >& patterns) {
    patterns = regexes;

    for (const auto& name : patternNames) {
        if (auto p = common_pattern (name)) {
            patterns.push_back (*p);
        }
        else {
            error (errCommandLine, -1, "Unknown pattern '{}'", name);
            return false;
        }
    }

    return true;
}

static int redact_command (int argc, char* argv []) {
    const bool ok = parseArgs (redactArgDesc, &argc, argv);

    if (!ok || argc != 3 || printVersion || printHelp) {
        return usage ("pdfscrub [redact]", "<input> <output>", redactArgDesc);
    }

    set_error_verbose (verbose);
    set_error_quiet (quiet);

    global_params_t params;
    params.load (cfgFileName);

    if (params.err_quiet) {
        set_error_quiet (true);
    }

    const fs::path input = argv [1], output = argv [2];

    detect_options_t detect_opts;

    detect_opts.terms = terms;
    detect_opts.rects_file = rectsFileName;
    detect_opts.scanned_threshold = params.scanned_threshold;

    if (!resolve_patterns (detect_opts.patterns)) {
        return 99;
    }

    if (detect_opts.terms.empty () && detect_opts.patterns.empty () &&
        detect_opts.rects_file.empty ()) {
        error (errCommandLine, -1,
               "Nothing to redact, give -term, -regex, -pattern or -rects");
        return 99;
    }

    const auto page_rects = detect_redactions (input, detect_opts);

    if (page_rects.empty ()) {
        return 1;
    }

    if (previewFileName [0]) {
        const auto& c = params.preview_color;

        if (!preview_redactions (
                input, previewFileName, page_rects, { c [0], c [1], c [2] },
                params.preview_opacity)) {
            error (errWarning, -1, "Couldn't write the preview '{}'",
                   previewFileName);
        }
    }

    redact_options_t redact_opts;

    redact_opts.fill = parse_fill (fillName [0] ? fillName : params.fill_color);
    redact_opts.merge = params.merge_rectangles;
    redact_opts.remove_images = params.remove_images;
    redact_opts.dpi = resolution > 0 ? resolution : params.raster_resolution;
    redact_opts.font_file = params.font_file;
    redact_opts.save.compress = params.compress_streams;

    //
    // The redacted document is an intermediate, sanitized into the output:
    //
    const auto tmp = make_sibling_temp_path (output);

    BOOST_SCOPE_EXIT(&tmp) {
        std::error_code ec;
        fs::remove (tmp, ec);
    } BOOST_SCOPE_EXIT_END

    redact_result_t result;

    const bool applied = rasterize
        ? apply_raster_redactions (input, tmp, page_rects, redact_opts, &result)
        : apply_redactions (input, tmp, page_rects, redact_opts, &result);

    if (!applied) {
        return 1;
    }

    sanitize_report_t sanitized;

    if (!hard_sanitize (tmp, output, make_sanitize_options (params), &sanitized)) {
        return 1;
    }

    if (!quiet) {
        printf ("Redacted %zu regions on %zu pages\n",
                result.applied, result.pages);

        if (result.failed) {
            printf ("Failed to apply %zu regions\n", result.failed);
        }

        printf ("Removed %zu sanitizable items\n", sanitized.total ());
    }

    if (verifyOutput) {
        auto remaining = verify_redaction (output, terms, detect_opts.patterns);

        for (const auto& term : strings_check (output, terms)) {
            remaining.push_back (format ("strings: {}", term));
        }

        if (remaining.empty ()) {
            if (!quiet) {
                printf ("Verification passed\n");
            }
        }
        else {
            for (const auto& s : remaining) {
                error (errWarning, -1, "Still present after redaction: {}", s);
            }
        }
    }

    if (reportFileName [0]) {
        const auto report = make_report (
            input, output, page_rects, terms, detect_opts.patterns);

        if (save_report (report, reportFileName)) {
            error (errInfo, -1, "report written to {}", reportFileName);
        }
    }

    return 0;
}

static int sanitize_command (int argc, char* argv []) {
    const bool ok = parseArgs (sanitizeArgDesc, &argc, argv);

    if (!ok || argc != 3 || printHelp) {
        return usage ("pdfscrub sanitize", "<input> <output>", sanitizeArgDesc);
    }

    set_error_verbose (verbose);
    set_error_quiet (quiet);

    global_params_t params;
    params.load (cfgFileName);

    if (params.err_quiet) {
        set_error_quiet (true);
    }

    const fs::path input = argv [1], output = argv [2];

    if (metaOnly) {
        return quick_sanitize (input, output) ? 0 : 1;
    }

    sanitize_report_t report;

    if (!hard_sanitize (input, output, make_sanitize_options (params), &report)) {
        return 1;
    }

    if (!quiet) {
        print_sanitize_report (report);
    }

    return 0;
}

static const char* yes_no (bool b) {
    return b ? "yes" : "no";
}

static void print_info_string (const char* label, const std::string& s) {
    if (!s.empty ()) {
        printf ("%-16s%s\n", label, s.c_str ());
    }
}

static int analyze_command (int argc, char* argv []) {
    const bool ok = parseArgs (analyzeArgDesc, &argc, argv);

    if (!ok || argc != 2 || printHelp) {
        return usage ("pdfscrub analyze", "<input>", analyzeArgDesc);
    }

    set_error_verbose (verbose);

    global_params_t params;
    params.load (cfgFileName);

    const fs::path input = argv [1];

    const auto info = pdf_info (input);

    if (!info.valid) {
        return 1;
    }

    print_info_string ("Title:", info.title);
    print_info_string ("Subject:", info.subject);
    print_info_string ("Keywords:", info.keywords);
    print_info_string ("Author:", info.author);
    print_info_string ("Creator:", info.creator);
    print_info_string ("Producer:", info.producer);
    print_info_string ("CreationDate:", info.creation_date);
    print_info_string ("ModDate:", info.modification_date);

    printf ("Pages:          %d\n", info.pages);
    printf ("Encrypted:      %s\n", yes_no (info.encrypted));
    printf ("File size:      %s\n", format_file_size (info.file_size).c_str ());

    const auto analysis = analyze_security (input);

    std::string metadata;

    for (const auto& key : analysis.metadata) {
        metadata += (metadata.empty () ? "" : ", ") + key;
    }

    printf ("Metadata:       %s\n", metadata.empty () ? "none" : metadata.c_str ());
    printf ("JavaScript:     %s\n", yes_no (analysis.javascript));
    printf ("Embedded files: %zu\n", analysis.embedded_files);
    printf ("Links:          %zu\n", analysis.links);
    printf ("Forms:          %s\n", yes_no (analysis.forms));
    printf ("Annotations:    %zu\n", analysis.annotations);
    printf ("Thumbnails:     %zu\n", analysis.thumbnails);

    for (const auto& s : analysis.warnings) {
        printf ("Warning:        %s\n", s.c_str ());
    }

    return 0;
}

static int patterns_command (int argc, char* argv []) {
    const bool ok = parseArgs (patternsArgDesc, &argc, argv);

    if (!ok || argc != 1 || printHelp) {
        return usage ("pdfscrub patterns", 0, patternsArgDesc);
    }

    for (const auto& pattern : common_patterns ()) {
        printf ("%-14s %-60s %s\n",
                pattern.name, pattern.regex, pattern.description);
    }

    return 0;
}

int main (int argc, char* argv []) {
    using command_type = int (*) (int, char* []);

    static const struct {
        const char* name;
        command_type fun;
    } commands [] = {
        { "redact",   redact_command   },
        { "sanitize", sanitize_command },
        { "analyze",  analyze_command  },
        { "patterns", patterns_command }
    };

    if (argc > 1) {
        for (const auto& command : commands) {
            if (0 == strcmp (argv [1], command.name)) {
                //
                // Drop the command word, the program name stays first:
                //
                argv [1] = argv [0];
                return command.fun (argc - 1, argv + 1);
            }
        }
    }

    return redact_command (argc, argv);
}
