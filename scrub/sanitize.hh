// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_SANITIZE_HH
#define SCRUB_SCRUB_SANITIZE_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <scrub/document.hh>
#include <utils/path.hh>

namespace scrub {

//
// The stages of the sweep, run in this order when enabled:
//
struct sanitize_options_t {
    bool metadata = true;
    bool scripts = true;
    bool embedded_files = true;
    bool links = true;
    bool forms = true;
    bool thumbnails = true;
    bool annotations = true;

    save_options_t save;
};

//
// Items removed per stage:
//
struct sanitize_report_t {
    size_t metadata = 0;
    size_t scripts = 0;
    size_t embedded_files = 0;
    size_t links = 0;
    size_t forms = 0;
    size_t thumbnails = 0;
    size_t annotations = 0;

    size_t total () const {
        return metadata + scripts + embedded_files + links + forms +
            thumbnails + annotations;
    }
};

struct security_analysis_t {
    //
    // Keys of the information dictionary, `XMP_metadata' for the catalog
    // metadata stream:
    //
    std::vector< std::string > metadata;

    bool javascript = false;

    size_t embedded_files = 0;
    size_t links = 0;

    bool forms = false;

    size_t annotations = 0;
    size_t thumbnails = 0;

    bool encrypted = false;

    std::vector< std::string > warnings;
};

//
// The stages, each returns the number of items removed; running a stage
// twice removes nothing the second time:
//
size_t remove_metadata (document_t&);
size_t remove_scripts (document_t&);
size_t remove_embedded_files (document_t&);
size_t remove_links (document_t&);
size_t remove_forms (document_t&);
size_t remove_thumbnails (document_t&);
size_t remove_annotations (document_t&);

sanitize_report_t sanitize (document_t&, const sanitize_options_t& = { });

//
// Open, sanitize and save; false, with the cause logged, on a fatal error:
//
bool hard_sanitize (const fs::path& input, const fs::path& output,
                    const sanitize_options_t& = { }, sanitize_report_t* = 0);

//
// Metadata only, the rest of the document is kept as is:
//
bool quick_sanitize (const fs::path& input, const fs::path& output);

//
// Read-only; unresolvable or malformed parts are skipped:
//
security_analysis_t analyze_security (const document_t&);
security_analysis_t analyze_security (const fs::path&);

} // namespace scrub

#endif // SCRUB_SCRUB_SANITIZE_HH
