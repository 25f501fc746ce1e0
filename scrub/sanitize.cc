// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <fmt/format.h>
using fmt::format;

#include <scrub/error.hh>
#include <scrub/sanitize.hh>

namespace scrub {
namespace detail {

static const char* script_keys [] = {
    "OpenAction", "AA", "JS", "JavaScript"
};

static name_t subtype_of (const document_t& doc, const dict_t& dict) {
    return doc.get< name_t > (dict, "Subtype").value_or (name_t ());
}

static dict_pointer names_of (const document_t& doc, const dict_t& catalog) {
    auto p = catalog.find ("Names");
    return p ? doc.dict_of (*p) : dict_pointer{ };
}

//
// Remove the annotations of the page satisfying the predicate, from the
// back; an emptied /Annots array is removed:
//
template< typename Predicate >
size_t remove_annots (document_t& doc, dict_t& page, Predicate pred) {
    auto p = page.find ("Annots");

    if (0 == p) {
        return 0;
    }

    auto arr = doc.lookup< array_pointer > (*p);

    if (!arr) {
        return 0;
    }

    auto& annots = **arr;

    size_t n = 0;

    for (size_t i = annots.size (); i > 0; --i) {
        auto dict = doc.dict_of (annots [i - 1]);

        if (dict && pred (*dict)) {
            annots.erase (annots.begin () + (i - 1));
            ++n;
        }
    }

    if (annots.empty ()) {
        page.erase ("Annots");
    }

    return n;
}

template< typename Predicate >
size_t remove_annots (document_t& doc, Predicate pred) {
    size_t n = 0;

    for (auto& page : doc.pages ()) {
        n += remove_annots (doc, *page.dict, pred);
    }

    return n;
}

static size_t count_array (const document_t& doc, const dict_t& dict,
                           const char* key, size_t divisor) {
    if (auto arr = doc.get< array_pointer > (dict, key)) {
        return (*arr)->size () / divisor;
    }

    return 1;
}

static bool uri_link (const document_t& doc, const dict_t& annot) {
    if (subtype_of (doc, annot) != "Link") {
        return false;
    }

    auto p = annot.find ("A");
    auto action = p ? doc.dict_of (*p) : dict_pointer{ };

    return action &&
        doc.get< name_t > (*action, "S").value_or (name_t ()) == "URI";
}

} // namespace detail

size_t remove_metadata (document_t& doc) {
    size_t n = 0;

    if (auto info = doc.info ()) {
        n += info->size ();

        if (n) {
            error (errInfo, -1, "removed {} document info entries", n);
        }

        info->clear ();
    }

    //
    // Unlinked from the trailer as well:
    //
    doc.trailer ().erase ("Info");

    if (doc.catalog ()->erase ("Metadata")) {
        error (errInfo, -1, "removed XMP metadata stream");
        ++n;
    }

    return n;
}

size_t remove_scripts (document_t& doc) {
    size_t n = 0;

    auto catalog = doc.catalog ();

    for (auto key : detail::script_keys) {
        if (catalog->erase (key)) {
            error (errInfo, -1, "removed catalog /{}", key);
            ++n;
        }
    }

    if (auto names = detail::names_of (doc, *catalog)) {
        if (names->erase ("JavaScript")) {
            error (errInfo, -1, "removed named scripts");
            ++n;
        }

        if (names->empty ()) {
            catalog->erase ("Names");
        }
    }

    for (auto& page : doc.pages ()) {
        size_t k = 0;

        for (auto key : { "AA", "A" }) {
            k += page.dict->erase (key);
        }

        if (k) {
            error (errInfo, -1, "removed {} actions from page object {}", k,
                   page.ref.num);
            n += k;
        }
    }

    return n;
}

size_t remove_embedded_files (document_t& doc) {
    size_t n = 0;

    auto catalog = doc.catalog ();

    if (auto names = detail::names_of (doc, *catalog)) {
        if (auto p = names->find ("EmbeddedFiles")) {
            auto tree = doc.dict_of (*p);

            n += tree ? detail::count_array (doc, *tree, "Names", 2) : 1;
            names->erase ("EmbeddedFiles");

            error (errInfo, -1, "removed {} embedded files", n);
        }

        if (names->empty ()) {
            catalog->erase ("Names");
        }
    }

    const auto k = detail::remove_annots (doc, [&](const dict_t& annot) {
        return detail::subtype_of (doc, annot) == "FileAttachment";
    });

    if (k) {
        error (errInfo, -1, "removed {} file attachment annotations", k);
    }

    return n + k;
}

size_t remove_links (document_t& doc) {
    const auto n = detail::remove_annots (doc, [&](const dict_t& annot) {
        return detail::uri_link (doc, annot);
    });

    if (n) {
        error (errInfo, -1, "removed {} hyperlinks", n);
    }

    return n;
}

size_t remove_forms (document_t& doc) {
    size_t n = 0;

    auto catalog = doc.catalog ();

    if (auto p = catalog->find ("AcroForm")) {
        auto form = doc.dict_of (*p);

        n += form ? detail::count_array (doc, *form, "Fields", 1) : 1;
        catalog->erase ("AcroForm");

        error (errInfo, -1, "removed AcroForm with {} fields", n);
    }

    n += detail::remove_annots (doc, [&](const dict_t& annot) {
        const auto subtype = detail::subtype_of (doc, annot);

        return subtype == "Widget" || subtype == "Tx" ||
            subtype == "Btn" || subtype == "Ch";
    });

    return n;
}

size_t remove_thumbnails (document_t& doc) {
    size_t n = 0;

    for (auto& page : doc.pages ()) {
        n += page.dict->erase ("Thumb");
        n += page.dict->erase ("PieceInfo");
    }

    if (n) {
        error (errInfo, -1, "removed {} thumbnail and private data items", n);
    }

    return n;
}

size_t remove_annotations (document_t& doc) {
    size_t n = 0;

    for (auto& page : doc.pages ()) {
        auto p = page.dict->find ("Annots");

        if (0 == p) {
            continue;
        }

        if (auto arr = doc.lookup< array_pointer > (*p)) {
            n += (*arr)->size ();
        }

        page.dict->erase ("Annots");
    }

    if (n) {
        error (errInfo, -1, "removed {} remaining annotations", n);
    }

    return n;
}

sanitize_report_t sanitize (document_t& doc, const sanitize_options_t& opts) {
    sanitize_report_t report;

    if (opts.metadata)       { report.metadata       = remove_metadata (doc);       }
    if (opts.scripts)        { report.scripts        = remove_scripts (doc);        }
    if (opts.embedded_files) { report.embedded_files = remove_embedded_files (doc); }
    if (opts.links)          { report.links          = remove_links (doc);          }
    if (opts.forms)          { report.forms          = remove_forms (doc);          }
    if (opts.thumbnails)     { report.thumbnails     = remove_thumbnails (doc);     }
    if (opts.annotations)    { report.annotations    = remove_annotations (doc);    }

    error (errInfo, -1, "sanitization complete: removed {} items",
           report.total ());

    return report;
}

bool hard_sanitize (const fs::path& input, const fs::path& output,
                    const sanitize_options_t& opts,
                    sanitize_report_t* preport) {
    try {
        auto doc = document_t::open (input);
        const auto report = sanitize (doc, opts);

        doc.save (output, opts.save);

        if (preport) {
            *preport = report;
        }
    }
    catch (const document_error& e) {
        error (errIO, -1, "sanitization failed: {}", e.what ());
        return false;
    }

    return true;
}

bool quick_sanitize (const fs::path& input, const fs::path& output) {
    try {
        auto doc = document_t::open (input);

        remove_metadata (doc);

        //
        // Unreachable objects are kept, only the metadata goes away:
        //
        save_options_t opts;
        opts.garbage_collect = false;

        doc.save (output, opts);
    }
    catch (const document_error& e) {
        error (errIO, -1, "quick sanitization failed: {}", e.what ());
        return false;
    }

    return true;
}

security_analysis_t analyze_security (const document_t& doc) {
    security_analysis_t analysis;

    analysis.encrypted = doc.encrypted ();

    if (auto info = doc.info ()) {
        for (const auto& [key, ignored] : *info) {
            analysis.metadata.push_back (key);
        }
    }

    dict_pointer catalog;

    if (auto p = doc.trailer ().find ("Root")) {
        catalog = doc.dict_of (*p);
    }

    if (catalog) {
        if (catalog->has ("Metadata")) {
            analysis.metadata.push_back ("XMP_metadata");
        }

        for (auto key : detail::script_keys) {
            analysis.javascript = analysis.javascript || catalog->has (key);
        }

        if (auto names = detail::names_of (doc, *catalog)) {
            analysis.javascript = analysis.javascript ||
                names->has ("JavaScript");

            if (auto p = names->find ("EmbeddedFiles")) {
                auto tree = doc.dict_of (*p);

                analysis.embedded_files = tree
                    ? detail::count_array (doc, *tree, "Names", 2) : 1;
            }
        }

        analysis.forms = catalog->has ("AcroForm");

        for (const auto& page : doc.pages ()) {
            if (auto arr = doc.get< array_pointer > (*page.dict, "Annots")) {
                for (const auto& obj : **arr) {
                    auto annot = doc.dict_of (obj);

                    if (!annot) {
                        continue;
                    }

                    ++analysis.annotations;

                    if (detail::subtype_of (doc, *annot) == "Link") {
                        ++analysis.links;
                    }
                }
            }

            analysis.thumbnails += page.dict->has ("Thumb");
        }
    }

    auto& warnings = analysis.warnings;

    if (!analysis.metadata.empty ()) {
        warnings.push_back (
            "Document contains metadata that may reveal sensitive "
            "information");
    }

    if (analysis.javascript) {
        warnings.push_back (
            "Document contains JavaScript which could be a security risk");
    }

    if (analysis.embedded_files) {
        warnings.push_back (format (
            "Document contains {} embedded files", analysis.embedded_files));
    }

    if (analysis.links) {
        warnings.push_back (format (
            "Document contains {} external links", analysis.links));
    }

    if (analysis.forms) {
        warnings.push_back ("Document contains an interactive form");
    }

    if (analysis.encrypted) {
        warnings.push_back ("Document is encrypted");
    }

    return analysis;
}

security_analysis_t analyze_security (const fs::path& path) {
    try {
        return analyze_security (document_t::open (path, true));
    }
    catch (const document_error& e) {
        security_analysis_t analysis;
        analysis.warnings.push_back (format ("Error analyzing PDF: {}", e.what ()));
        return analysis;
    }
}

} // namespace scrub
