// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <optional>
#include <variant>

#include <fmt/format.h>
using fmt::format;

#include <scrub/detect.hh>
#include <scrub/engine.hh>
#include <scrub/error.hh>
#include <scrub/page.hh>
#include <scrub/rects_file.hh>
#include <utils/string.hh>

namespace scrub {
namespace detail {

struct pattern_t {
    std::string source;
    boost::regex re;
};

static std::vector< pattern_t >
compile_all (const std::vector< std::string >& sources) {
    std::vector< pattern_t > patterns;

    for (const auto& source : sources) {
        auto outcome = compile_pattern (source);

        std::visit (overload_{
                [&](boost::regex& re) {
                    patterns.push_back ({ source, std::move (re) });
                },
                [&](const skip_t& skip) {
                    error (errWarning, -1, "invalid pattern '{}' skipped: {}",
                           source, skip.reason);
                }
            }, outcome);
    }

    return patterns;
}

static std::vector< boost::regex >
regexes_of (const std::vector< pattern_t >& patterns) {
    std::vector< boost::regex > xs;

    for (const auto& pattern : patterns) {
        xs.push_back (pattern.re);
    }

    return xs;
}

static void
term_matches (std::vector< text_match_t >& matches, const text_page_t& text,
              const page_t& page, int n, const std::string& term) {
    if (term.empty ()) {
        return;
    }

    for (const auto& rect : text.search (term)) {
        matches.push_back ({
            term, normalize_rect (page, rect), n, match_kind_t::term });
    }
}

//
// The matches of a page in order, terms then patterns; scanned pages are
// skipped unless there is a recognizer:
//
static outcome_t< std::vector< text_match_t > >
page_matches (engine_t& engine, int n, const detect_options_t& opts,
              const std::vector< pattern_t >& patterns) {
    const auto text = engine.text_layout (n);

    if (int (utf8_length (trim (text.plain_text ()))) < opts.scanned_threshold) {
        if (0 == opts.ocr) {
            return skip_t{ format (
                "page {} has no extractable text, scanned page", n) };
        }

        if (opts.terms.empty () && patterns.empty ()) {
            return std::vector< text_match_t >{ };
        }

        return search_ocr (
            engine, n, *opts.ocr, opts.ocr_dpi, opts.terms,
            regexes_of (patterns));
    }

    const auto page = engine.page (n);

    std::vector< text_match_t > matches;

    for (const auto& term : opts.terms) {
        term_matches (matches, text, page, n, term);
    }

    for (const auto& pattern : patterns) {
        auto xs = search_pattern (text, page, n, pattern.re);
        matches.insert (matches.end (), xs.begin (), xs.end ());
    }

    return matches;
}

//
// Run the page loop over the document, `fun' receives the matches of each
// page that was not skipped; false if the document cannot be opened:
//
template< typename F, typename G >
bool for_each_page (const fs::path& path, const detect_options_t& opts,
                    F fun, G opened) {
    std::optional< engine_t > engine;

    try {
        engine.emplace (engine_t::open (path));
    }
    catch (const std::exception& e) {
        error (errIO, -1, "{}: {}", path.string (), e.what ());
        return false;
    }

    opened (*engine);

    const auto patterns = compile_all (opts.patterns);

    for (int n = 1; n <= engine->page_count (); ++n) {
        try {
            auto outcome = page_matches (*engine, n, opts, patterns);

            std::visit (overload_{
                    [&](std::vector< text_match_t >& matches) {
                        if (!matches.empty ()) {
                            error (errInfo, -1, "page {}: found {} matches", n,
                                   matches.size ());
                        }

                        fun (n, matches);
                    },
                    [&](const skip_t& skip) {
                        error (errInfo, -1, "skipping {}", skip.reason);
                    }
                }, outcome);
        }
        catch (const std::exception& e) {
            error (errSyntaxError, -1, "page {}: detection failed: {}", n,
                   e.what ());
        }
    }

    return true;
}

} // namespace detail

outcome_t< boost::regex > compile_pattern (const std::string& source) {
    try {
        return boost::regex (
            source, boost::regex::perl | boost::regex::icase);
    }
    catch (const boost::regex_error& e) {
        return skip_t{ e.what () };
    }
}

rect_t normalize_rect (const page_t& page, const rect_t& rect) {
    const auto rotation = page.rotation ();

    if (rotation == rotation_t::none) {
        return rect;
    }

    return normalize (unrotate (rect, page.bounds (), rotation));
}

bool is_scanned (engine_t& engine, int n, int threshold) {
    return int (utf8_length (trim (engine.plain_text (n)))) < threshold;
}

std::vector< text_match_t >
search_term (engine_t& engine, int n, const std::string& term) {
    std::vector< text_match_t > matches;

    detail::term_matches (
        matches, engine.text_layout (n), engine.page (n), n, term);

    return matches;
}

std::vector< text_match_t >
search_pattern (const text_page_t& text, const page_t& page, int n,
                const boost::regex& re) {
    std::vector< text_match_t > matches;

    for (const auto& block : text.blocks) {
        for (const auto& line : block.lines) {
            std::string s;
            std::vector< rect_t > rects;

            for (const auto& span : line.spans) {
                const auto count = utf8_length (span.text);

                if (0 == count) {
                    continue;
                }

                const auto& [x0, y0, x1, y1] = span.rect.arr;
                const auto w = (x1 - x0) / count;

                for (size_t i = 0; i < count; ++i) {
                    rects.push_back ({ x0 + i * w, y0, x0 + (i + 1) * w, y1 });
                }

                s += span.text;
            }

            //
            // Code point index of each byte offset:
            //
            std::vector< size_t > index (s.size () + 1);

            size_t k = 0;

            for (size_t i = 0; i < s.size (); ++i) {
                index [i] = k;

                if ((s [i] & 0xC0) != 0x80) {
                    ++k;
                }
            }

            index [s.size ()] = k;

            for (boost::sregex_iterator iter (s.begin (), s.end (), re), last;
                 iter != last; ++iter) {
                const auto& m = *iter;

                if (0 == m.length ()) {
                    continue;
                }

                const auto first = index [m.position ()];
                const auto end = index [m.position () + m.length ()];

                if (first >= rects.size () || end > rects.size ()) {
                    continue;
                }

                auto box = rects [first];

                for (auto i = first + 1; i < end; ++i) {
                    box += rects [i];
                }

                matches.push_back ({
                    m.str (), normalize_rect (page, box), n,
                    match_kind_t::regex });
            }
        }
    }

    return matches;
}

std::vector< text_match_t >
search_ocr (engine_t& engine, int n, ocr_engine_t& ocr, double dpi,
            const std::vector< std::string >& terms,
            const std::vector< boost::regex >& patterns) {
    error (errInfo, -1, "page {}: running text recognition", n);

    const auto bitmap = engine.render (n, dpi);
    const auto page = engine.page (n);

    const auto results = ocr.recognize (
        bitmap, n, dpi, height_of (page.bounds ()));

    std::vector< text_match_t > matches;

    for (const auto& result : results) {
        for (const auto& term : terms) {
            if (!term.empty () && icontains (result.text, term)) {
                matches.push_back ({
                    term, result.rect, n, match_kind_t::ocr });
            }
        }

        for (const auto& re : patterns) {
            if (boost::regex_search (result.text, re)) {
                matches.push_back ({
                    result.text, result.rect, n, match_kind_t::ocr });
            }
        }
    }

    return matches;
}

page_rects_t
detect_redactions (const fs::path& path, const detect_options_t& opts) {
    page_rects_t result;

    int page_count = 0;

    const bool opened = detail::for_each_page (
        path, opts,
        [&](int n, const std::vector< text_match_t >& matches) {
            auto& rects = result [n];

            for (const auto& match : matches) {
                rects.push_back (match.rect);
            }
        },
        [&](engine_t& engine) {
            page_count = engine.page_count ();

            for (int n = 1; n <= page_count; ++n) {
                result [n];
            }
        });

    if (!opened) {
        return { };
    }

    if (!opts.rects_file.empty ()) {
        size_t count = 0;

        for (const auto& [n, rects] : load_rects (opts.rects_file, page_count)) {
            auto& dst = result [n];
            dst.insert (dst.end (), rects.begin (), rects.end ());
            count += rects.size ();
        }

        error (errInfo, -1, "added {} user rectangles", count);
    }

    size_t total = 0, pages = 0;

    for (const auto& [n, rects] : result) {
        total += rects.size ();
        pages += !rects.empty ();
    }

    error (errInfo, -1, "total: {} redaction areas across {} pages", total,
           pages);

    return result;
}

std::vector< text_match_t >
preview_matches (const fs::path& path, const detect_options_t& opts) {
    std::vector< text_match_t > result;

    detail::for_each_page (
        path, opts,
        [&](int, const std::vector< text_match_t >& matches) {
            result.insert (result.end (), matches.begin (), matches.end ());
        },
        [](engine_t&) { });

    return result;
}

} // namespace scrub
