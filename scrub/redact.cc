// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <cstdint>

#include <scrub/engine.hh>
#include <scrub/error.hh>
#include <scrub/redact.hh>
#include <utils/string.hh>

namespace scrub {
namespace detail {

static bool valid_page (const engine_t& engine, int n) {
    if (n < 1 || n > engine.page_count ()) {
        error (errWarning, -1, "page {} is not in the document ({} pages), "
               "skipped", n, engine.page_count ());
        return false;
    }

    return true;
}

static rgb_t to_rgb8 (const color_t& c) {
    auto f = [](double x) {
        return std::uint8_t (std::lround ((std::max) (0., (std::min) (1., x)) * 255));
    };

    return { f (c.r), f (c.g), f (c.b) };
}

//
// Open the input, run `fun' and save to the output; errors are fatal to the
// operation and logged:
//
template< typename F >
bool transform_file (const fs::path& input, const fs::path& output,
                     const save_options_t& opts, F fun) {
    try {
        auto engine = engine_t::open (input);

        fun (engine);

        engine.save (output, opts);
    }
    catch (const document_error& e) {
        error (errIO, -1, "{}", e.what ());
        return false;
    }
    catch (const std::exception& e) {
        error (errInternal, -1, "{}: {}", input.string (), e.what ());
        return false;
    }

    return true;
}

} // namespace detail

fill_t parse_fill (const std::string& s) {
    const auto name = to_lower (s);

    if (name == "black") { return fill_t::black; }
    if (name == "white") { return fill_t::white; }
    if (name == "red")   { return fill_t::red;   }
    if (name == "green") { return fill_t::green; }
    if (name == "blue")  { return fill_t::blue;  }

    if (name == "gray" || name == "grey") {
        return fill_t::gray;
    }

    error (errWarning, -1, "unknown fill color '{}', using black", s);

    return fill_t::black;
}

const char* to_string (fill_t fill) {
    switch (fill) {
    case fill_t::white: return "white";
    case fill_t::red:   return "red";
    case fill_t::green: return "green";
    case fill_t::blue:  return "blue";
    case fill_t::gray:  return "gray";
    default:            return "black";
    }
}

color_t to_color (fill_t fill) {
    switch (fill) {
    case fill_t::white: return { 1, 1, 1 };
    case fill_t::red:   return { 1, 0, 0 };
    case fill_t::green: return { 0, 1, 0 };
    case fill_t::blue:  return { 0, 0, 1 };
    case fill_t::gray:  return { .5, .5, .5 };
    default:            return { 0, 0, 0 };
    }
}

std::vector< rect_t >
prepare_rects (const std::vector< rect_t >& rects, const rect_t& bounds,
               bool merge_overlaps) {
    std::vector< rect_t > result;

    for (const auto& rect : rects) {
        if (auto clipped = clip (rect, bounds)) {
            result.push_back (*clipped);
        }
    }

    if (merge_overlaps && result.size () > 1) {
        result = merge (std::move (result));
    }

    return result;
}

redact_result_t
apply_redactions (engine_t& engine, const page_rects_t& page_rects,
                  const redact_options_t& opts) {
    redact_result_t result;

    const auto color = to_color (opts.fill);

    for (const auto& [n, rects] : page_rects) {
        if (rects.empty () || !detail::valid_page (engine, n)) {
            continue;
        }

        const auto valid = prepare_rects (
            rects, engine.page (n).bounds (), opts.merge);

        if (valid.empty ()) {
            continue;
        }

        size_t added = 0;

        for (const auto& rect : valid) {
            try {
                engine.add_redaction (n, rect, color);
                ++added;
            }
            catch (const std::exception& e) {
                error (errWarning, -1, "page {}: region {} not applied: {}",
                       n, to_string (rect), e.what ());
                ++result.failed;
            }
        }

        if (0 == added) {
            continue;
        }

        result.removed += engine.commit_redactions (n, opts.remove_images);
        result.applied += added;

        ++result.pages;

        error (errInfo, -1, "page {}: applied {} redactions", n, added);
    }

    if (result.failed) {
        error (errWarning, -1, "{} redaction regions could not be applied",
               result.failed);
    }

    return result;
}

bool apply_redactions (const fs::path& input, const fs::path& output,
                       const page_rects_t& page_rects,
                       const redact_options_t& opts, redact_result_t* presult) {
    return detail::transform_file (
        input, output, opts.save, [&](engine_t& engine) {
            auto result = apply_redactions (engine, page_rects, opts);

            if (presult) {
                *presult = result;
            }
        });
}

bool apply_raster_redactions (
    const fs::path& input, const fs::path& output,
    const page_rects_t& page_rects, const redact_options_t& opts,
    redact_result_t* presult) {
    return detail::transform_file (
        input, output, opts.save, [&](engine_t& engine) {
            redact_result_t result;

            engine.font_file (opts.font_file);

            const auto k = opts.dpi / 72;
            const auto color = detail::to_rgb8 (to_color (opts.fill));

            for (const auto& [n, rects] : page_rects) {
                if (rects.empty () || !detail::valid_page (engine, n)) {
                    continue;
                }

                const auto valid = prepare_rects (
                    rects, engine.page (n).bounds (), opts.merge);

                if (valid.empty ()) {
                    continue;
                }

                auto bitmap = engine.render (n, opts.dpi);

                for (const auto& rect : valid) {
                    const auto& [x0, y0, x1, y1] = rect.arr;

                    bitmap.fill (
                        int (std::floor (x0 * k)), int (std::floor (y0 * k)),
                        int (std::ceil  (x1 * k)), int (std::ceil  (y1 * k)),
                        color);
                }

                engine.rasterize_page (n, bitmap);

                result.applied += valid.size ();
                ++result.pages;

                error (errInfo, -1, "page {}: rasterized with {} redactions",
                       n, valid.size ());
            }

            if (presult) {
                *presult = result;
            }
        });
}

bool preview_redactions (
    const fs::path& input, const fs::path& output,
    const page_rects_t& page_rects, const color_t& color, double opacity) {
    return detail::transform_file (
        input, output, save_options_t{ }, [&](engine_t& engine) {
            for (const auto& [n, rects] : page_rects) {
                if (rects.empty () || !detail::valid_page (engine, n)) {
                    continue;
                }

                const auto bounds = engine.page (n).bounds ();

                for (const auto& rect : rects) {
                    if (auto clipped = clip (rect, bounds)) {
                        engine.add_highlight (n, *clipped, color, opacity);
                    }
                }
            }
        });
}

} // namespace scrub
