// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <scrub/error.hh>
#include <scrub/parser.hh>

#include <cctype>

namespace scrub {
namespace detail {

//
// Trailer entries from a later update replace the earlier ones:
//
inline void merge_trailer (dict_t& dst, const dict_t& src) {
    for (const auto& [key, value] : src) {
        dst.emplace (key, value);
    }
}

template< typename Iterator >
void skip_line (Iterator& iter, Iterator last) {
    for (; iter != last && *iter != '\r' && *iter != '\n'; ++iter) ;
}

} // namespace detail

//
// Sequential scan of the whole file; the cross-reference sections are not
// trusted, the last definition of an object wins. Unparseable lines are
// skipped with a warning:
//
template< typename Iterator >
bool parse (Iterator first, Iterator& iter, Iterator last, doc_t& attr) {
    using namespace scrub::parser;

    doc_t doc;
    size_t errors = 0;

    {
        auto other = iter;

        if (!version (first, other, last, doc.version)) {
            error (errSyntaxWarning, 0, "missing PDF header");
        }
    }

    for (skip (first, iter, last); iter != last; skip (first, iter, last)) {
        const auto start = iter;

        bool success = false;
        std::string what;

        switch (*iter) {
        case 's': {
            //
            // startxref
            //
            off_t ignore;
            success = startxref (first, iter, last, ignore);
            what = "startxref";
        }
            break;

        case 't': {
            //
            // trailer
            //
            dict_t dict;

            if ((success = trailer (first, iter, last, dict))) {
                scrub::detail::merge_trailer (doc.trailer, dict);
            }

            what = "trailer";
        }
            break;

        case 'x': {
            //
            // xref
            //
            std::map< int, off_t > ignore;
            success = xrefs (first, iter, last, ignore);
            what = "xref";
        }
            break;

        default:
            if (std::isdigit (*iter)) {
                std::tuple< ref_t, obj_t > obj;

                if ((success = object (first, iter, last, obj))) {
                    auto& [ref, value] = obj;

                    //
                    // Cross-reference streams double as trailers:
                    //
                    if (auto p = std::get_if< stream_pointer > (&value)) {
                        if ((*p)->dict.is ("XRef")) {
                            scrub::detail::merge_trailer (
                                doc.trailer, (*p)->dict);
                        }
                    }

                    doc.objs.emplace_back (
                        ref, std::move (value), std::distance (first, start));
                }
            }

            what = "object";
            break;
        }

        if (!success) {
            if (errors++ < 16) {
                error (errSyntaxWarning, std::distance (first, start), "{}",
                       expected (first, start, last, what));
            }

            iter = start;
            scrub::detail::skip_line (iter, last);
        }
    }

    if (doc.objs.empty ()) {
        return false;
    }

    attr = std::move (doc);
    return true;
}

} // namespace scrub
