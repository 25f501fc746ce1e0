// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_MATCH_HH
#define SCRUB_SCRUB_MATCH_HH

#include <defs.hh>

#include <string>
#include <variant>

#include <scrub/geometry.hh>

namespace scrub {

enum struct match_kind_t { term, regex, ocr };

inline const char* to_string (match_kind_t kind) {
    switch (kind) {
    case match_kind_t::term:  return "term";
    case match_kind_t::regex: return "regex";
    case match_kind_t::ocr:   return "ocr";
    default:                  return "unknown";
    }
}

//
// A located occurrence of a term or pattern; `page' is 1-based, `rect' in
// page space:
//
struct text_match_t {
    std::string text;
    rect_t rect;
    int page;
    match_kind_t kind;
};

//
// An item left out of processing and the reason:
//
struct skip_t {
    std::string reason;
};

template< typename T >
using outcome_t = std::variant< T, skip_t >;

} // namespace scrub

#endif // SCRUB_SCRUB_MATCH_HH
