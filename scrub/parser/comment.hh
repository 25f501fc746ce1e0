// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_COMMENT_HH
#define SCRUB_SCRUB_PARSER_COMMENT_HH

#include <defs.hh>
#include <scrub/parser/lit.hh>

#include <tuple>

namespace scrub::parser {

template< typename Iterator >
bool comment (Iterator, Iterator&, Iterator);

template< typename Iterator >
inline bool eof (Iterator first, Iterator& iter, Iterator last) {
    return lit (first, iter, last, "%%EOF");
}

template< typename Iterator >
bool version (Iterator, Iterator&, Iterator, std::tuple< int, int >&);

} // scrub::parser

#include <scrub/parser/comment.cc>

#endif // SCRUB_SCRUB_PARSER_COMMENT_HH
