// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_SKIP_HH
#define SCRUB_SCRUB_PARSER_SKIP_HH

#include <defs.hh>

namespace scrub::parser {

template< typename Iterator >
bool skipws (Iterator, Iterator&, Iterator);

//
// White-space and comments, interleaved:
//
template< typename Iterator >
bool skip (Iterator, Iterator&, Iterator);

} // scrub::parser

#include <scrub/parser/skip.cc>

#define SKIP skipws (first, iter, last)

#endif // SCRUB_SCRUB_PARSER_SKIP_HH
