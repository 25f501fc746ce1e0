// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_TRAILER_HH
#define SCRUB_SCRUB_PARSER_TRAILER_HH

#include <defs.hh>
#include <scrub/parser/fwd.hh>

namespace scrub::parser {

template< typename Iterator >
bool trailer (Iterator, Iterator&, Iterator, dict_t&);

} // scrub::parser

#include <scrub/parser/trailer.cc>

#endif // SCRUB_SCRUB_PARSER_TRAILER_HH
