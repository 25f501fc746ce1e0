// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_EOL_HH
#define SCRUB_SCRUB_PARSER_EOL_HH

#include <defs.hh>

namespace scrub::parser {

template< typename Iterator >
bool eol (Iterator, Iterator&, Iterator);

} // scrub::parser

#include <scrub/parser/eol.cc>

#endif // SCRUB_SCRUB_PARSER_EOL_HH
