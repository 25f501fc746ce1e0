// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_NUMERIC_HH
#define SCRUB_SCRUB_PARSER_NUMERIC_HH

#include <defs.hh>
#include <scrub/parser/fwd.hh>

namespace scrub::parser {

template< typename Iterator >
bool bool_ (Iterator, Iterator&, Iterator, bool&);

template< typename Iterator >
bool digit (Iterator, Iterator&, Iterator, int&);

template< typename Iterator >
bool int_ (Iterator, Iterator&, Iterator, int&);

template< typename Iterator >
bool double_ (Iterator, Iterator&, Iterator, double&);

template< typename Iterator >
bool ints (Iterator, Iterator&, Iterator, int&, int&);

} // scrub::parser

#include <scrub/parser/numeric.cc>

#endif // SCRUB_SCRUB_PARSER_NUMERIC_HH
