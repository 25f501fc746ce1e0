// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_STRING_HH
#define SCRUB_SCRUB_PARSER_STRING_HH

#include <defs.hh>
#include <scrub/parser/fwd.hh>

namespace scrub::parser {

template< typename Iterator >
bool parenthesized_string (Iterator, Iterator&, Iterator, std::string&);

template< typename Iterator >
bool angular_string (Iterator, Iterator&, Iterator, std::string&);

} // scrub::parser

#include <scrub/parser/string.cc>

#endif // SCRUB_SCRUB_PARSER_STRING_HH
