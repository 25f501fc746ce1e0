// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_ERROR_HH
#define SCRUB_SCRUB_PARSER_ERROR_HH

#include <defs.hh>

#include <string>

namespace scrub::parser {

//
// Format a parse error message pointing at the offending position, with
// the surrounding text:
//
template< typename Iterator >
std::string expected (Iterator, Iterator, Iterator, const std::string&);

} // scrub::parser

#include <scrub/parser/error.cc>

#endif // SCRUB_SCRUB_PARSER_ERROR_HH
