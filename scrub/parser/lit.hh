// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_LIT_HH
#define SCRUB_SCRUB_PARSER_LIT_HH

#include <defs.hh>

#include <string>

namespace scrub::parser {

template< typename Iterator >
bool lit (Iterator, Iterator&, Iterator, const std::string&);

template< typename Iterator >
bool lit (Iterator, Iterator&, Iterator, char);

//
// A keyword is a literal not followed by a regular character:
//
template< typename Iterator >
bool keyword (Iterator, Iterator&, Iterator, const std::string&);

} // scrub::parser

#include <scrub/parser/lit.cc>

#endif // SCRUB_SCRUB_PARSER_LIT_HH
