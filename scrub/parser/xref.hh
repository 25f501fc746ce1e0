// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_XREF_HH
#define SCRUB_SCRUB_PARSER_XREF_HH

#include <defs.hh>
#include <scrub/parser/fwd.hh>

#include <map>

namespace scrub::parser {

template< typename Iterator >
bool startxref (Iterator, Iterator&, Iterator, off_t&);

template< typename Iterator >
bool xrefs (Iterator, Iterator&, Iterator, std::map< int, off_t >&);

} // scrub::parser

#include <scrub/parser/xref.cc>

#endif // SCRUB_SCRUB_PARSER_XREF_HH
