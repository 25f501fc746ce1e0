// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_STREAM_HH
#define SCRUB_SCRUB_PARSER_STREAM_HH

#include <defs.hh>
#include <scrub/parser/fwd.hh>

namespace scrub::parser {

template< typename Iterator >
bool streambuf_ (Iterator, Iterator&, Iterator, std::string&);

} // scrub::parser

#include <scrub/parser/stream.cc>

#endif // SCRUB_SCRUB_PARSER_STREAM_HH
