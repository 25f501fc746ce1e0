// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_DICT_HH
#define SCRUB_SCRUB_PARSER_DICT_HH

#include <defs.hh>
#include <scrub/parser/fwd.hh>

namespace scrub::parser {

template< typename Iterator >
bool definition (Iterator, Iterator&, Iterator, std::tuple< name_t, obj_t >&);

} // scrub::parser

#include <scrub/parser/dict.cc>

#endif // SCRUB_SCRUB_PARSER_DICT_HH
