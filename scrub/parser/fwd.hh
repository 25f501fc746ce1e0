// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_FWD_HH
#define SCRUB_SCRUB_PARSER_FWD_HH

#include <defs.hh>
#include <scrub/ast.hh>

#include <map>
#include <string>
#include <tuple>

#include <sys/types.h>

//
// The grammar is mutually recursive, all productions are declared upfront:
//
namespace scrub::parser {

template< typename Iterator >
bool any (Iterator, Iterator&, Iterator, obj_t&);

template< typename Iterator >
bool array (Iterator, Iterator&, Iterator, array_t&);

template< typename Iterator >
bool dictionary (Iterator, Iterator&, Iterator, dict_t&);

template< typename Iterator >
bool name (Iterator, Iterator&, Iterator, name_t&);

template< typename Iterator >
bool string_ (Iterator, Iterator&, Iterator, string_t&);

template< typename Iterator >
bool ref (Iterator, Iterator&, Iterator, ref_t&);

template< typename Iterator >
bool number (Iterator, Iterator&, Iterator, obj_t&);

template< typename Iterator >
bool stream_ (Iterator, Iterator&, Iterator, const dict_t&, std::string&);

template< typename Iterator >
bool object (Iterator, Iterator&, Iterator, std::tuple< ref_t, obj_t >&);

} // scrub::parser

#endif // SCRUB_SCRUB_PARSER_FWD_HH
