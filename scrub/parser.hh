// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_HH
#define SCRUB_SCRUB_PARSER_HH

#include <defs.hh>

#include <scrub/ast.hh>

#include <scrub/parser/fwd.hh>
#include <scrub/parser/any.hh>
#include <scrub/parser/array.hh>
#include <scrub/parser/character.hh>
#include <scrub/parser/comment.hh>
#include <scrub/parser/dict.hh>
#include <scrub/parser/eol.hh>
#include <scrub/parser/error.hh>
#include <scrub/parser/lit.hh>
#include <scrub/parser/lookahead.hh>
#include <scrub/parser/name.hh>
#include <scrub/parser/numeric.hh>
#include <scrub/parser/obj.hh>
#include <scrub/parser/ref.hh>
#include <scrub/parser/skip.hh>
#include <scrub/parser/stream.hh>
#include <scrub/parser/string.hh>
#include <scrub/parser/trailer.hh>
#include <scrub/parser/xref.hh>

#include <tuple>
#include <vector>

namespace scrub {

//
// Raw file contents: the indirect objects in file order, with the offsets of
// their definitions, and the trailer dictionaries merged, latest first:
//
struct doc_t {
    std::tuple< int, int > version{ 1, 4 };
    std::vector< std::tuple< ref_t, obj_t, off_t > > objs;
    dict_t trailer;
};

template< typename Iterator >
bool parse (Iterator, Iterator&, Iterator, doc_t&);

} // namespace scrub

#include <scrub/parser.cc>

#endif // SCRUB_SCRUB_PARSER_HH
