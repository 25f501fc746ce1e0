// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_WRITER_HH
#define SCRUB_SCRUB_WRITER_HH

#include <defs.hh>

#include <map>
#include <ostream>
#include <string>

#include <scrub/ast.hh>

namespace scrub {

struct document_t;
struct save_options_t;

//
// PDF syntax for a direct object. References are written through `renum'
// when given, a reference to an object missing from it is written as null:
//
void write (std::ostream&, const obj_t&, const std::map< int, int >* renum = 0);

std::string to_string (const obj_t&);

//
// Numbers as written in content streams and files, reals with at most six
// decimals and no trailing zeros:
//
std::string format_number (double);

//
// Complete file: header, objects, cross-reference table and trailer:
//
void write_document (std::ostream&, const document_t&, const save_options_t&);

} // namespace scrub

#endif // SCRUB_SCRUB_WRITER_HH
