// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_CONTENT_HH
#define SCRUB_SCRUB_CONTENT_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <scrub/ast.hh>

namespace scrub {

//
// A content stream operator with its operands. Inline images are a single
// `BI' operation, the image dictionary as the only operand (keys as
// spelled in the stream) and the image bytes in `data':
//
struct op_t {
    std::string name;
    std::vector< obj_t > args;
    std::string data;
};

using ops_t = std::vector< op_t >;

//
// Tokenize a content stream; garbage is skipped with a warning, operands
// left without an operator at the end are dropped:
//
ops_t parse_content (const std::string&);

std::string serialize_content (const ops_t&);

std::string serialize_content (const op_t&);

//
// Expand inline image abbreviations, e.g., `/BPC' to `/BitsPerComponent'
// or `/AHx' to `/ASCIIHexDecode':
//
dict_t expand_inline_image (const dict_t&);

} // namespace scrub

#endif // SCRUB_SCRUB_CONTENT_HH
