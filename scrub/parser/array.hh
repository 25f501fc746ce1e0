// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_ARRAY_HH
#define SCRUB_SCRUB_PARSER_ARRAY_HH

#include <defs.hh>
#include <scrub/parser/fwd.hh>

#include <scrub/parser/array.cc>

#endif // SCRUB_SCRUB_PARSER_ARRAY_HH
