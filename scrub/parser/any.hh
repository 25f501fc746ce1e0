// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_ANY_HH
#define SCRUB_SCRUB_PARSER_ANY_HH

#include <defs.hh>
#include <scrub/parser/fwd.hh>

#include <scrub/parser/any.cc>

#endif // SCRUB_SCRUB_PARSER_ANY_HH
