// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_PATTERNS_HH
#define SCRUB_SCRUB_PATTERNS_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

namespace scrub {

struct named_pattern_t {
    const char* name;
    const char* regex;
    const char* description;
};

//
// Patterns of common personal data, in a fixed order:
//
const std::vector< named_pattern_t >& common_patterns ();

std::optional< std::string > common_pattern (const std::string& name);

} // namespace scrub

#endif // SCRUB_SCRUB_PATTERNS_HH
