// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_VERIFY_HH
#define SCRUB_SCRUB_VERIFY_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <utils/path.hh>

namespace scrub {

//
// The terms (`term: <t>') and patterns (`regex: <p>') still found in the
// text of the document; `verification_error: <cause>' if the document
// cannot be read. Empty when the redaction is complete:
//
std::vector< std::string >
verify_redaction (const fs::path&, const std::vector< std::string >& terms,
                  const std::vector< std::string >& patterns);

//
// The terms found in the printable runs of the raw file bytes and of the
// decoded streams:
//
std::vector< std::string >
strings_check (const fs::path&, const std::vector< std::string >& terms,
               size_t min_length = SCRUB_STRINGS_MIN_LENGTH);

//
// Printable runs of at least `min_length' characters, one per line:
//
std::string printable_runs (const std::string&, size_t min_length);

} // namespace scrub

#endif // SCRUB_SCRUB_VERIFY_HH
