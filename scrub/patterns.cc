// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <scrub/patterns.hh>

namespace scrub {

const std::vector< named_pattern_t >& common_patterns () {
    static const std::vector< named_pattern_t > patterns{
        { "ssn", R"(\b\d{3}-\d{2}-\d{4}\b)",
          "US social security number, hyphenated" },

        { "ssn_nohyphen", R"(\b\d{9}\b)",
          "nine-digit number" },

        { "email", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",
          "e-mail address" },

        { "phone", R"(\b\(?(\d{3})\)?[-.\s]?(\d{3})[-.\s]?(\d{4})\b)",
          "North American phone number" },

        { "credit_card", R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)",
          "16-digit card number" },

        { "ip_address", R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)",
          "IPv4 address" },

        { "date", R"(\b\d{1,2}[/-]\d{1,2}[/-]\d{2,4}\b)",
          "numeric date" },

        { "zip_code", R"(\b\d{5}(?:-\d{4})?\b)",
          "US ZIP code" }
    };

    return patterns;
}

std::optional< std::string > common_pattern (const std::string& name) {
    for (const auto& pattern : common_patterns ()) {
        if (name == pattern.name) {
            return std::string (pattern.regex);
        }
    }

    return { };
}

} // namespace scrub
