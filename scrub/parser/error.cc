// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/error.hh>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace scrub::parser {

template< typename Iterator >
std::string expected (Iterator first, Iterator iter, Iterator last,
                      const std::string& what) {
    const auto line = std::count (first, iter, '\n') + 1;

    first = std::find (
        std::make_reverse_iterator (iter),
        std::make_reverse_iterator (first), '\n').base ();

    const auto col = std::distance (first, iter) + 1;

    std::stringstream ss;
    ss.unsetf (std::ios_base::skipws);

    auto print = [&](unsigned char c) {
        if (std::isprint (c))
            ss << c;
        else
            ss << '\\' << std::setw (3) << std::setfill ('0') << std::oct
               << int (c) << std::dec;
    };

    if (std::distance (first, iter) > 32) {
        first = std::prev (iter, 32);
        ss << "[...]";
    }

    std::for_each (first, iter, print);

    const auto n = ss.tellp ();

    for (size_t i = 0; i < 16 && iter != last && *iter != '\n'; ++iter, ++i) {
        print (*iter);
    }

    std::stringstream out;

    out << line << ":" << col << ": parsing " << what << ":\n"
        << ss.str () << "[...]\n" << std::string (n, '-') << '^';

    return out.str ();
}

} // scrub::parser
