// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/name.hh>
#include <scrub/parser/character.hh>

#include <cctype>

namespace scrub::parser {
namespace detail {

inline int xdigit_value (char c) {
    return std::isdigit (c) ? c - '0' : std::tolower (c) - 'a' + 10;
}

} // namespace detail

//
// The name is stored without the leading solidus and with the #xx escapes
// decoded:
//
template< typename Iterator >
bool name (Iterator, Iterator& iter, Iterator last, name_t& attr) {
    if (iter != last && *iter == '/') {
        std::string s;

        for (++iter; iter != last; ++iter) {
            if (*iter == '#' &&
                std::next (iter) != last && std::isxdigit (*std::next (iter)) &&
                std::next (iter, 2) != last &&
                std::isxdigit (*std::next (iter, 2))) {
                s += char (
                    detail::xdigit_value (*std::next (iter)) * 16 +
                    detail::xdigit_value (*std::next (iter, 2)));
                std::advance (iter, 2);
            }
            else if (is_regular (*iter)) {
                s += *iter;
            }
            else {
                break;
            }
        }

        //
        // The empty name, a lone solidus, is valid:
        //
        return attr = s, true;
    }

    return false;
}

} // scrub::parser
