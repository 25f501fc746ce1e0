// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/string.hh>
#include <scrub/parser/character.hh>
#include <scrub/parser/lookahead.hh>
#include <scrub/parser/name.hh>

namespace scrub::parser {

template< typename Iterator >
bool parenthesized_string (Iterator, Iterator& iter, Iterator last,
                           std::string& attr) {
    if (iter == last || *iter != '(') {
        return false;
    }

    std::string s;
    int depth = 1;

    for (++iter; iter != last; ++iter) {
        char c = *iter;

        switch (c) {
        case '(':
            ++depth;
            break;

        case ')':
            if (0 == --depth) {
                ++iter;
                return attr = std::move (s), true;
            }
            break;

        case '\r':
            //
            // Any end-of-line sequence reads as a single line feed:
            //
            if (std::next (iter) != last && *std::next (iter) == '\n') {
                ++iter;
            }

            c = '\n';
            break;

        case '\\': {
            if (++iter == last) {
                return false;
            }

            switch (c = *iter) {
            case 'n': c = '\n'; break;
            case 'r': c = '\r'; break;
            case 't': c = '\t'; break;
            case 'b': c = '\b'; break;
            case 'f': c = '\f'; break;

            case '\r':
                if (std::next (iter) != last && *std::next (iter) == '\n') {
                    ++iter;
                }
                // fall through

            case '\n':
                // line continuation
                continue;

            case '0': case '1': case '2': case '3':
            case '4': case '5': case '6': case '7': {
                int n = c - '0';

                for (int i = 0; i < 2 && std::next (iter) != last &&
                         *std::next (iter) >= '0' && *std::next (iter) <= '7';
                     ++i) {
                    n = n * 8 + (*++iter - '0');
                }

                c = char (n & 0xFF);
            }
                break;

            default:
                // the backslash is ignored
                break;
            }
        }
            break;

        default:
            break;
        }

        s += c;
    }

    return false;
}

template< typename Iterator >
bool angular_string (Iterator, Iterator& iter, Iterator last,
                     std::string& attr) {
    if (iter == last || *iter != '<') {
        return false;
    }

    std::string s;

    int nibble = -1;

    for (++iter; iter != last; ++iter) {
        const char c = *iter;

        if (c == '>') {
            //
            // A missing final digit is taken to be 0:
            //
            if (nibble >= 0) {
                s += char (nibble << 4);
            }

            ++iter;
            return attr = std::move (s), true;
        }
        else if (std::isxdigit (c)) {
            const int x = detail::xdigit_value (c);

            if (nibble < 0) {
                nibble = x;
            }
            else {
                s += char ((nibble << 4) | x);
                nibble = -1;
            }
        }
        else if (!is_space (c)) {
            return false;
        }
    }

    return false;
}

template< typename Iterator >
bool string_ (Iterator first, Iterator& iter, Iterator last, string_t& attr) {
    std::string s;

    if (lookahead (iter, last, '(')) {
        if (parenthesized_string (first, iter, last, s)) {
            attr = std::move (s);
            attr.hex = false;
            return true;
        }
    }
    else if (lookahead (iter, last, '<')) {
        if (angular_string (first, iter, last, s)) {
            attr = std::move (s);
            attr.hex = true;
            return true;
        }
    }

    return false;
}

} // scrub::parser
