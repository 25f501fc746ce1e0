// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>
#include <deque>
#include <set>
#include <sstream>
#include <vector>

#include <boost/iostreams/filtering_stream.hpp>
namespace io = boost::iostreams;

#include <fmt/format.h>
using fmt::format;

#include <iostreams/asciihex_output_filter.hh>
#include <iostreams/filters.hh>

#include <scrub/document.hh>
#include <scrub/error.hh>
#include <scrub/parser/character.hh>
#include <scrub/writer.hh>

namespace scrub {
namespace detail {

static void write_name (std::ostream& s, const std::string& name) {
    s << '/';

    for (unsigned char c : name) {
        if (c == '#' || c <= ' ' || c >= 0x7F || !parser::is_regular (c)) {
            s << format ("#{:02X}", unsigned (c));
        }
        else {
            s << char (c);
        }
    }
}

static void write_literal_string (std::ostream& s, const std::string& str) {
    s << '(';

    for (unsigned char c : str) {
        switch (c) {
        case '(': case ')': case '\\':
            s << '\\' << char (c);
            break;

        case '\n': s << "\\n"; break;
        case '\r': s << "\\r"; break;
        case '\t': s << "\\t"; break;
        case '\b': s << "\\b"; break;
        case '\f': s << "\\f"; break;

        default:
            if (c < ' ' || c >= 0x7F) {
                s << format ("\\{:03o}", unsigned (c));
            }
            else {
                s << char (c);
            }
            break;
        }
    }

    s << ')';
}

static void write_hex_string (std::ostream& s, const std::string& str) {
    s << '<';

    io::filtering_ostream str_;

    str_.push (iostreams::asciihex_output_filter_t ());
    str_.push (s);

    str_.write (str.data (), str.size ());
    io::close (str_);
}

//
// Objects reachable from the trailer, in ascending number order:
//
static std::set< int > reachable (const document_t& doc) {
    std::set< int > xs;
    std::deque< obj_t > pending;

    for (const auto& [key, value] : doc.trailer ()) {
        pending.push_back (value);
    }

    while (!pending.empty ()) {
        const auto obj = pending.front ();
        pending.pop_front ();

        std::visit (overload_ {
            [&](const ref_t& arg) {
                if (doc.objects ().count (arg.num) &&
                    xs.insert (arg.num).second) {
                    pending.push_back (doc.object (arg.num));
                }
            },
            [&](const array_pointer& arg) {
                pending.insert (pending.end (), arg->begin (), arg->end ());
            },
            [&](const dict_pointer& arg) {
                for (const auto& [key, value] : *arg) {
                    pending.push_back (value);
                }
            },
            [&](const stream_pointer& arg) {
                for (const auto& [key, value] : arg->dict) {
                    pending.push_back (value);
                }
            },
            [](const auto&) { }
        }, obj);
    }

    return xs;
}

} // namespace detail

std::string format_number (double x) {
    if (std::isnan (x) || std::isinf (x)) {
        return "0";
    }

    if (x == std::floor (x) && std::fabs (x) < 1e15) {
        return format ("{}", (long long)x);
    }

    auto s = format ("{:.6f}", x);

    s.erase (s.find_last_not_of ('0') + 1);

    if (s.back () == '.') {
        s.pop_back ();
    }

    return s == "-0" ? "0" : s;
}

void write (std::ostream& s, const obj_t& obj, const std::map< int, int >* renum) {
    std::visit (overload_ {
        [&](const null_t&) { s << "null"; },
        [&](bool arg) { s << (arg ? "true" : "false"); },
        [&](int arg) { s << arg; },
        [&](double arg) { s << format_number (arg); },
        [&](const name_t& arg) { detail::write_name (s, arg); },
        [&](const string_t& arg) {
            if (arg.hex) {
                detail::write_hex_string (s, arg);
            }
            else {
                detail::write_literal_string (s, arg);
            }
        },
        [&](const ref_t& arg) {
            if (renum) {
                auto iter = renum->find (arg.num);

                if (iter == renum->end ()) {
                    s << "null";
                }
                else {
                    s << iter->second << " 0 R";
                }
            }
            else {
                s << arg.num << ' ' << arg.gen << " R";
            }
        },
        [&](const array_pointer& arg) {
            s << '[';

            for (size_t i = 0; i < arg->size (); ++i) {
                if (i) {
                    s << ' ';
                }

                write (s, (*arg) [i], renum);
            }

            s << ']';
        },
        [&](const dict_pointer& arg) {
            s << "<<";

            for (const auto& [key, value] : *arg) {
                detail::write_name (s, key);
                s << ' ';
                write (s, value, renum);
            }

            s << ">>";
        },
        [&](const stream_pointer& arg) {
            dict_t dict = arg->dict;
            dict.emplace ("Length", int (arg->data.size ()));

            write (s, make< dict_t > (std::move (dict)), renum);

            s << "\nstream\n";
            s.write (arg->data.data (), arg->data.size ());
            s << "\nendstream";
        }
    }, obj);
}

std::string to_string (const obj_t& obj) {
    std::stringstream ss;
    write (ss, obj);
    return ss.str ();
}

void write_document (std::ostream& s, const document_t& doc,
                     const save_options_t& opts) {
    std::map< int, int > renum;

    if (opts.garbage_collect) {
        int n = 0;

        for (auto num : detail::reachable (doc)) {
            renum [num] = ++n;
        }
    }
    else {
        for (const auto& [num, obj] : doc.objects ()) {
            renum [num] = num;
        }
    }

    const int size = renum.empty () ? 1 : renum.rbegin ()->second + 1;
    std::vector< off_t > offsets (size, -1);

    std::stringstream ss;

    ss << "%PDF-" << std::get< 0 > (doc.version ()) << '.'
       << (std::max) (std::get< 1 > (doc.version ()), 4)
       << "\n%\xE2\xE3\xCF\xD3\n";

    for (const auto& [num, newnum] : renum) {
        auto obj = doc.object (num);

        if (auto p = std::get_if< stream_pointer > (&obj)) {
            const auto& stream = **p;

            if (opts.compress && !stream.dict.has ("Filter") &&
                !stream.data.empty ()) {
                auto other = make< stream_t > (stream);

                other->data = iostreams::deflate (stream.data);
                other->dict.emplace ("Filter", name_t ("FlateDecode"));
                other->dict.erase ("DecodeParms");

                obj = other;
            }
        }

        offsets [newnum] = ss.tellp ();

        ss << newnum << " 0 obj\n";
        write (ss, obj, &renum);
        ss << "\nendobj\n";
    }

    const off_t xref = ss.tellp ();

    ss << "xref\n0 " << size << "\n";
    ss << "0000000000 65535 f \n";

    for (int i = 1; i < size; ++i) {
        if (offsets [i] < 0) {
            ss << "0000000000 00001 f \n";
        }
        else {
            ss << format ("{:010d} 00000 n \n", (long long)offsets [i]);
        }
    }

    dict_t trailer;
    trailer.emplace ("Size", size);

    for (const auto& [key, value] : doc.trailer ()) {
        trailer.emplace (key, value);
    }

    ss << "trailer\n";
    write (ss, make< dict_t > (std::move (trailer)), &renum);
    ss << "\nstartxref\n" << xref << "\n%%EOF\n";

    s << ss.rdbuf ();
}

} // namespace scrub
