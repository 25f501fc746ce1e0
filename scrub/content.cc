// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cstring>
#include <sstream>

#include <scrub/content.hh>
#include <scrub/error.hh>
#include <scrub/parser.hh>
#include <scrub/writer.hh>

namespace scrub {
namespace detail {

static const char* expand_key (const std::string& s) {
    static const char* abbreviations [][2] = {
        { "BPC", "BitsPerComponent" },
        { "CS",  "ColorSpace"       },
        { "D",   "Decode"           },
        { "DP",  "DecodeParms"      },
        { "F",   "Filter"           },
        { "H",   "Height"           },
        { "IM",  "ImageMask"        },
        { "I",   "Interpolate"      },
        { "W",   "Width"            },
        { "L",   "Length"           }
    };

    for (const auto& [from, to] : abbreviations) {
        if (s == from) {
            return to;
        }
    }

    return 0;
}

static const char* expand_value (const std::string& s) {
    static const char* abbreviations [][2] = {
        { "G",    "DeviceGray"      },
        { "RGB",  "DeviceRGB"       },
        { "CMYK", "DeviceCMYK"      },
        { "I",    "Indexed"         },
        { "AHx",  "ASCIIHexDecode"  },
        { "A85",  "ASCII85Decode"   },
        { "LZW",  "LZWDecode"       },
        { "Fl",   "FlateDecode"     },
        { "RL",   "RunLengthDecode" },
        { "CCF",  "CCITTFaxDecode"  },
        { "DCT",  "DCTDecode"       }
    };

    for (const auto& [from, to] : abbreviations) {
        if (s == from) {
            return to;
        }
    }

    return 0;
}

static obj_t expand_names (const obj_t& obj) {
    if (auto p = std::get_if< name_t > (&obj)) {
        if (auto s = expand_value (*p)) {
            return name_t (s);
        }
    }
    else if (auto p = std::get_if< array_pointer > (&obj)) {
        auto arr = make< array_t > ();

        for (const auto& x : **p) {
            arr->push_back (expand_names (x));
        }

        return arr;
    }

    return obj;
}

//
// Number of bytes of unfiltered inline image data, -1 if it cannot be
// determined from the image dictionary:
//
static long inline_image_size (const dict_t& dict) {
    if (dict.has ("Filter")) {
        return -1;
    }

    const auto w = dict.get< int > ("Width").value_or (0);
    const auto h = dict.get< int > ("Height").value_or (0);

    if (w <= 0 || h <= 0) {
        return -1;
    }

    int bpc = dict.get< int > ("BitsPerComponent").value_or (8), n = 1;

    if (dict.get< bool > ("ImageMask").value_or (false)) {
        bpc = 1;
    }
    else if (auto p = dict.find ("ColorSpace")) {
        if (is_name (*p, "DeviceRGB") || is_name (*p, "CalRGB")) {
            n = 3;
        }
        else if (is_name (*p, "DeviceCMYK")) {
            n = 4;
        }
        else if (!is< name_t > (*p) && !is< array_pointer > (*p)) {
            return -1;
        }
        else if (auto arr = lookup< array_pointer > (*p)) {
            if (!(*arr)->empty () && !is_name ((**arr) [0], "Indexed")) {
                return -1;
            }
        }
        else if (!is_name (*p, "DeviceGray") && !is_name (*p, "CalGray")) {
            //
            // Named resource, the number of components is unknown here:
            //
            return -1;
        }
    }

    return long (h) * ((long (w) * n * bpc + 7) / 8);
}

template< typename Iterator >
bool inline_image (Iterator first, Iterator& iter, Iterator last, op_t& op) {
    using namespace scrub::parser;

    dict_t dict;

    for (skip (first, iter, last); iter != last; skip (first, iter, last)) {
        if (keyword (first, iter, last, "ID")) {
            break;
        }

        name_t key;

        if (!name (first, iter, last, key)) {
            return false;
        }

        skip (first, iter, last);

        obj_t value;

        if (!any (first, iter, last, value)) {
            return false;
        }

        dict.emplace_back (std::move (key), std::move (value));
    }

    //
    // A single white-space separates the operator from the data:
    //
    if (iter != last && is_space (*iter)) {
        ++iter;
    }

    const auto size = inline_image_size (expand_inline_image (dict));

    Iterator end = last;

    if (size >= 0 && size <= std::distance (iter, last)) {
        end = iter + size;
    }
    else {
        for (auto cur = iter; cur != last; ++cur) {
            if (is_space (*cur) && lookahead (cur + 1, last, "EI") &&
                (cur + 3 == last || !is_regular (cur [3]))) {
                end = cur;
                break;
            }
        }
    }

    op.name = "BI";
    op.args.push_back (make< dict_t > (std::move (dict)));
    op.data.assign (iter, end);

    iter = end;
    skip (first, iter, last);

    if (!keyword (first, iter, last, "EI")) {
        error (errSyntaxWarning, std::distance (first, iter),
               "missing EI after inline image");
    }

    return true;
}

} // namespace detail

dict_t expand_inline_image (const dict_t& src) {
    dict_t dict;

    for (const auto& [key, value] : src) {
        auto s = detail::expand_key (key);
        dict.emplace (s ? s : key, detail::expand_names (value));
    }

    return dict;
}

ops_t parse_content (const std::string& buf) {
    using namespace scrub::parser;

    ops_t ops;
    std::vector< obj_t > args;

    auto first = buf.c_str (), iter = first, last = first + buf.size ();

    size_t errors = 0;

    for (skip (first, iter, last); iter != last; skip (first, iter, last)) {
        obj_t obj;

        if (any (first, iter, last, obj)) {
            args.push_back (std::move (obj));
            continue;
        }

        if (is_regular (*iter)) {
            auto start = iter;
            for (; iter != last && is_regular (*iter); ++iter) ;

            op_t op{ std::string (start, iter), std::move (args), { } };
            args.clear ();

            if (op.name == "BI") {
                if (!scrub::detail::inline_image (
                        first, iter, last, op)) {
                    error (errSyntaxError, std::distance (first, start),
                           "invalid inline image");
                    break;
                }
            }

            ops.push_back (std::move (op));
            continue;
        }

        if (errors++ < 16) {
            error (errSyntaxWarning, std::distance (first, iter),
                   "unexpected '{}' in content stream", *iter);
        }

        ++iter;
    }

    if (!args.empty ()) {
        error (errSyntaxWarning, -1, "operands without operator dropped");
    }

    return ops;
}

std::string serialize_content (const op_t& op) {
    std::stringstream ss;

    if (op.name == "BI") {
        ss << "BI";

        if (!op.args.empty ()) {
            if (auto dict = lookup< dict_pointer > (op.args [0])) {
                for (const auto& [key, value] : **dict) {
                    ss << ' ';
                    write (ss, name_t (key));
                    ss << ' ';
                    write (ss, value);
                }
            }
        }

        ss << " ID ";
        ss.write (op.data.data (), op.data.size ());
        ss << "\nEI";

        return ss.str ();
    }

    for (const auto& arg : op.args) {
        write (ss, arg);
        ss << ' ';
    }

    ss << op.name;

    return ss.str ();
}

std::string serialize_content (const ops_t& ops) {
    std::string buf;

    for (const auto& op : ops) {
        buf += serialize_content (op);
        buf += '\n';
    }

    return buf;
}

} // namespace scrub
