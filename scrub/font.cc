// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>
#include <cstring>
#include <tuple>

#include <scrub/content.hh>
#include <scrub/document.hh>
#include <scrub/error.hh>
#include <scrub/font.hh>
#include <scrub/font_tables.hh>

namespace scrub {
namespace detail {

static unsigned code_of (const std::string& s) {
    unsigned code = 0;

    for (unsigned char c : s) {
        code = (code << 8) | c;
    }

    return code;
}

static std::u32string utf16be (const std::string& s) {
    std::u32string result;

    for (size_t i = 0; i + 1 < s.size (); i += 2) {
        char32_t c = ((unsigned char)s [i] << 8) | (unsigned char)s [i + 1];

        if (c >= 0xD800 && c < 0xDC00 && i + 3 < s.size ()) {
            const char32_t d =
                ((unsigned char)s [i + 2] << 8) | (unsigned char)s [i + 3];

            if (d >= 0xDC00 && d < 0xE000) {
                c = 0x10000 + ((c - 0xD800) << 10) + (d - 0xDC00);
                i += 2;
            }
        }

        result += c;
    }

    //
    // Single byte destinations are seen in the wild:
    //
    if (s.size () == 1) {
        result += char32_t ((unsigned char)s [0]);
    }

    return result;
}

static const char** base_encoding (const std::string& s) {
    if (s == "WinAnsiEncoding") {
        return win_ansi_encoding;
    }
    else if (s == "MacRomanEncoding") {
        return mac_roman_encoding;
    }
    else if (s == "StandardEncoding") {
        return standard_encoding;
    }

    return 0;
}

} // namespace detail

font_pointer font_t::load (const document_t& doc, const dict_pointer& dict) {
    auto font = std::make_shared< font_t > ();

    if (!dict) {
        error (errSyntaxWarning, -1, "missing font dictionary");
        font->default_width_ = 500;
        return font;
    }

    const auto subtype = doc.get< name_t > (*dict, "Subtype").value_or (
        name_t ("Type1"));

    font->base_name_ = doc.get< name_t > (*dict, "BaseFont").value_or (
        name_t ());

    if (subtype == "Type0") {
        font->kind_ = font_kind_t::cid;
        font->code_bytes_ = 2;

        dict_pointer descendant;

        if (auto arr = doc.get< array_pointer > (*dict, "DescendantFonts")) {
            if (!(*arr)->empty ()) {
                descendant = doc.dict_of ((**arr) [0]);
            }
        }

        if (descendant) {
            font->load_descriptor (doc, *descendant);
            font->load_cid_widths (doc, *descendant);

            if (auto p = descendant->find ("CIDToGIDMap")) {
                if (auto stream = doc.lookup< stream_pointer > (*p)) {
                    if (auto data = doc.decode (**stream)) {
                        for (size_t i = 0; i + 1 < data->size (); i += 2) {
                            font->cid_to_gid_.push_back (
                                ((unsigned char)(*data) [i] << 8) |
                                (unsigned char)(*data) [i + 1]);
                        }
                    }
                }
            }
        }
        else {
            error (errSyntaxWarning, -1, "font '{}' has no descendant",
                   font->base_name_);
            font->default_width_ = 1000;
        }
    }
    else {
        if (subtype == "Type3") {
            font->kind_ = font_kind_t::type3;

            if (auto arr = doc.get< array_pointer > (*dict, "FontMatrix")) {
                if ((*arr)->size () == 6) {
                    double m [6];

                    for (size_t i = 0; i < 6; ++i) {
                        m [i] = doc.lookup< double > ((**arr) [i]).value_or (0);
                    }

                    font->font_matrix_ = { m [0], m [1], m [2], m [3], m [4], m [5] };
                }
            }

            if (auto p = doc.get< dict_pointer > (*dict, "CharProcs")) {
                font->char_procs_ = *p;
            }

            if (auto p = dict->find ("Resources")) {
                font->resources_ = doc.dict_of (*p);
            }

            if (auto arr = doc.get< array_pointer > (*dict, "FontBBox")) {
                if ((*arr)->size () == 4) {
                    const auto y0 = doc.lookup< double > ((**arr) [1]).value_or (0);
                    const auto y1 = doc.lookup< double > ((**arr) [3]).value_or (0);

                    const auto a = transform (font->font_matrix_, 0, y1);
                    const auto b = transform (font->font_matrix_, 0, y0);

                    if (a.y > b.y) {
                        font->ascent_ = a.y;
                        font->descent_ = b.y;
                    }
                }
            }
        }
        else {
            font->load_descriptor (doc, *dict);
        }

        font->load_encoding (doc, *dict);
        font->load_simple_widths (doc, *dict);
    }

    if (auto p = dict->find ("ToUnicode")) {
        font->load_to_unicode (doc, *p);
    }

    return font;
}

void font_t::load_descriptor (const document_t& doc, const dict_t& dict) {
    const auto builtin = find_builtin_font (base_name_.c_str ());

    if (builtin) {
        ascent_ = builtin->ascent / 1000.;
        descent_ = builtin->descent / 1000.;
    }

    auto p = dict.find ("FontDescriptor");

    if (0 == p) {
        symbolic_ = builtin && !builtin->widths;
        return;
    }

    auto desc = doc.dict_of (*p);

    if (!desc) {
        return;
    }

    symbolic_ = doc.get< int > (*desc, "Flags").value_or (0) & 4;

    if (auto x = doc.get< double > (*desc, "Ascent")) {
        if (*x > 0) {
            ascent_ = *x / 1000;
        }
    }

    if (auto x = doc.get< double > (*desc, "Descent")) {
        if (*x != 0) {
            descent_ = -std::fabs (*x) / 1000;
        }
    }

    if (auto x = doc.get< double > (*desc, "MissingWidth")) {
        default_width_ = *x;
    }

    static const std::tuple< const char*, font_program_t > files [] = {
        { "FontFile",  font_program_t::type1    },
        { "FontFile2", font_program_t::truetype },
        { "FontFile3", font_program_t::cff      }
    };

    for (const auto& [key, type] : files) {
        if (auto stream = doc.get< stream_pointer > (*desc, key)) {
            if (auto data = doc.decode (**stream)) {
                program_ = std::move (*data);
                program_type_ = type;
            }
            else {
                error (errSyntaxWarning, -1,
                       "undecodable font program in '{}'", base_name_);
            }

            break;
        }
    }
}

void font_t::load_encoding (const document_t& doc, const dict_t& dict) {
    const char** base = 0;

    if (kind_ != font_kind_t::type3 &&
        (!symbolic_ || program_type_ == font_program_t::none)) {
        base = standard_encoding;
    }

    //
    // Symbol and ZapfDingbats carry their own encodings:
    //
    if (auto builtin = find_builtin_font (base_name_.c_str ())) {
        if (!builtin->widths && program_type_ == font_program_t::none &&
            strcmp (builtin->name, "Courier")) {
            base = 0;
        }
    }

    auto obj = doc.resolve (dict.has ("Encoding") ? dict.at ("Encoding") : obj_t{ });

    dict_pointer encoding;

    if (auto p = std::get_if< name_t > (&obj)) {
        if (auto other = detail::base_encoding (*p)) {
            base = other;
        }
    }
    else if (auto p = std::get_if< dict_pointer > (&obj)) {
        encoding = *p;

        if (auto name = doc.get< name_t > (*encoding, "BaseEncoding")) {
            if (auto other = detail::base_encoding (*name)) {
                base = other;
            }
        }
    }

    names_.assign (256, std::string ());

    if (base) {
        for (size_t i = 0; i < 256; ++i) {
            if (base [i]) {
                names_ [i] = base [i];
            }
        }
    }

    if (encoding) {
        if (auto arr = doc.get< array_pointer > (*encoding, "Differences")) {
            int code = 0;

            for (const auto& x : **arr) {
                const auto obj = doc.resolve (x);

                if (auto n = std::get_if< int > (&obj)) {
                    code = *n;
                }
                else if (auto s = std::get_if< name_t > (&obj)) {
                    if (code >= 0 && code < 256) {
                        names_ [code] = *s;
                    }

                    ++code;
                }
            }
        }
    }
}

void font_t::load_simple_widths (const document_t& doc, const dict_t& dict) {
    auto arr = doc.get< array_pointer > (dict, "Widths");

    if (arr) {
        const auto first = doc.get< int > (dict, "FirstChar").value_or (0);

        for (size_t i = 0; i < (*arr)->size (); ++i) {
            if (auto w = doc.lookup< double > ((**arr) [i])) {
                widths_ [first + i] = *w;
            }
        }

        return;
    }

    if (kind_ == font_kind_t::type3) {
        error (errSyntaxWarning, -1, "Type 3 font without widths");
        return;
    }

    //
    // Standard 14 font without widths, metrics from the builtin tables:
    //
    auto builtin = find_builtin_font (base_name_.c_str ());

    if (0 == builtin) {
        builtin = find_builtin_font ("Helvetica");

        error (errSyntaxWarning, -1,
               "font '{}' without widths, using Helvetica metrics",
               base_name_);
    }

    default_width_ = builtin->default_width;

    for (unsigned code = 0; code < 256; ++code) {
        if (!names_ [code].empty ()) {
            widths_ [code] = builtin_width (*builtin, names_ [code].c_str ());
        }
    }
}

void font_t::load_cid_widths (const document_t& doc, const dict_t& dict) {
    default_width_ = doc.get< double > (dict, "DW").value_or (1000);

    auto arr = doc.get< array_pointer > (dict, "W");

    if (!arr) {
        return;
    }

    const auto& xs = **arr;

    for (size_t i = 0; i < xs.size (); ) {
        auto first = doc.lookup< int > (xs [i]);

        if (!first || i + 1 >= xs.size ()) {
            break;
        }

        const auto next = doc.resolve (xs [i + 1]);

        if (auto ws = std::get_if< array_pointer > (&next)) {
            unsigned cid = *first;

            for (const auto& w : **ws) {
                widths_ [cid++] = doc.lookup< double > (w).value_or (
                    default_width_);
            }

            i += 2;
        }
        else if (i + 2 < xs.size ()) {
            const auto last = lookup< int > (next).value_or (-1);
            const auto w = doc.lookup< double > (xs [i + 2]).value_or (
                default_width_);

            if (last >= *first && last - *first < 65536) {
                for (int cid = *first; cid <= last; ++cid) {
                    widths_ [cid] = w;
                }
            }

            i += 3;
        }
        else {
            break;
        }
    }
}

void font_t::load_to_unicode (const document_t& doc, const obj_t& obj) {
    auto stream = doc.lookup< stream_pointer > (obj);

    if (!stream) {
        return;
    }

    const auto data = doc.decode (**stream);

    if (!data) {
        error (errSyntaxWarning, -1, "undecodable ToUnicode map in '{}'",
               base_name_);
        return;
    }

    for (const auto& op : parse_content (*data)) {
        const auto& args = op.args;

        if (op.name == "endcodespacerange") {
            if (kind_ == font_kind_t::cid && !args.empty ()) {
                if (auto s = lookup< string_t > (args [0])) {
                    if (s->size () == 1 || s->size () == 2) {
                        code_bytes_ = int (s->size ());
                    }
                }
            }
        }
        else if (op.name == "endbfchar") {
            for (size_t i = 0; i + 1 < args.size (); i += 2) {
                auto src = lookup< string_t > (args [i]);
                auto dst = lookup< string_t > (args [i + 1]);

                if (src && dst) {
                    to_unicode_ [detail::code_of (*src)] = detail::utf16be (*dst);
                }
                else if (src) {
                    if (auto name = lookup< name_t > (args [i + 1])) {
                        if (auto c = glyph_unicode (name->c_str ())) {
                            to_unicode_ [detail::code_of (*src)] = { c };
                        }
                    }
                }
            }
        }
        else if (op.name == "endbfrange") {
            for (size_t i = 0; i + 2 < args.size (); i += 3) {
                auto lo = lookup< string_t > (args [i]);
                auto hi = lookup< string_t > (args [i + 1]);

                if (!lo || !hi) {
                    continue;
                }

                const auto first = detail::code_of (*lo);
                const auto last = detail::code_of (*hi);

                if (last < first || last - first > 65535) {
                    continue;
                }

                if (auto dst = lookup< string_t > (args [i + 2])) {
                    auto text = detail::utf16be (*dst);

                    for (auto code = first; code <= last; ++code) {
                        to_unicode_ [code] = text;

                        if (!text.empty ()) {
                            ++text.back ();
                        }
                    }
                }
                else if (auto arr = lookup< array_pointer > (args [i + 2])) {
                    auto code = first;

                    for (const auto& x : **arr) {
                        if (code > last) {
                            break;
                        }

                        if (auto s = lookup< string_t > (x)) {
                            to_unicode_ [code] = detail::utf16be (*s);
                        }

                        ++code;
                    }
                }
            }
        }
    }
}

double font_t::width_of (unsigned code) const {
    auto iter = widths_.find (code);
    return iter == widths_.end () ? default_width_ : iter->second;
}

std::u32string font_t::text_of (unsigned code) const {
    {
        auto iter = to_unicode_.find (code);

        if (iter != to_unicode_.end ()) {
            return iter->second;
        }
    }

    if (kind_ == font_kind_t::cid) {
        return { };
    }

    if (auto name = glyph_name (code)) {
        if (auto c = glyph_unicode (name)) {
            return { c };
        }
    }

    if (code >= 32 && code < 127 && (names_.empty () || names_ [code].empty ())) {
        return { char32_t (code) };
    }

    return { };
}

std::vector< glyph_t > font_t::decode (const std::string& s) const {
    std::vector< glyph_t > xs;

    for (size_t i = 0; i < s.size (); ) {
        const size_t n =
            code_bytes_ == 2 && i + 1 < s.size () ? 2 : 1;

        auto bytes = s.substr (i, n);
        const auto code = detail::code_of (bytes);

        xs.push_back ({
            code, std::move (bytes), text_of (code),
            width_of (code) * font_matrix_.a,
            n == 1 && code == 32
        });

        i += n;
    }

    return xs;
}

const char* font_t::glyph_name (unsigned code) const {
    if (kind_ == font_kind_t::cid || code >= names_.size ()) {
        return 0;
    }

    return names_ [code].empty () ? 0 : names_ [code].c_str ();
}

unsigned font_t::cid_to_gid (unsigned cid) const {
    if (cid_to_gid_.empty ()) {
        return cid;
    }

    return cid < cid_to_gid_.size () ? cid_to_gid_ [cid] : 0;
}

} // namespace scrub
