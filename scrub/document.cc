// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <fstream>
#include <functional>
#include <set>
#include <sstream>

#include <boost/iostreams/device/mapped_file.hpp>
#include <boost/iostreams/filter/zlib.hpp>
namespace io = boost::iostreams;

#include <boost/scope_exit.hpp>

#include <fmt/format.h>
using fmt::format;

#include <iostreams/ascii85_input_filter.hh>
#include <iostreams/asciihex_input_filter.hh>
#include <iostreams/filters.hh>
#include <iostreams/runlength_input_filter.hh>

#include <scrub/document.hh>
#include <scrub/error.hh>
#include <scrub/parser.hh>
#include <scrub/writer.hh>

namespace scrub {
namespace detail {

//
// Number of the first object and byte offset pairs of an object stream
// header:
//
static std::vector< std::tuple< int, int > >
objstm_header (const std::string& data, int n) {
    std::vector< std::tuple< int, int > > xs;

    auto first = data.c_str (), iter = first, last = first + data.size ();

    for (int i = 0; i < n; ++i) {
        int num, off;

        parser::skip (first, iter, last);

        if (!parser::int_ (first, iter, last, num)) {
            break;
        }

        parser::skip (first, iter, last);

        if (!parser::int_ (first, iter, last, off)) {
            break;
        }

        xs.emplace_back (num, off);
    }

    return xs;
}

static bool is_image_filter (const std::string& s) {
    return
        s == "DCTDecode"      || s == "DCT" ||
        s == "JPXDecode"      ||
        s == "JBIG2Decode"    ||
        s == "CCITTFaxDecode" || s == "CCF";
}

static std::string
unpredict (const document_t& doc, const std::string& data,
           const dict_pointer& parms) {
    if (!parms) {
        return data;
    }

    const auto predictor = doc.get< int > (*parms, "Predictor").value_or (1);

    if (predictor < 2) {
        return data;
    }

    return iostreams::unpredict (
        data, predictor,
        doc.get< int > (*parms, "Colors").value_or (1),
        doc.get< int > (*parms, "BitsPerComponent").value_or (8),
        doc.get< int > (*parms, "Columns").value_or (1));
}

} // namespace detail

document_t::document_t () { }

document_t document_t::open (const fs::path& path, bool allow_encrypted) {
    if (!fs::is_regular_file (path)) {
        throw document_error (format ("{}: no such file", path.string ()));
    }

    if (0 == fs::file_size (path)) {
        throw document_error (format ("{}: empty file", path.string ()));
    }

    std::string buf;

    try {
        io::mapped_file_source src (path.string ());
        buf.assign (src.data (), src.size ());
    }
    catch (const std::ios_base::failure& e) {
        throw document_error (format ("{}: {}", path.string (), e.what ()));
    }

    return load (buf, allow_encrypted);
}

document_t document_t::load (const std::string& buf, bool allow_encrypted) {
    doc_t doc;

    {
        auto first = buf.c_str (), iter = first, last = first + buf.size ();

        if (!parse (first, iter, last, doc)) {
            throw document_error ("not a PDF file");
        }
    }

    document_t self;
    self.version_ = doc.version;

    //
    // Position of the definition in effect for each object number; objects
    // from an object stream are positioned at the stream:
    //
    std::map< int, off_t > where;
    std::vector< std::tuple< off_t, stream_pointer > > objstms;

    for (auto& [ref, obj, off] : doc.objs) {
        if (auto p = std::get_if< stream_pointer > (&obj)) {
            if ((*p)->dict.is ("ObjStm")) {
                objstms.emplace_back (off, *p);
            }
        }

        auto iter = where.find (ref.num);

        if (iter == where.end () || iter->second <= off) {
            where [ref.num] = off;
            self.objs_ [ref.num] = std::move (obj);
        }
    }

    for (auto& [off, stm] : objstms) {
        const auto data = self.decode (*stm);

        if (!data) {
            error (errSyntaxError, off, "undecodable object stream");
            continue;
        }

        const auto n = stm->dict.get< int > ("N").value_or (0);
        const auto start = stm->dict.get< int > ("First").value_or (0);

        for (auto [num, pos] : detail::objstm_header (*data, n)) {
            auto iter = where.find (num);

            if (iter != where.end () && iter->second > off) {
                continue;
            }

            if (size_t (start) + pos >= data->size ()) {
                error (errSyntaxWarning, off,
                       "object {} out of its object stream", num);
                continue;
            }

            auto first = data->c_str (), last = first + data->size ();
            auto cur = first + start + pos;

            obj_t obj;

            if (!parser::any (first, cur, last, obj)) {
                error (errSyntaxWarning, off,
                       "object {} in object stream unparseable", num);
                continue;
            }

            where [num] = off;
            self.objs_ [num] = std::move (obj);
        }
    }

    //
    // The containers are not part of the rewritten document:
    //
    for (auto iter = self.objs_.begin (); iter != self.objs_.end (); ) {
        auto p = std::get_if< stream_pointer > (&iter->second);

        if (p && ((*p)->dict.is ("ObjStm") || (*p)->dict.is ("XRef"))) {
            iter = self.objs_.erase (iter);
        }
        else {
            ++iter;
        }
    }

    for (const char* key : { "Root", "Info", "ID", "Encrypt" }) {
        if (auto p = doc.trailer.find (key)) {
            self.trailer_.emplace (key, *p);
        }
    }

    if (self.encrypted () && !allow_encrypted) {
        throw document_error ("encrypted documents are not supported");
    }

    if (!self.trailer_.has ("Root")) {
        //
        // Damaged file, look for the catalog among the objects:
        //
        for (const auto& [num, obj] : self.objs_) {
            auto p = std::get_if< dict_pointer > (&obj);

            if (p && (*p)->is ("Catalog")) {
                error (errSyntaxWarning, -1,
                       "missing trailer root, using object {}", num);
                self.trailer_.emplace ("Root", ref_t{ num, 0 });
                break;
            }
        }
    }

    return self;
}

obj_t document_t::object (int num) const {
    auto iter = objs_.find (num);
    return iter == objs_.end () ? obj_t{ } : iter->second;
}

obj_t document_t::resolve (const obj_t& obj) const {
    obj_t result = obj;

    for (int hops = 0; hops < 32; ++hops) {
        auto p = std::get_if< ref_t > (&result);

        if (0 == p) {
            return result;
        }

        result = object (p->num);
    }

    error (errSyntaxError, -1, "reference loop");
    return null_t{ };
}

dict_pointer document_t::dict_of (const obj_t& arg) const {
    const auto obj = resolve (arg);

    if (auto p = std::get_if< dict_pointer > (&obj)) {
        return *p;
    }
    else if (auto p = std::get_if< stream_pointer > (&obj)) {
        return dict_pointer (*p, &(*p)->dict);
    }

    return { };
}

ref_t document_t::add (obj_t obj) {
    const int num = objs_.empty () ? 1 : objs_.rbegin ()->first + 1;
    objs_ [num] = std::move (obj);
    return { num, 0 };
}

void document_t::replace (const ref_t& ref, obj_t obj) {
    objs_ [ref.num] = std::move (obj);
}

dict_pointer document_t::catalog () const {
    auto p = trailer_.find ("Root");

    if (0 == p) {
        throw document_error ("missing document catalog");
    }

    auto dict = dict_of (*p);

    if (!dict) {
        throw document_error ("invalid document catalog");
    }

    return dict;
}

dict_pointer document_t::info () const {
    auto p = trailer_.find ("Info");
    return p ? dict_of (*p) : dict_pointer{ };
}

std::vector< page_ref_t > document_t::pages () const {
    std::vector< page_ref_t > xs;
    std::set< int > visited;

    std::function< void (const obj_t&, int) > walk =
        [&](const obj_t& node, int depth) {
        ref_t ref{ 0, 0 };

        if (auto p = std::get_if< ref_t > (&node)) {
            if (!visited.insert (p->num).second) {
                error (errSyntaxError, -1, "loop in the page tree");
                return;
            }

            ref = *p;
        }

        auto dict = dict_of (node);

        if (!dict) {
            error (errSyntaxWarning, -1, "invalid page tree node");
            return;
        }

        auto kids = get< array_pointer > (*dict, "Kids");

        if (kids && !dict->is ("Page")) {
            if (depth > 64) {
                error (errSyntaxError, -1, "page tree too deep");
                return;
            }

            for (const auto& kid : **kids) {
                walk (kid, depth + 1);
            }
        }
        else {
            xs.push_back ({ ref, dict });
        }
    };

    auto p = catalog ()->find ("Pages");

    if (0 == p) {
        throw document_error ("missing page tree");
    }

    walk (*p, 0);

    return xs;
}

std::optional< std::string >
document_t::decode (const stream_t& stream, std::string* image_filter) const {
    std::vector< std::string > filters;
    std::vector< dict_pointer > parms;

    {
        const auto obj = resolve (
            stream.dict.has ("Filter") ? stream.dict.at ("Filter") : obj_t{ });

        if (auto p = std::get_if< name_t > (&obj)) {
            filters.push_back (*p);
        }
        else if (auto p = std::get_if< array_pointer > (&obj)) {
            for (const auto& x : **p) {
                if (auto s = lookup< name_t > (resolve (x))) {
                    filters.push_back (*s);
                }
            }
        }
    }

    {
        const auto obj = resolve (
            stream.dict.has ("DecodeParms")
            ? stream.dict.at ("DecodeParms") : obj_t{ });

        if (auto p = std::get_if< array_pointer > (&obj)) {
            for (const auto& x : **p) {
                parms.push_back (dict_of (x));
            }
        }
        else {
            parms.push_back (dict_of (obj));
        }
    }

    parms.resize (filters.size ());

    std::string data = stream.data;

    try {
        for (size_t i = 0; i < filters.size (); ++i) {
            const auto& filter = filters [i];

            if (filter == "FlateDecode" || filter == "Fl") {
                data = detail::unpredict (
                    *this, iostreams::inflate (data), parms [i]);
            }
            else if (filter == "LZWDecode" || filter == "LZW") {
                const bool early = parms [i]
                    ? get< int > (*parms [i], "EarlyChange").value_or (1)
                    : true;

                data = detail::unpredict (
                    *this, iostreams::lzw_decode (data, early), parms [i]);
            }
            else if (filter == "ASCIIHexDecode" || filter == "AHx") {
                data = iostreams::filter_input (
                    data, iostreams::asciihex_input_filter_t ());
            }
            else if (filter == "ASCII85Decode" || filter == "A85") {
                data = iostreams::filter_input (
                    data, iostreams::ascii85_input_filter_t ());
            }
            else if (filter == "RunLengthDecode" || filter == "RL") {
                data = iostreams::filter_input (
                    data, iostreams::runlength_input_filter_t ());
            }
            else if (detail::is_image_filter (filter)) {
                if (image_filter && i + 1 == filters.size ()) {
                    *image_filter = filter;
                    return data;
                }

                return { };
            }
            else {
                error (errUnimplemented, -1, "unsupported filter '{}'", filter);
                return { };
            }
        }
    }
    catch (const io::zlib_error& e) {
        error (errSyntaxError, -1, "corrupt compressed stream: {}", e.what ());
        return { };
    }

    return data;
}

void document_t::save (const fs::path& path, const save_options_t& opts) const {
    const auto data = serialize (opts);
    const auto tmp = make_sibling_temp_path (path);

    bool committed = false;

    BOOST_SCOPE_EXIT(&committed, &tmp) {
        if (!committed) {
            std::error_code ignore;
            fs::remove (tmp, ignore);
        }
    } BOOST_SCOPE_EXIT_END

    {
        std::ofstream s (tmp, std::ios_base::binary | std::ios_base::out);

        if (!s) {
            throw document_error (
                format ("{}: cannot open for writing", tmp.string ()));
        }

        s.write (data.data (), data.size ());
        s.close ();

        if (!s) {
            throw document_error (format ("{}: write error", tmp.string ()));
        }
    }

    std::error_code ec;
    fs::rename (tmp, path, ec);

    if (ec) {
        throw document_error (
            format ("{}: {}", path.string (), ec.message ()));
    }

    committed = true;
}

std::string document_t::serialize (const save_options_t& opts) const {
    std::stringstream ss;
    write_document (ss, *this, opts);
    return ss.str ();
}

} // namespace scrub
