// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_DOCUMENT_HH
#define SCRUB_SCRUB_DOCUMENT_HH

#include <defs.hh>

#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <scrub/ast.hh>
#include <utils/path.hh>

namespace scrub {

struct save_options_t {
    //
    // Drop the objects not reachable from the trailer and renumber the
    // rest:
    //
    bool garbage_collect = true;

    //
    // Flate-compress the unfiltered streams:
    //
    bool compress = true;
};

struct page_ref_t {
    ref_t ref;
    dict_pointer dict;
};

//
// The structural object tree of a PDF file. Objects are held by number,
// the latest definition of a number wins; references resolve lazily.
// Compressed object streams are expanded at load time and the
// cross-reference streams dropped, the document is always written back with
// a classic cross-reference table:
//
struct document_t {
    document_t ();

    //
    // Throws document_error if the file cannot be read, is not a PDF file,
    // or is encrypted and encryption is not allowed:
    //
    static document_t open (const fs::path&, bool allow_encrypted = false);
    static document_t load (const std::string&, bool allow_encrypted = false);

    const std::tuple< int, int >& version () const { return version_; }

    //
    // The object with the given number, null if there is none:
    //
    obj_t object (int) const;

    //
    // Follow references until a direct object is reached; dangling and
    // circular references resolve to null:
    //
    obj_t resolve (const obj_t&) const;

    template< typename T >
    lookup_t< T > lookup (const obj_t& obj) const {
        return scrub::lookup< T > (resolve (obj));
    }

    template< typename T >
    lookup_t< T > get (const dict_t& dict, const std::string& key) const {
        auto p = dict.find (key);
        return p ? lookup< T > (*p) : lookup_t< T >{ };
    }

    //
    // Dictionary or stream dictionary of the (resolved) object:
    //
    dict_pointer dict_of (const obj_t&) const;

    const std::map< int, obj_t >& objects () const { return objs_; }

    //
    // New indirect object:
    //
    ref_t add (obj_t);

    void replace (const ref_t&, obj_t);

    dict_t& trailer () { return trailer_; }
    const dict_t& trailer () const { return trailer_; }

    //
    // The catalog; throws document_error if there is none:
    //
    dict_pointer catalog () const;

    //
    // The document information dictionary, if any:
    //
    dict_pointer info () const;

    bool encrypted () const { return trailer_.has ("Encrypt"); }

    //
    // The leaves of the page tree, in document order:
    //
    std::vector< page_ref_t > pages () const;

    //
    // Stream data with all filters undone. If `image_filter' is given, an
    // image compression filter (DCT, JPX, JBIG2, CCITT) in last position is
    // left in place and its name stored; unsupported filters yield nothing:
    //
    std::optional< std::string >
    decode (const stream_t&, std::string* image_filter = 0) const;

    //
    // Serialize to the given path, through a temporary file; throws
    // document_error on failure:
    //
    void save (const fs::path&, const save_options_t& = { }) const;

    std::string serialize (const save_options_t& = { }) const;

private:
    std::tuple< int, int > version_{ 1, 7 };

    std::map< int, obj_t > objs_;
    dict_t trailer_;
};

} // namespace scrub

#endif // SCRUB_SCRUB_DOCUMENT_HH
