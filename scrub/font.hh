// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_FONT_HH
#define SCRUB_SCRUB_FONT_HH

#include <defs.hh>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <scrub/ast.hh>
#include <scrub/matrix.hh>

namespace scrub {

struct document_t;

//
// A decoded character of a text string:
//
struct glyph_t {
    unsigned code;

    //
    // The bytes of the code, as they appear in the string:
    //
    std::string bytes;

    //
    // Unicode text of the character, possibly empty, possibly more than one
    // character (ligatures):
    //
    std::u32string text;

    //
    // Horizontal displacement, in unscaled text space units:
    //
    double width;

    //
    // Single-byte code 32, subject to word spacing:
    //
    bool space;
};

enum struct font_kind_t { simple, type3, cid };

enum struct font_program_t { none, type1, truetype, cff };

struct font_t {
    //
    // Font from a font dictionary; never fails, missing or broken parts
    // degrade to default metrics:
    //
    static std::shared_ptr< const font_t >
    load (const document_t&, const dict_pointer&);

    std::vector< glyph_t > decode (const std::string&) const;

    font_kind_t kind () const { return kind_; }

    const std::string& base_name () const { return base_name_; }

    //
    // Ascent and descent, in unscaled text space units:
    //
    double ascent () const { return ascent_; }
    double descent () const { return descent_; }

    //
    // Glyph space to text space:
    //
    const matrix_t& font_matrix () const { return font_matrix_; }

    //
    // Embedded font program, if any:
    //
    font_program_t program_type () const { return program_type_; }
    const std::string& program () const { return program_; }

    bool symbolic () const { return symbolic_; }

    //
    // Glyph name of a code in a simple font, null if there is none:
    //
    const char* glyph_name (unsigned) const;

    //
    // Glyph index of a CID, per the CIDToGIDMap:
    //
    unsigned cid_to_gid (unsigned) const;

    //
    // Type 3 glyph procedures and their resources:
    //
    dict_pointer char_procs () const { return char_procs_; }
    dict_pointer resources () const { return resources_; }

private:
    void load_to_unicode (const document_t&, const obj_t&);
    void load_encoding (const document_t&, const dict_t&);
    void load_simple_widths (const document_t&, const dict_t&);
    void load_cid_widths (const document_t&, const dict_t&);
    void load_descriptor (const document_t&, const dict_t&);

    double width_of (unsigned) const;
    std::u32string text_of (unsigned) const;

private:
    font_kind_t kind_ = font_kind_t::simple;
    std::string base_name_;

    double ascent_ = .8, descent_ = -.2;
    matrix_t font_matrix_{ .001, 0, 0, .001, 0, 0 };

    font_program_t program_type_ = font_program_t::none;
    std::string program_;

    bool symbolic_ = false;

    std::vector< std::string > names_;
    std::map< unsigned, std::u32string > to_unicode_;

    //
    // Widths in glyph space units:
    //
    std::map< unsigned, double > widths_;
    double default_width_ = 0;

    int code_bytes_ = 1;

    std::vector< unsigned > cid_to_gid_;

    dict_pointer char_procs_, resources_;
};

using font_pointer = std::shared_ptr< const font_t >;

} // namespace scrub

#endif // SCRUB_SCRUB_FONT_HH
