// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC

#ifndef SCRUB_SCRUB_GFX_HH
#define SCRUB_SCRUB_GFX_HH

#include <defs.hh>

#include <map>
#include <set>
#include <string>
#include <vector>

#include <scrub/ast.hh>
#include <scrub/bbox.hh>
#include <scrub/content.hh>
#include <scrub/font.hh>
#include <scrub/matrix.hh>

namespace scrub {

struct document_t;
struct page_t;

struct color_t {
    double r = 0, g = 0, b = 0;
};

//
// Color spaces reduced to what the devices need: the number of components
// and a conversion to RGB:
//
struct colorspace_t {
    enum kind_t { gray, rgb, cmyk, indexed, separation, pattern };

    kind_t kind = gray;
    int components = 1;

    //
    // Indexed: the base space, the highest index and the palette:
    //
    kind_t base = gray;
    int base_components = 1;
    int hival = 0;
    std::string palette;
};

color_t to_rgb (const colorspace_t&, const std::vector< double >&);

struct text_state_t {
    font_pointer font;

    double size = 0;
    double char_space = 0, word_space = 0, scale = 1, leading = 0, rise = 0;

    int render = 0;

    matrix_t tm, tlm;
};

struct gfx_state_t {
    matrix_t ctm;

    colorspace_t fill_space, stroke_space;
    color_t fill, stroke;

    double line_width = 1;
    double fill_alpha = 1, stroke_alpha = 1;

    text_state_t text;
};

//
// Path flattened to polygons, in device space:
//
struct path_t {
    std::vector< std::vector< point_t > > subpaths;
    std::vector< bool > closed;
};

bbox_t bbox_of (const path_t&);

//
// Position of a glyph in the content: the operation, the element of a TJ
// array (0 for the other operators) and the byte offset in the string:
//
struct glyph_location_t {
    size_t op, elem, pos;
};

//
// Image samples, after all non-image filters; `filter' names an image
// compression filter left in place (DCTDecode), empty for raw samples:
//
struct image_t {
    int width = 0, height = 0, bpc = 8;

    colorspace_t space;

    bool mask = false;
    bool inverted = false;

    std::string data;
    std::string filter;

    //
    // Unit square to device space:
    //
    matrix_t matrix;
};

//
// Receiver of the drawing operations of a content stream:
//
struct output_dev_t {
    virtual ~output_dev_t () { }

    //
    // Interpret form XObjects in place; when false, draw_form receives them
    // instead:
    //
    virtual bool inline_forms () const { return true; }

    //
    // Decode image samples before calling draw_image:
    //
    virtual bool need_image_data () const { return false; }

    //
    // Glyph with its text rendering matrix and device space bounding box:
    //
    virtual void
    draw_glyph (const gfx_state_t&, const glyph_t&, const matrix_t&,
                const bbox_t&, const glyph_location_t&) { }

    virtual void
    fill_path (const gfx_state_t&, const path_t&, bool, size_t) { }

    virtual void stroke_path (const gfx_state_t&, const path_t&, size_t) { }

    virtual void
    draw_image (const gfx_state_t&, const image_t&, const bbox_t&, size_t) { }

    virtual void
    draw_form (const gfx_state_t&, const std::string&, const stream_pointer&,
               const bbox_t&, size_t) { }
};

//
// Content stream interpreter. Clipping, shadings and patterns are not
// interpreted:
//
struct gfx_t {
    gfx_t (const document_t&, output_dev_t&);

    //
    // Run the page content, with page space as the device space:
    //
    void run (const page_t&);

    void run (const ops_t&, const dict_pointer& resources, const matrix_t& ctm);

private:
    enum type_check_t {
        check_none, check_bool, check_int, check_num, check_string,
        check_name, check_array, check_props, check_scn
    };

    struct operator_t {
        const char* name;
        int nargs;
        type_check_t check [6];
        void (gfx_t::*fun) (const obj_t*, int);
    };

    static const operator_t operators [];

    static const operator_t* find_operator (const std::string&);
    static bool check (const obj_t&, type_check_t);

    void execute (const op_t&);

    void op_save (const obj_t*, int);
    void op_restore (const obj_t*, int);
    void op_concat (const obj_t*, int);
    void op_set_line_width (const obj_t*, int);
    void op_set_ext_gstate (const obj_t*, int);

    void op_set_fill_gray (const obj_t*, int);
    void op_set_stroke_gray (const obj_t*, int);
    void op_set_fill_rgb (const obj_t*, int);
    void op_set_stroke_rgb (const obj_t*, int);
    void op_set_fill_cmyk (const obj_t*, int);
    void op_set_stroke_cmyk (const obj_t*, int);
    void op_set_fill_space (const obj_t*, int);
    void op_set_stroke_space (const obj_t*, int);
    void op_set_fill_color (const obj_t*, int);
    void op_set_stroke_color (const obj_t*, int);

    void op_move_to (const obj_t*, int);
    void op_line_to (const obj_t*, int);
    void op_curve_to (const obj_t*, int);
    void op_curve_to1 (const obj_t*, int);
    void op_curve_to2 (const obj_t*, int);
    void op_close_path (const obj_t*, int);
    void op_rectangle (const obj_t*, int);

    void op_end_path (const obj_t*, int);
    void op_stroke (const obj_t*, int);
    void op_close_stroke (const obj_t*, int);
    void op_fill (const obj_t*, int);
    void op_eofill (const obj_t*, int);
    void op_fill_stroke (const obj_t*, int);
    void op_eofill_stroke (const obj_t*, int);
    void op_close_fill_stroke (const obj_t*, int);
    void op_close_eofill_stroke (const obj_t*, int);

    void op_begin_text (const obj_t*, int);
    void op_end_text (const obj_t*, int);
    void op_set_char_spacing (const obj_t*, int);
    void op_set_word_spacing (const obj_t*, int);
    void op_set_horiz_scaling (const obj_t*, int);
    void op_set_text_leading (const obj_t*, int);
    void op_set_font (const obj_t*, int);
    void op_set_text_render (const obj_t*, int);
    void op_set_text_rise (const obj_t*, int);
    void op_text_move (const obj_t*, int);
    void op_text_move_set (const obj_t*, int);
    void op_set_text_matrix (const obj_t*, int);
    void op_text_next_line (const obj_t*, int);
    void op_show_text (const obj_t*, int);
    void op_move_show_text (const obj_t*, int);
    void op_move_set_show_text (const obj_t*, int);
    void op_show_space_text (const obj_t*, int);

    void op_xobject (const obj_t*, int);
    void op_inline_image (const obj_t*, int);

    void op_ignore (const obj_t*, int);

    void show_text (const std::string&, size_t elem);
    void paint (bool fill, bool stroke, bool eo, bool close);
    void draw_image (const stream_t&);
    void draw_form (const std::string&, const stream_pointer&);

    void add_point (double, double, bool move);

    colorspace_t lookup_colorspace (const obj_t&) const;
    font_pointer lookup_font (const std::string&);
    obj_t lookup_resource (const char*, const std::string&) const;

    const gfx_state_t& state () const { return states_.back (); }
    gfx_state_t& state () { return states_.back (); }

private:
    const document_t& doc_;
    output_dev_t& out_;

    std::vector< gfx_state_t > states_;
    std::vector< dict_pointer > resources_;

    path_t path_;
    point_t current_{ 0, 0 };

    //
    // The operation being executed:
    //
    const op_t* op_ = 0;
    size_t index_ = 0;

    std::map< const dict_t*, font_pointer > fonts_;
    std::set< const stream_t* > forms_;

    size_t errors_ = 0;
};

} // namespace scrub

#endif // SCRUB_SCRUB_GFX_HH
