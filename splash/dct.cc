// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <csetjmp>
#include <cstdio>

#include <jpeglib.h>

#include <scrub/error.hh>
#include <splash/dct.hh>

namespace scrub {
namespace detail {

struct jpeg_error_t {
    jpeg_error_mgr mgr;
    std::jmp_buf env;
};

static void jpeg_error_exit (j_common_ptr info) {
    char buf [JMSG_LENGTH_MAX];
    (*info->err->format_message) (info, buf);

    error (errSyntaxWarning, -1, "DCT stream: {}", buf);

    std::longjmp (reinterpret_cast< jpeg_error_t* > (info->err)->env, 1);
}

static void jpeg_output_message (j_common_ptr) { }

} // namespace detail

std::optional< dct_image_t > decode_dct (const std::string& src) {
    jpeg_decompress_struct info;
    detail::jpeg_error_t err;

    info.err = jpeg_std_error (&err.mgr);

    err.mgr.error_exit = detail::jpeg_error_exit;
    err.mgr.output_message = detail::jpeg_output_message;

    //
    // Nothing with a destructor lives between here and the decompression
    // end, the long jump skips no cleanup:
    //
    dct_image_t* volatile image = 0;

    if (setjmp (err.env)) {
        jpeg_destroy_decompress (&info);
        delete image;
        return { };
    }

    jpeg_create_decompress (&info);

    jpeg_mem_src (
        &info, reinterpret_cast< const unsigned char* > (src.data ()),
        (unsigned long)src.size ());

    jpeg_read_header (&info, TRUE);

    if (info.jpeg_color_space == JCS_YCCK ||
        info.jpeg_color_space == JCS_CMYK) {
        info.out_color_space = JCS_CMYK;
    }
    else if (info.num_components == 1) {
        info.out_color_space = JCS_GRAYSCALE;
    }
    else {
        info.out_color_space = JCS_RGB;
    }

    jpeg_start_decompress (&info);

    image = new dct_image_t{
        int (info.output_width), int (info.output_height),
        info.output_components, { } };

    const size_t row_size = size_t (image->width) * image->components;
    image->data.resize (row_size * image->height);

    while (info.output_scanline < info.output_height) {
        JSAMPROW row = reinterpret_cast< JSAMPROW > (
            &image->data [row_size * info.output_scanline]);

        jpeg_read_scanlines (&info, &row, 1);
    }

    //
    // Adobe writes CMYK JPEGs inverted:
    //
    if (info.out_color_space == JCS_CMYK && info.saw_Adobe_marker) {
        for (auto& c : image->data) {
            c = char (255 - (unsigned char)c);
        }
    }

    jpeg_finish_decompress (&info);
    jpeg_destroy_decompress (&info);

    std::optional< dct_image_t > result (std::move (*image));
    delete image;

    return result;
}

} // namespace scrub
