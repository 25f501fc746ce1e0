// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SPLASH_DCT_HH
#define SCRUB_SPLASH_DCT_HH

#include <defs.hh>

#include <optional>
#include <string>

namespace scrub {

struct dct_image_t {
    int width, height, components;

    //
    // Interleaved 8-bit samples, top-down; CMYK as stored, Adobe inverted
    // CMYK is corrected:
    //
    std::string data;
};

//
// Decompress DCTDecode (JPEG) data with libjpeg; nothing on error:
//
std::optional< dct_image_t > decode_dct (const std::string&);

} // namespace scrub

#endif // SCRUB_SPLASH_DCT_HH
