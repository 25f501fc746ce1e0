// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_SCRUB_OCR_HH
#define SCRUB_SCRUB_OCR_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <scrub/geometry.hh>
#include <splash/bitmap.hh>

namespace scrub {

//
// A word recognized on a page image, located in page space:
//
struct ocr_result_t {
    std::string text;
    rect_t rect;
    double confidence;
};

//
// Text recognition over rendered pages. Implementations return only the
// results they accept, e.g., above their confidence threshold:
//
struct ocr_engine_t {
    virtual ~ocr_engine_t () { }

    virtual std::vector< ocr_result_t >
    recognize (const bitmap_t&, int page, double dpi, double page_height) = 0;
};

} // namespace scrub

#endif // SCRUB_SCRUB_OCR_HH
