// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/obj.hh>
#include <scrub/parser/any.hh>
#include <scrub/parser/lookahead.hh>
#include <scrub/parser/numeric.hh>
#include <scrub/parser/skip.hh>
#include <scrub/parser/stream.hh>

namespace scrub::parser {

//
// Indirect object definition, `N G obj ... endobj'; a dictionary followed by
// stream data makes a stream object:
//
template< typename Iterator >
bool object (Iterator first, Iterator& iter, Iterator last,
             std::tuple< ref_t, obj_t >& attr) {
    SCRUB_ITERATOR_GUARD (iter);

    int num, gen;

    if (!ints (first, iter, last, num, gen) || !skipws (first, iter, last) ||
        !keyword (first, iter, last, "obj")) {
        return false;
    }

    skip (first, iter, last);

    obj_t obj;

    if (keyword (first, iter, last, "endobj")) {
        attr = { ref_t{ num, gen }, null_t{ } };
        SCRUB_PARSE_SUCCESS;
    }

    if (!any (first, iter, last, obj)) {
        return false;
    }

    skip (first, iter, last);

    if (auto pdict = std::get_if< dict_pointer > (&obj)) {
        if (lookahead (iter, last, "stream")) {
            auto stream = make< stream_t > ();

            if (!stream_ (first, iter, last, **pdict, stream->data)) {
                return false;
            }

            stream->dict = std::move (**pdict);
            obj = std::move (stream);

            skip (first, iter, last);
        }
    }

    //
    // Tolerate a missing `endobj':
    //
    keyword (first, iter, last, "endobj");

    attr = { ref_t{ num, gen }, std::move (obj) };
    SCRUB_PARSE_SUCCESS;
}

} // scrub::parser
