// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef SCRUB_IOSTREAMS_FILTERS_HH
#define SCRUB_IOSTREAMS_FILTERS_HH

#include <defs.hh>

#include <string>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <iostreams/container_sink.hh>
#include <iostreams/container_source.hh>

namespace scrub {
namespace iostreams {

//
// Run the whole of `src' through an input filter:
//
template< typename Filter >
std::string filter_input(const std::string &src, Filter filter)
{
    boost::iostreams::filtering_istream str;

    str.push(filter);
    str.push(container_source_t< std::string >(src));

    std::string buf;
    boost::iostreams::copy(str, container_sink_t< std::string >(buf));

    return buf;
}

//
// zlib/deflate (FlateDecode), throws boost::iostreams::zlib_error on
// corrupt input:
//
std::string inflate(const std::string &);
std::string deflate(const std::string &);

std::string lzw_decode(const std::string &, bool early_change = true);

//
// Undo the TIFF (2) or PNG (10-15) predictor applied before compression:
//
std::string unpredict(const std::string &, int predictor, int colors,
                      int bits_per_component, int columns);

} // namespace iostreams
} // namespace scrub

#endif // SCRUB_IOSTREAMS_FILTERS_HH
