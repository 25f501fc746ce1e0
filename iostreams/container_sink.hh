// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef SCRUB_IOSTREAMS_CONTAINER_SINK_HH
#define SCRUB_IOSTREAMS_CONTAINER_SINK_HH

#include <boost/iostreams/concepts.hpp>

namespace scrub {
namespace iostreams {

template< typename Container >
struct container_sink_t : public boost::iostreams::sink
{
    using container_type = Container;

    explicit container_sink_t(container_type &container) : container_(container) { }

    std::streamsize write(const char* s, std::streamsize n)
    {
        return container_.insert(container_.end(), s, s + n), n;
    }

private:
    container_type &container_;
};

} // namespace iostreams
} // namespace scrub

#endif // SCRUB_IOSTREAMS_CONTAINER_SINK_HH
