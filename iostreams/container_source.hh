// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef SCRUB_IOSTREAMS_CONTAINER_SOURCE_HH
#define SCRUB_IOSTREAMS_CONTAINER_SOURCE_HH

#include <algorithm>
#include <boost/iostreams/concepts.hpp>

namespace scrub {
namespace iostreams {

//
// Reads from a contiguous container the source does not own, the container
// must outlive the stream:
//
template< typename Container >
struct container_source_t : public boost::iostreams::source
{
    using container_type = Container;
    using pos_type = typename Container::size_type;

    explicit container_source_t(const container_type &container)
        : container_(container), pos_()
    { }

    std::streamsize read(char* s, std::streamsize n) {
        const std::streamsize dist = container_.size() - pos_;

        if (0 == (n = (std::min)(n, dist)))
            return -1;

        auto xs = container_.data();

        std::copy(xs + pos_, xs + pos_ + n, s);
        pos_ += n;

        return n;
    }

private:
    const container_type &container_;
    pos_type pos_;
};

} // namespace iostreams
} // namespace scrub

#endif // SCRUB_IOSTREAMS_CONTAINER_SOURCE_HH
