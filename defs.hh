// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_DEFS_HH
#define SCRUB_DEFS_HH

#include <config.hh>

#define TO_S(x) #x

#define SCRUB_DO_CAT(a, b) a ## b
#define SCRUB_CAT(a, b) SCRUB_DO_CAT(a, b)

#include <boost/assert.hpp>

#define SCRUB_ASSERT BOOST_ASSERT
#define ASSERT SCRUB_ASSERT

template< typename... Ts> struct overload_ : Ts... { using Ts::operator()...; };
template< typename... Ts> overload_(Ts...) -> overload_< Ts... >;

#endif // SCRUB_DEFS_HH
