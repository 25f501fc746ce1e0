// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC

#ifndef SCRUB_UTILS_PATH_HH
#define SCRUB_UTILS_PATH_HH

#include <cstddef>
#include <cstdint>

#include <string>

#include <filesystem>
namespace fs = std::filesystem;

namespace scrub {

// Get home directory path.
fs::path home_path();
fs::path expand_path(const fs::path &);

inline bool is_absolute_path(const fs::path &path)
{
    return path.is_absolute();
}

fs::path make_temp_path();

//
// A temporary path in the directory of `path', sharing its stem, e.g.,
// `out.pdf' yields `out.tmp.XXXXXX.pdf':
//
fs::path make_sibling_temp_path(const fs::path &path);

// Size of the file in bytes, 0 if it cannot be stat-ed.
std::uintmax_t file_size_of(const fs::path &);

// Read a whole file, throws std::runtime_error on failure.
std::string read_file(const fs::path &);

} // namespace scrub

#endif // SCRUB_UTILS_PATH_HH
