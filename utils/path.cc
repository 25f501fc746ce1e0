// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC

#include <defs.hh>

#include <cstdlib>

#include <pwd.h>
#include <unistd.h>
#include <sys/types.h>
#include <wordexp.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

#include <utils/path.hh>

#include <fmt/format.h>
using fmt::format;

namespace scrub {
namespace detail {

std::string random_string(size_t n)
{
    static auto &arr =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    thread_local static std::mt19937 rg{std::random_device()()};

    thread_local static std::uniform_int_distribution< size_t > pick(
        0, sizeof arr - 2);

    std::string s;
    s.reserve(n);

    while(n--)
        s += arr[pick(rg)];

    return s;
}

} // namespace detail

fs::path home_path()
{
    if (const char *s = getenv("HOME")) {
        return fs::path(s);
    } else {
        struct passwd *p = 0;

        if (const char *s = getenv("USER"))
            p = getpwnam(s);
        else
            p = getpwuid(getuid());

        return p ? fs::path(p->pw_dir) : fs::path(".");
    }
}

fs::path expand_path(const fs::path &path)
{
    wordexp_t w{ };

    std::unique_ptr< ::wordexp_t, void(*)(::wordexp_t*) > guard(
        &w, ::wordfree);

    int result = wordexp(
        path.c_str(), &w, WRDE_NOCMD | WRDE_SHOWERR | WRDE_UNDEF);

    if (0 == result && 1 == w.we_wordc)
        return fs::path(w.we_wordv[0]);

    return path;
}

fs::path make_temp_path()
{
    return fs::temp_directory_path() / detail::random_string(10);
}

fs::path make_sibling_temp_path(const fs::path &path)
{
    auto name = format(
        "{}.tmp.{}{}", path.stem().string(), detail::random_string(6),
        path.extension().string());

    return path.parent_path() / name;
}

std::uintmax_t file_size_of(const fs::path &path)
{
    std::error_code ec;
    const auto n = fs::file_size(path, ec);
    return ec ? 0 : n;
}

std::string read_file(const fs::path &path)
{
    std::ifstream f(path, std::ios_base::in | std::ios_base::binary);

    if (!f)
        throw std::runtime_error(format("cannot open {}", path.string()));

    std::stringstream ss;
    ss << f.rdbuf();

    return ss.str();
}

} // namespace scrub
