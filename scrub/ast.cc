// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <stdexcept>

#include <scrub/ast.hh>

#include <range/v3/algorithm/find_if.hpp>
using namespace ranges;

const auto sequential_find = [](auto& xs, auto& key) {
    return find_if (xs, [&](auto& x) { return std::get< 0 > (x) == key; });
};

////////////////////////////////////////////////////////////////////////

namespace scrub {

obj_t& dict_t::operator[] (const std::string& s) {
    auto iter = sequential_find (*this, s);

    if (iter == end ()) {
        emplace_back (name_t (s), obj_t{ });
        iter = --end ();
    }

    return std::get< 1 > (*iter);
}

obj_t& dict_t::at (const std::string& s) {
    auto iter = sequential_find (*this, s);

    if (iter == end ()) {
        throw std::out_of_range ("dict_t::at");
    }

    return std::get< 1 > (*iter);
}

obj_t* dict_t::find (const std::string& s) {
    auto iter = sequential_find (*this, s);
    return iter == end () ? nullptr : &std::get< 1 > (*iter);
}

void dict_t::emplace (const std::string& key, obj_t obj) {
    auto iter = sequential_find (*this, key);

    if (iter == end ()) {
        emplace_back (name_t (key), std::move (obj));
    }
    else {
        std::get< 1 > (*iter) = std::move (obj);
    }
}

bool dict_t::erase (const std::string& key) {
    auto iter = sequential_find (*this, key);

    if (iter == end ()) {
        return false;
    }

    base_type::erase (iter);
    return true;
}

bool dict_t::is (const char* type) const {
    auto p = find ("Type");
    return p && is_name (*p, type);
}

obj_t clone (const obj_t& obj) {
    return std::visit (overload_ {
        [](const array_pointer& arg) -> obj_t {
            auto result = make< array_t > ();
            result->reserve (arg->size ());

            for (const auto& x : *arg) {
                result->emplace_back (clone (x));
            }

            return result;
        },
        [](const dict_pointer& arg) -> obj_t {
            auto result = make< dict_t > ();
            result->reserve (arg->size ());

            for (const auto& [key, value] : *arg) {
                result->emplace_back (key, clone (value));
            }

            return result;
        },
        [](const stream_pointer& arg) -> obj_t {
            auto result = make< stream_t > ();

            auto dict = clone (make< dict_t > (arg->dict));
            result->dict = *std::get< dict_pointer > (dict);
            result->data = arg->data;

            return result;
        },
        [](const auto& arg) -> obj_t { return arg; }
    }, obj);
}

const char* type_name (const obj_t& obj) {
    static const char* arr [] = {
        "null", "boolean", "integer", "real", "name", "string", "reference",
        "array", "dictionary", "stream"
    };

    return arr [obj.index ()];
}

} // namespace scrub
