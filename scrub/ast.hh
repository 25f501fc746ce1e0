// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_AST_HH
#define SCRUB_SCRUB_AST_HH

#include <defs.hh>

#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace scrub {

struct null_t { };

struct name_t : std::string {
    using base_type = std::string;
    using base_type::base_type;
    using base_type::operator=;

    name_t () = default;

    name_t (const base_type& arg) : base_type (arg) { }
    name_t (base_type&& arg) : base_type (std::move (arg)) { }
};

//
// String bytes, after escape processing; `hex' only records the original
// spelling and is honored when the string is written back:
//
struct string_t : std::string {
    using base_type = std::string;
    using base_type::base_type;
    using base_type::operator=;

    string_t () = default;

    string_t (const base_type& arg) : base_type (arg) { }
    string_t (base_type&& arg) : base_type (std::move (arg)) { }

    bool hex = false;
};

struct ref_t {
    int num, gen;
};

inline bool operator== (const ref_t& lhs, const ref_t& rhs) {
    return lhs.num == rhs.num && lhs.gen == rhs.gen;
}

inline bool operator!= (const ref_t& lhs, const ref_t& rhs) {
    return !(lhs == rhs);
}

inline bool operator< (const ref_t& lhs, const ref_t& rhs) {
    return std::tie (lhs.num, lhs.gen) < std::tie (rhs.num, rhs.gen);
}

struct  array_t;
struct   dict_t;
struct stream_t;

using  array_pointer = std::shared_ptr<  array_t >;
using   dict_pointer = std::shared_ptr<   dict_t >;
using stream_pointer = std::shared_ptr< stream_t >;

using obj_t = std::variant<
    null_t, bool, int, double, name_t, string_t, ref_t,
    array_pointer, dict_pointer, stream_pointer
    >;

////////////////////////////////////////////////////////////////////////

//
// Result of a typed lookup, distinguishes a missing entry from an entry of
// the wrong type:
//
enum struct lookup_status_t { present, absent, mismatch };

template< typename T >
struct lookup_t {
    using value_type = T;

    lookup_status_t status = lookup_status_t::absent;
    T value{ };

    bool present  () const { return status == lookup_status_t::present;  }
    bool absent   () const { return status == lookup_status_t::absent;   }
    bool mismatch () const { return status == lookup_status_t::mismatch; }

    explicit operator bool () const { return present (); }

    const T& operator* () const { return value; }
    const T* operator-> () const { return &value; }

    T value_or (T other) const {
        return present () ? value : std::move (other);
    }
};

namespace detail {

template< typename T >
struct lookup_impl_t {
    lookup_t< T > operator() (const obj_t& obj) const {
        if (auto p = std::get_if< T > (&obj)) {
            return { lookup_status_t::present, *p };
        }

        return { lookup_status_t::mismatch, T{ } };
    }
};

//
// Numbers convert freely, integers are accepted where reals are expected:
//
template< >
struct lookup_impl_t< double > {
    lookup_t< double > operator() (const obj_t& obj) const {
        if (auto p = std::get_if< double > (&obj)) {
            return { lookup_status_t::present, *p };
        }
        else if (auto p = std::get_if< int > (&obj)) {
            return { lookup_status_t::present, double (*p) };
        }

        return { lookup_status_t::mismatch, 0. };
    }
};

template< >
struct lookup_impl_t< int > {
    lookup_t< int > operator() (const obj_t& obj) const {
        if (auto p = std::get_if< int > (&obj)) {
            return { lookup_status_t::present, *p };
        }
        else if (auto p = std::get_if< double > (&obj)) {
            return { lookup_status_t::present, int (*p) };
        }

        return { lookup_status_t::mismatch, 0 };
    }
};

} // namespace detail

template< typename T >
inline bool is (const obj_t& obj) {
    return std::holds_alternative< T > (obj);
}

inline bool is_null (const obj_t& obj) { return is< null_t > (obj); }

inline bool is_number (const obj_t& obj) {
    return is< int > (obj) || is< double > (obj);
}

inline bool is_name (const obj_t& obj, const char* s) {
    auto p = std::get_if< name_t > (&obj);
    return p && *p == s;
}

//
// Typed view of an object, without reference resolution; a null object
// counts as absent:
//
template< typename T >
inline lookup_t< T > lookup (const obj_t& obj) {
    if (is_null (obj)) {
        return { };
    }

    return detail::lookup_impl_t< T >{ }(obj);
}

////////////////////////////////////////////////////////////////////////

struct array_t : std::vector< obj_t > {
    using base_type = std::vector< obj_t >;

    using base_type::base_type;
    using base_type::operator=;

    array_t (const base_type& arg) : base_type (arg) { }
    array_t (base_type&& arg) : base_type (std::move (arg)) { }
};

struct dict_t : std::vector< std::tuple< name_t, obj_t > > {
    using base_type = std::vector< std::tuple< name_t, obj_t > >;

    using base_type::base_type;
    using base_type::operator=;

    dict_t (const base_type& arg) : base_type (arg) { }
    dict_t (base_type&& arg) : base_type (std::move (arg)) { }

    //
    // Same semantics with std::map::operator[]
    //
    obj_t& operator[] (const std::string&);

    //
    // Same semantics with std::map::at
    //
    obj_t& at (const std::string&);

    const obj_t& at (const std::string& s) const {
        return const_cast< dict_t* > (this)->at (s);
    }

    obj_t* find (const std::string&);

    const obj_t* find (const std::string& s) const {
        return const_cast< dict_t* > (this)->find (s);
    }

    bool has (const std::string& s) const { return find (s); }

    //
    // Insert or replace:
    //
    void emplace (const std::string&, obj_t);

    //
    // Remove the entry, returns true if there was one:
    //
    bool erase (const std::string&);

    //
    // Check if dictionary /Type is the given name:
    //
    bool is (const char* type) const;

    template< typename T >
    lookup_t< T > get (const std::string& key) const {
        auto p = find (key);
        return p ? lookup< T > (*p) : lookup_t< T >{ };
    }
};

struct stream_t {
    dict_t dict;

    //
    // The stream data as stored in the file, i.e., still encoded per the
    // stream filters:
    //
    std::string data;
};

////////////////////////////////////////////////////////////////////////

template< typename T, typename ... Args >
inline std::shared_ptr< T > make (Args&& ... args) {
    return std::make_shared< T > (std::forward< Args > (args)...);
}

inline obj_t make_rect (double x0, double y0, double x1, double y1) {
    return make< array_t > (array_t{ x0, y0, x1, y1 });
}

//
// Deep copy of arrays and dictionaries; references are copied as
// references, streams are duplicated:
//
obj_t clone (const obj_t&);

//
// Name of the type of the object, for messages:
//
const char* type_name (const obj_t&);

} // namespace scrub

#endif // SCRUB_SCRUB_AST_HH
