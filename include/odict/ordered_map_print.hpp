////////////////////////////////////////////////////////////////////////////////
///
/// Textual representations of odict types (diagnostics and debugging):
///  - nil prints as "nil", a key link as its key (or nil)
///  - a slot prints as the triple "[prev, value, next]"
///  - a map prints in dictionary form, "{'a': 1, 'b': 2}" (string keys and
///    values are single quoted), repr() gives the constructor form
///    "odict([('a', 1), ('b', 2)])" ("odict()" when empty)
///  - low_level_repr() dumps the head and tail links and the raw slots in
///    backing store order.
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <odict/nil.hpp>
#include <odict/ordered_map.hpp>
#include <odict/slot.hpp>

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

template <typename Key, typename T, typename Store, ordered_map_options options>
std::string repr( ordered_map<Key, T, Store, options> const & );

namespace detail
{
    template <typename T>
    struct is_ordered_map : std::false_type {};
    template <typename Key, typename T, typename Store, ordered_map_options options>
    struct is_ordered_map<ordered_map<Key, T, Store, options>> : std::true_type {};

    template <typename T>
    void print_value( std::ostream & out, T const & value )
    {
        if constexpr ( std::is_convertible_v<T const &, std::string_view> && !std::is_same_v<T, char> )
            out << '\'' << std::string_view{ value } << '\'';
        else
        if constexpr ( is_ordered_map<T>::value )
            out << repr( value );
        else
            out << value;
    }

    template <typename Slot>
    void print_slot( std::ostream & out, Slot const & slot )
    {
        out << '[' << slot.prev << ", ";
        print_value( out, slot.value );
        out << ", " << slot.next << ']';
    }
} // namespace detail

inline std::ostream & operator<<( std::ostream & out, nil_t ) { return out << "nil"; }

template <typename Key>
std::ostream & operator<<( std::ostream & out, key_link<Key> const & link )
{
    if ( link.is_nil() )
        return out << nil;
    detail::print_value( out, *link );
    return out;
}

template <typename Key, typename T>
std::ostream & operator<<( std::ostream & out, slot<Key, T> const & slot )
{
    detail::print_slot( out, slot );
    return out;
}

template <typename Key, typename T, typename Store, ordered_map_options options>
std::ostream & operator<<( std::ostream & out, ordered_map<Key, T, Store, options> const & map )
{
    out << '{';
    bool first{ true };
    for ( auto const & [ key, value ] : map )
    {
        if ( !first )
            out << ", ";
        first = false;
        detail::print_value( out, key );
        out << ": ";
        detail::print_value( out, value );
    }
    return out << '}';
}

template <typename Key, typename T, typename Store, ordered_map_options options>
std::string repr( ordered_map<Key, T, Store, options> const & map )
{
    if ( map.empty() )
        return "odict()";

    std::ostringstream out;
    out << "odict([";
    bool first{ true };
    for ( auto const & [ key, value ] : map )
    {
        if ( !first )
            out << ", ";
        first = false;
        out << '(';
        detail::print_value( out, key );
        out << ", ";
        detail::print_value( out, value );
        out << ')';
    }
    out << "])";
    return std::move( out ).str();
}

template <typename Key, typename T, typename Store, ordered_map_options options>
std::string to_string( ordered_map<Key, T, Store, options> const & map )
{
    std::ostringstream out;
    out << map;
    return std::move( out ).str();
}

template <typename Key, typename T, typename Store, ordered_map_options options>
std::string low_level_repr( ordered_map<Key, T, Store, options> const & map )
{
    std::ostringstream out;
    out << "odict low level repr head,tail,data: " << map.head() << ", " << map.tail() << ", {";
    bool first{ true };
    for ( auto const & [ key, slot ] : map.store() )
    {
        if ( !first )
            out << ", ";
        first = false;
        detail::print_value( out, key );
        out << ": ";
        detail::print_slot( out, slot );
    }
    out << '}';
    return std::move( out ).str();
}

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
