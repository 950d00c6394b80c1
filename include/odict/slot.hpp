////////////////////////////////////////////////////////////////////////////////
/// slot: one node of the ordered_map linked list plus its payload.
///
/// Holds (prev, value, next) where prev/next are key_links (logical back
/// references into the same map, NIL at the boundaries). Owns nothing beyond
/// the value.
///
/// Besides the named members a slot can be treated positionally, as the
/// (prev, value, next) triple older encodings used:
///   - from_sequence( fields )   builds a slot from exactly three positional
///     fields, links at both ends (invalid_arity otherwise)
///   - at( index )               0/-3 = prev, 1/-2 = value, 2/-1 = next
///                               (index_out_of_range otherwise)
///   - reduce()                  the constructor arguments, for serializers
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

#include <odict/error.hpp>
#include <odict/nil.hpp>

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

template <typename Key, typename T>
struct slot
{
    using key_type    = Key;
    using mapped_type = T;
    using link_type   = key_link<Key>;
    using field_type  = std::variant<link_type, T>; // positional (legacy triple) element

    link_type prev;
    T         value{};
    link_type next;

    slot() = default;

    slot( link_type p, T v, link_type n ) noexcept( std::is_nothrow_move_constructible_v<link_type> && std::is_nothrow_move_constructible_v<T> )
        : prev{ std::move( p ) }, value( std::move( v ) ), next{ std::move( n ) } {}

    template <std::ranges::input_range Fields>
    requires std::convertible_to<std::ranges::range_reference_t<Fields>, field_type const &>
    [[ nodiscard ]] static slot from_sequence( Fields && fields )
    {
        if constexpr ( std::ranges::sized_range<Fields> ) {
            if ( std::ranges::size( fields ) != 3 )
                detail::throw_invalid_arity( "odict::slot::from_sequence" );
        }
        std::optional<field_type> triple[ 3 ];
        std::size_t               count{ 0 };
        for ( auto && field : fields ) {
            if ( count == 3 )
                detail::throw_invalid_arity( "odict::slot::from_sequence" );
            triple[ count++ ].emplace( std::forward<decltype( field )>( field ) );
        }
        if ( count != 3 )
            detail::throw_invalid_arity( "odict::slot::from_sequence" );
        if ( triple[ 0 ]->index() != 0 || triple[ 1 ]->index() != 1 || triple[ 2 ]->index() != 0 )
            detail::throw_invalid_field( "odict::slot::from_sequence" );
        return { std::get<0>( std::move( *triple[ 0 ] ) ), std::get<1>( std::move( *triple[ 1 ] ) ), std::get<0>( std::move( *triple[ 2 ] ) ) };
    }

    [[ nodiscard ]] static slot from_sequence( std::initializer_list<field_type> const fields )
    {
        return from_sequence( std::views::all( fields ) );
    }

    [[ nodiscard ]] field_type at( std::ptrdiff_t const index ) const
    {
        switch ( index )
        {
            case 0: case -3: return field_type{ std::in_place_index<0>, prev  };
            case 1: case -2: return field_type{ std::in_place_index<1>, value };
            case 2: case -1: return field_type{ std::in_place_index<0>, next  };
            default:
                detail::throw_index_out_of_range( "odict::slot::at" );
        }
    }

    [[ nodiscard ]] std::tuple<link_type, T, link_type> reduce() const { return { prev, value, next }; }

    friend bool operator==( slot const &, slot const & ) = default;
}; // struct slot

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
