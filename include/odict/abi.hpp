////////////////////////////////////////////////////////////////////////////////
/// Argument passing helpers for odict containers.
///
/// A trimmed-down 'automatized' boost::call_traits: trivial, register sized
/// keys are passed by value, everything else by const reference, and
/// stateful predicates handed to by-value taking algorithms are wrapped so
/// that they are not copied around.
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

#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivial_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV
}; // can_be_passed_in_reg

/// Optimal read-only parameter type for keys at the public API boundary.
template <typename T>
using const_arg_t = std::conditional_t<can_be_passed_in_reg<T>, T const, T const &>;


// utility for passing non trivial predicates to algorithms which pass them around by-val
template <typename Pred>
constexpr decltype( auto ) make_trivially_copyable_predicate( Pred && __restrict pred ) noexcept {
    if constexpr ( can_be_passed_in_reg<std::remove_cvref_t<Pred>> ) {
        return std::forward<Pred>( pred );
    } else {
        return [&pred]( auto const & ... args ) noexcept( noexcept( pred( args... ) ) ) {
            return pred( args... );
        };
    }
} // make_trivially_copyable_predicate

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
