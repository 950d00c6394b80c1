////////////////////////////////////////////////////////////////////////////////
///
/// odict::clone - the deep copy customization point used by
/// ordered_map::deep_copy().
///
/// A plain copy of an ordered_map copies its values: for (smart) pointer
/// values that means sharing the pointees. clone() instead recursively
/// duplicates whatever a value owns or refers to. Specialize odict::cloner
/// for your own handle types.
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

#include <memory>
#include <optional>
#include <vector>
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

template <typename T>
struct cloner
{
    T operator()( T const & value ) const { return value; }
}; // struct cloner

template <typename T>
[[ nodiscard ]] T clone( T const & value ) { return cloner<T>{}( value ); }

// note: the pointee is cloned as its static type (i.e. no polymorphic cloning)
template <typename T>
struct cloner<std::shared_ptr<T>>
{
    std::shared_ptr<T> operator()( std::shared_ptr<T> const & value ) const
    {
        if ( !value )
            return {};
        return std::make_shared<T>( clone( *value ) );
    }
}; // struct cloner<std::shared_ptr<T>>

template <typename T>
struct cloner<std::unique_ptr<T>>
{
    std::unique_ptr<T> operator()( std::unique_ptr<T> const & value ) const
    {
        if ( !value )
            return {};
        return std::make_unique<T>( clone( *value ) );
    }
}; // struct cloner<std::unique_ptr<T>>

template <typename T>
struct cloner<std::optional<T>>
{
    std::optional<T> operator()( std::optional<T> const & value ) const
    {
        if ( !value )
            return std::nullopt;
        return clone( *value );
    }
}; // struct cloner<std::optional<T>>

template <typename T, typename Allocator>
struct cloner<std::vector<T, Allocator>>
{
    std::vector<T, Allocator> operator()( std::vector<T, Allocator> const & value ) const
    {
        std::vector<T, Allocator> result( value.get_allocator() );
        result.reserve( value.size() );
        for ( auto const & element : value )
            result.push_back( clone( element ) );
        return result;
    }
}; // struct cloner<std::vector<T>>

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
