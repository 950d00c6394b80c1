////////////////////////////////////////////////////////////////////////////////
/// The NIL sentinel and key links.
///
/// The doubly-linked list of an ordered_map is threaded through key values
/// (resolved via the backing store) rather than through node addresses, so a
/// 'pointer' is a key_link: either a key or NIL.
///
/// nil_t is an empty tag - every instance compares equal to and hashes the
/// same as every other one - so a NIL that went through serialization (or was
/// simply constructed independently) is indistinguishable from the original.
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

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

struct nil_t
{
    static std::size_t constexpr hash{ 0x9e3779b97f4a7c15ULL & static_cast<std::size_t>( -1 ) };

    friend constexpr bool        operator==( nil_t, nil_t ) noexcept { return true; }
    friend constexpr std::size_t hash_value( nil_t      ) noexcept { return hash; }
}; // struct nil_t

inline constexpr nil_t nil{};


////////////////////////////////////////////////////////////////////////////////
// \class key_link
////////////////////////////////////////////////////////////////////////////////

template <typename Key>
class key_link
{
public:
    using key_type = Key;

    constexpr key_link(       ) noexcept = default;
    constexpr key_link( nil_t ) noexcept {}
    key_link( Key const &  key )                                                    : key_{ key } {}
    key_link( Key       && key ) noexcept( std::is_nothrow_move_constructible_v<Key> ) : key_{ std::move( key ) } {}

    key_link & operator=( nil_t ) noexcept { key_.reset(); return *this; }

    [[ nodiscard, gnu::pure ]] bool is_nil() const noexcept { return !key_.has_value(); }
    [[ gnu::pure ]] explicit operator bool() const noexcept { return  key_.has_value(); }

    [[ gnu::pure ]] Key const & operator* () const noexcept { BOOST_ASSERT( key_ ); return *key_; }
    [[ gnu::pure ]] Key const * operator->() const noexcept { BOOST_ASSERT( key_ ); return &*key_; }

    friend bool operator==( key_link const & left, key_link const & right ) noexcept( noexcept( std::declval<Key const &>() == std::declval<Key const &>() ) ) { return left.key_ == right.key_; }
    friend bool operator==( key_link const & link, nil_t                  ) noexcept { return link.is_nil(); }
    friend bool operator==( key_link const & link, Key   const & key      ) noexcept( noexcept( std::declval<Key const &>() == std::declval<Key const &>() ) ) { return link.key_ && ( *link.key_ == key ); }

    friend std::size_t hash_value( key_link const & link ) noexcept
    {
        return link ? boost::hash<Key>{}( *link ) : nil_t::hash;
    }

private:
    std::optional<Key> key_;
}; // class key_link

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------

template <>
struct std::hash<odict::nil_t>
{
    std::size_t operator()( odict::nil_t ) const noexcept { return odict::nil_t::hash; }
};

template <typename Key>
struct std::hash<odict::key_link<Key>>
{
    std::size_t operator()( odict::key_link<Key> const & link ) const noexcept { return hash_value( link ); }
};
//------------------------------------------------------------------------------
