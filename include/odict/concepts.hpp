////////////////////////////////////////////////////////////////////////////////
///
/// The injection seam of odict::ordered_map: what a backing store and the
/// slots it holds have to provide.
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

#include <concepts>
#include <cstddef>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

template <typename Slot, typename Key, typename T>
concept SlotLike = requires( Slot & slot, key_link<Key> link, T value )
{
    { slot.prev  } -> std::same_as<key_link<Key> &>;
    { slot.value } -> std::same_as<T &>;
    { slot.next  } -> std::same_as<key_link<Key> &>;
    Slot{ link, std::move( value ), link };
}; // SlotLike

// a key -> slot associative container with stable (pair-like) elements
template <typename Store>
concept SlotStore = requires( Store & store, Store const & const_store, typename Store::key_type const & key, typename Store::mapped_type slot, typename Store::iterator pos )
{
    typename Store::value_type;
    { store      .find( key ) } -> std::same_as<typename Store::iterator      >;
    { const_store.find( key ) } -> std::same_as<typename Store::const_iterator>;
    { store      .end()       } -> std::same_as<typename Store::iterator      >;
    { const_store.end()       } -> std::same_as<typename Store::const_iterator>;
    { store.find( key )->first  } -> std::convertible_to<typename Store::key_type const &>;
    { store.find( key )->second } -> std::same_as<typename Store::mapped_type &>;
    store.try_emplace( key, std::move( slot ) ).second;
    store.erase( pos );
    { const_store.size() } -> std::convertible_to<std::size_t>;
    store.clear();
}; // SlotStore

// stores which can rekey an element in place (std::map, std::unordered_map, boost::unordered_map...)
template <typename Store>
concept NodeHandleStore = SlotStore<Store> && requires( Store & store, typename Store::iterator pos, typename Store::node_type node )
{
    { store.extract( pos ) } -> std::same_as<typename Store::node_type>;
    node.key() = std::declval<typename Store::key_type>();
    store.insert( std::move( node ) ).position;
}; // NodeHandleStore

// the read/write surface shared by every ordered_map instantiation
template <typename Map>
concept OrderedMapping = requires( Map & map, Map const & const_map, typename Map::key_type const & key, typename Map::mapped_type value )
{
    { const_map.at( key )           } -> std::same_as<typename Map::mapped_type const &>;
    { const_map.contains( key )     } -> std::same_as<bool>;
    { const_map.size()              } -> std::same_as<typename Map::size_type>;
    { const_map.first_key()         } -> std::same_as<typename Map::key_type const &>;
    { const_map.last_key()          } -> std::same_as<typename Map::key_type const &>;
    map.set( key, std::move( value ) );
    map.remove( key );
    map.rename( key, key );
    map.swap( key, key );
    map.move_before( key, key );
    map.move_after ( key, key );
    const_map.keys  ().begin();
    const_map.values().begin();
    const_map.rkeys ().begin();
    const_map.items ().begin();
    const_map.begin(); const_map.end();
    const_map.rbegin(); const_map.rend();
}; // OrderedMapping

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
