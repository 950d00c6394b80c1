////////////////////////////////////////////////////////////////////////////////
///
/// Boost.Serialization support for odict types.
///
/// An ordered_map is saved as a counted sequence of (key, value) items in
/// list order and loaded by replaying set(), so the links are rebuilt rather
/// than stored and the loaded map compares equal to the saved one. Slots and
/// key links can be archived on their own (e.g. for low level dumps): a link
/// is a presence flag followed by the key, so a stored NIL loads back as nil.
///
/// The byte/text level encoding is whatever archive is used (text, xml,
/// binary...). The key and value types need their own serialize support
/// (e.g. boost/serialization/string.hpp for std::string).
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

#include <boost/serialization/collection_size_type.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/split_free.hpp>

#include <cstddef>
#include <utility>
//------------------------------------------------------------------------------
namespace boost::serialization
{
//------------------------------------------------------------------------------

template <class Archive, typename Key>
void save( Archive & ar, odict::key_link<Key> const & link, unsigned int const /*version*/ )
{
    bool const present{ !link.is_nil() };
    ar << make_nvp( "present", present );
    if ( present )
        ar << make_nvp( "key", *link );
}

template <class Archive, typename Key>
void load( Archive & ar, odict::key_link<Key> & link, unsigned int const /*version*/ )
{
    bool present;
    ar >> make_nvp( "present", present );
    if ( present )
    {
        Key key;
        ar >> make_nvp( "key", key );
        link = std::move( key );
    }
    else
    {
        link = odict::nil;
    }
}

template <class Archive, typename Key>
void serialize( Archive & ar, odict::key_link<Key> & link, unsigned int const version )
{
    split_free( ar, link, version );
}


template <class Archive, typename Key, typename T>
void serialize( Archive & ar, odict::slot<Key, T> & slot, unsigned int const /*version*/ )
{
    ar & make_nvp( "prev" , slot.prev  );
    ar & make_nvp( "value", slot.value );
    ar & make_nvp( "next" , slot.next  );
}


template <class Archive, typename Key, typename T, typename Store, odict::ordered_map_options options>
void save( Archive & ar, odict::ordered_map<Key, T, Store, options> const & map, unsigned int const /*version*/ )
{
    collection_size_type const count{ map.size() };
    ar << BOOST_SERIALIZATION_NVP( count );
    for ( auto const & [ key, value ] : map )
    {
        ar << make_nvp( "key"  , key   );
        ar << make_nvp( "value", value );
    }
}

template <class Archive, typename Key, typename T, typename Store, odict::ordered_map_options options>
void load( Archive & ar, odict::ordered_map<Key, T, Store, options> & map, unsigned int const /*version*/ )
{
    map.clear();
    collection_size_type count;
    ar >> BOOST_SERIALIZATION_NVP( count );
    for ( std::size_t i{ 0 }; i < count; ++i )
    {
        Key key;
        T   value;
        ar >> make_nvp( "key"  , key   );
        ar >> make_nvp( "value", value );
        map.set( key, std::move( value ) );
    }
}

template <class Archive, typename Key, typename T, typename Store, odict::ordered_map_options options>
void serialize( Archive & ar, odict::ordered_map<Key, T, Store, options> & map, unsigned int const version )
{
    split_free( ar, map, version );
}

//------------------------------------------------------------------------------
} // namespace boost::serialization
//------------------------------------------------------------------------------
