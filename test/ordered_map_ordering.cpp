////////////////////////////////////////////////////////////////////////////////
/// odict::ordered_map reordering tests (swap, relative insertion and moves,
/// rename)
////////////////////////////////////////////////////////////////////////////////

#include "common.hpp"

#include <odict/ordered_map.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace odict {
//------------------------------------------------------------------------------

using namespace test;

namespace
{
    // checks the forward and the backward walk against each other
    void expect_order( string_map const & m, strings const & expected )
    {
        EXPECT_EQ( keys_of( m ), expected );
        auto reversed{ expected };
        std::ranges::reverse( reversed );
        EXPECT_EQ( rkeys_of( m ), reversed );
        EXPECT_TRUE( m.verify() );
        if ( !expected.empty() )
        {
            EXPECT_EQ( m.head(), expected.front() );
            EXPECT_EQ( m.tail(), expected.back () );
        }
    }

    struct reorder_case
    {
        char const * a;
        char const * b;
        strings      expected;
    };
} // anonymous namespace

//==============================================================================
// swap
//==============================================================================

TEST( ordered_map_ordering, swap )
{
    std::vector<reorder_case> const cases
    {
        { "0", "1", { "1", "0", "2", "3", "4" } }, // head, adjacent
        { "3", "4", { "0", "1", "2", "4", "3" } }, // tail, adjacent
        { "1", "2", { "0", "2", "1", "3", "4" } }, // adjacent
        { "0", "2", { "2", "1", "0", "3", "4" } }, // head, one apart
        { "2", "4", { "0", "1", "4", "3", "2" } }, // tail, one apart
        { "1", "3", { "0", "3", "2", "1", "4" } }, // one apart
        { "0", "4", { "4", "1", "2", "3", "0" } }, // head and tail
    };
    for ( auto const & [ a, b, expected ] : cases )
    {
        SCOPED_TRACE( std::string{ a } + " <-> " + b );
        {
            auto m{ five_items() };
            m.swap( a, b );
            expect_order( m, expected );
        }
        {
            auto m{ five_items() };
            m.swap( b, a );
            expect_order( m, expected );
        }
    }
}

TEST( ordered_map_ordering, swap_keeps_values_with_their_keys )
{
    ordered_map<std::string, int> m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    m.swap( "a", "b" );
    EXPECT_EQ( keys_of( m ), ( strings{ "b", "a", "c" } ) );
    EXPECT_EQ( m.at( "a" ), 1 );
    EXPECT_EQ( m.at( "b" ), 2 );
    EXPECT_EQ( m.at( "c" ), 3 );
}

TEST( ordered_map_ordering, swap_is_its_own_inverse )
{
    auto const original{ five_items() };
    for ( auto const & a : keys_of( original ) )
    {
        for ( auto const & b : keys_of( original ) )
        {
            if ( a == b )
                continue;
            auto m{ original };
            m.swap( a, b );
            m.swap( a, b );
            EXPECT_EQ( m, original ) << a << " <-> " << b;
        }
    }
}

TEST( ordered_map_ordering, swap_two_entries )
{
    string_map m{ { "x", "1" }, { "y", "2" } };
    m.swap( "y", "x" );
    expect_order( m, { "y", "x" } );
}

TEST( ordered_map_ordering, swap_errors )
{
    auto m{ five_items() };
    EXPECT_THROW( m.swap( "1", "1" ), key_collision         );
    EXPECT_THROW( m.swap( "1", "1" ), std::invalid_argument );
    EXPECT_THROW( m.swap( "1", "x" ), key_not_found         );
    EXPECT_THROW( m.swap( "x", "1" ), key_not_found         );
    EXPECT_EQ( m, five_items() );
}

//==============================================================================
// Relative insertion
//==============================================================================

TEST( ordered_map_ordering, insert_relative )
{
    ordered_map<std::string, int> m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    auto const pos{ m.insert_relative( "b", "new", 99, relative_position::before ) };
    EXPECT_EQ( pos->first , "new" );
    EXPECT_EQ( pos->second, 99    );
    EXPECT_EQ( keys_of( m ), ( strings{ "a", "new", "b", "c" } ) );
    EXPECT_EQ( m.get( "new" ), 99 );

    m.move_to_head( "c" );
    EXPECT_EQ( keys_of( m ), ( strings{ "c", "a", "new", "b" } ) );
    EXPECT_TRUE( m.verify() );
}

TEST( ordered_map_ordering, insert_before_and_after )
{
    auto m{ five_items() };
    m.insert_before( "2", "x", "X" );
    expect_order( m, { "0", "1", "x", "2", "3", "4" } );
    m.insert_after( "2", "y", "Y" );
    expect_order( m, { "0", "1", "x", "2", "y", "3", "4" } );
    m.insert_before( "0", "first", "F" );
    expect_order( m, { "first", "0", "1", "x", "2", "y", "3", "4" } );
    m.insert_after( "4", "last", "L" );
    expect_order( m, { "first", "0", "1", "x", "2", "y", "3", "4", "last" } );
    EXPECT_EQ( m.at( "x" ), "X" );
    EXPECT_EQ( m.at( "last" ), "L" );
}

TEST( ordered_map_ordering, insert_into_a_single_entry_map )
{
    string_map m{ { "only", "1" } };
    m.insert_after( "only", "after", "2" );
    m.insert_before( "only", "before", "0" );
    expect_order( m, { "before", "only", "after" } );
}

TEST( ordered_map_ordering, insert_relative_errors )
{
    auto m{ five_items() };
    EXPECT_THROW( m.insert_before( "x", "y", "Y" ), key_not_found );
    EXPECT_THROW( m.insert_before( "1", "3", "Y" ), key_collision ); // already present
    EXPECT_THROW( m.insert_after ( "1", "1", "Y" ), key_collision );
    EXPECT_EQ( m, five_items() );
}

TEST( ordered_map_ordering, insert_at_head_and_tail )
{
    string_map m;
    m.insert_at_head( "b", "B" );
    expect_order( m, { "b" } );
    m.insert_at_head( "a", "A" );
    m.insert_at_tail( "c", "C" );
    expect_order( m, { "a", "b", "c" } );

    string_map tail_first;
    tail_first.insert_at_tail( "z", "Z" );
    expect_order( tail_first, { "z" } );

    EXPECT_THROW( m.insert_at_head( "c", "?" ), key_collision );
    EXPECT_THROW( m.insert_at_tail( "a", "?" ), key_collision );
    EXPECT_EQ( m.at( "c" ), "C" );
}

TEST( ordered_map_ordering, remove_then_insert_restores_the_order )
{
    auto const original{ five_items() };
    for ( auto const & key : keys_of( original ) )
    {
        auto m{ original };
        auto const value{ m.at( key ) };
        if ( key != m.last_key() )
        {
            auto const next{ m.next_key( key ) };
            m.remove( key );
            m.insert_before( next, key, value );
        }
        else
        {
            auto const prev{ m.prev_key( key ) };
            m.remove( key );
            m.insert_after( prev, key, value );
        }
        EXPECT_EQ( m, original ) << key;
    }
}

//==============================================================================
// Relative moves
//==============================================================================

TEST( ordered_map_ordering, move_before )
{
    std::vector<reorder_case> const cases
    {
        { "1", "3", { "0", "3", "1", "2", "4" } },
        { "2", "3", { "0", "1", "3", "2", "4" } },
        { "3", "2", { "0", "1", "2", "3", "4" } }, // already there
        { "0", "2", { "2", "0", "1", "3", "4" } }, // new head
        { "0", "4", { "4", "0", "1", "2", "3" } }, // tail to head
        { "4", "0", { "1", "2", "3", "0", "4" } },
    };
    for ( auto const & [ ref, key, expected ] : cases )
    {
        SCOPED_TRACE( std::string{ key } + " before " + ref );
        auto m{ five_items() };
        m.move_before( ref, key );
        expect_order( m, expected );
        EXPECT_EQ( m.at( key ), five_items().at( key ) );
    }
}

TEST( ordered_map_ordering, move_after )
{
    std::vector<reorder_case> const cases
    {
        { "1", "3", { "0", "1", "3", "2", "4" } },
        { "3", "2", { "0", "1", "3", "2", "4" } },
        { "2", "3", { "0", "1", "2", "3", "4" } }, // already there
        { "4", "0", { "1", "2", "3", "4", "0" } }, // new tail
        { "4", "2", { "0", "1", "3", "4", "2" } },
        { "0", "4", { "0", "4", "1", "2", "3" } },
    };
    for ( auto const & [ ref, key, expected ] : cases )
    {
        SCOPED_TRACE( std::string{ key } + " after " + ref );
        auto m{ five_items() };
        m.move_after( ref, key );
        expect_order( m, expected );
    }
}

TEST( ordered_map_ordering, move_relative_matches_the_named_forms )
{
    auto before{ five_items() };
    auto after { five_items() };
    before.move_relative( "1", "4", relative_position::before );
    after .move_relative( "1", "4", relative_position::after  );
    expect_order( before, { "0", "4", "1", "2", "3" } );
    expect_order( after , { "0", "1", "4", "2", "3" } );
}

TEST( ordered_map_ordering, move_errors )
{
    auto m{ five_items() };
    EXPECT_THROW( m.move_before( "1", "1" ), key_collision );
    EXPECT_THROW( m.move_after ( "1", "1" ), key_collision );
    EXPECT_THROW( m.move_before( "x", "1" ), key_not_found );
    EXPECT_THROW( m.move_after ( "1", "x" ), key_not_found );
    EXPECT_THROW( m.move_to_head( "x" )    , key_not_found );
    EXPECT_THROW( m.move_to_tail( "x" )    , key_not_found );
    EXPECT_EQ( m, five_items() );
}

TEST( ordered_map_ordering, move_to_head_and_tail )
{
    auto m{ five_items() };
    m.move_to_head( "3" );
    expect_order( m, { "3", "0", "1", "2", "4" } );
    m.move_to_head( "3" );
    expect_order( m, { "3", "0", "1", "2", "4" } );
    m.move_to_tail( "3" );
    expect_order( m, { "0", "1", "2", "4", "3" } );
    m.move_to_tail( "0" );
    expect_order( m, { "1", "2", "4", "3", "0" } );
    m.move_to_head( "0" );
    expect_order( m, { "0", "1", "2", "4", "3" } );

    string_map single{ { "a", "b" } };
    single.move_to_head( "a" );
    single.move_to_tail( "a" );
    expect_order( single, { "a" } );
}

//==============================================================================
// rename
//==============================================================================

TEST( ordered_map_ordering, rename )
{
    std::vector<std::pair<char const *, strings>> const cases
    {
        { "0", { "new", "1", "2", "3", "4" } },
        { "2", { "0", "1", "new", "3", "4" } },
        { "4", { "0", "1", "2", "3", "new" } },
    };
    for ( auto const & [ old_key, expected ] : cases )
    {
        SCOPED_TRACE( old_key );
        auto m{ five_items() };
        auto const value{ m.at( old_key ) };
        m.rename( old_key, "new" );
        expect_order( m, expected );
        EXPECT_FALSE( m.contains( old_key ) );
        EXPECT_EQ   ( m.at( "new" ), value );
        EXPECT_EQ   ( m.size(), 5 );
    }
}

TEST( ordered_map_ordering, rename_a_single_entry )
{
    string_map m{ { "a", "1" } };
    m.rename( "a", "b" );
    expect_order( m, { "b" } );
    EXPECT_EQ( m.at( "b" ), "1" );
}

TEST( ordered_map_ordering, rename_to_a_neighbour_of_itself )
{
    // renaming back and forth through several keys
    auto m{ five_items() };
    m.rename( "1", "x" );
    m.rename( "2", "1" );
    m.rename( "x", "2" );
    expect_order( m, { "0", "2", "1", "3", "4" } );
    EXPECT_EQ( m.at( "2" ), "b" );
    EXPECT_EQ( m.at( "1" ), "c" );
}

TEST( ordered_map_ordering, rename_errors )
{
    auto m{ five_items() };
    EXPECT_THROW( m.rename( "1", "3" ), key_collision );
    EXPECT_THROW( m.rename( "1", "1" ), key_collision );
    EXPECT_THROW( m.rename( "x", "y" ), key_not_found );
    EXPECT_EQ( m, five_items() );
}

TEST( ordered_map_ordering, rename_with_overwrite_policy )
{
    using overwriting_map = ordered_map
    <
        std::string, std::string,
        default_store<std::string, std::string>,
        ordered_map_options{ .rename = rename_policy::overwrite }
    >;

    overwriting_map m{ { "0", "a" }, { "1", "b" }, { "2", "c" }, { "3", "d" }, { "4", "e" } };
    m.rename( "1", "3" ); // displaces "3"
    EXPECT_EQ( keys_of( m ), ( strings{ "0", "3", "2", "4" } ) );
    EXPECT_EQ( m.at( "3" ), "b" );
    EXPECT_TRUE( m.verify() );

    m.rename( "3", "2" ); // displaces its own successor
    EXPECT_EQ( keys_of ( m ), ( strings{ "0", "2", "4" } ) );
    EXPECT_EQ( rkeys_of( m ), ( strings{ "4", "2", "0" } ) );
    EXPECT_EQ( m.at( "2" ), "b" );

    m.rename( "2", "0" ); // displaces its own predecessor (the head)
    EXPECT_EQ( keys_of( m ), ( strings{ "0", "4" } ) );
    EXPECT_EQ( m.head(), std::string{ "0" } );
    EXPECT_EQ( m.at( "0" ), "b" );
    EXPECT_TRUE( m.verify() );

    EXPECT_THROW( m.rename( "x", "0" ), key_not_found );
}

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
