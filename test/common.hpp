////////////////////////////////////////////////////////////////////////////////
/// Shared helpers for the odict unit tests
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <odict/ordered_map.hpp>

#include <ranges>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace odict::test {
//------------------------------------------------------------------------------

using strings    = std::vector<std::string>;
using string_map = ordered_map<std::string, std::string>;

template <std::ranges::input_range Range>
auto to_vector( Range && range )
{
    std::vector<std::ranges::range_value_t<Range>> result;
    for ( auto && element : range )
        result.push_back( element );
    return result;
}

template <typename Map> auto keys_of  ( Map const & map ) { return to_vector( map.keys   () ); }
template <typename Map> auto values_of( Map const & map ) { return to_vector( map.values () ); }
template <typename Map> auto rkeys_of ( Map const & map ) { return to_vector( map.rkeys  () ); }
template <typename Map> auto rvalues_of( Map const & map ) { return to_vector( map.rvalues() ); }

// ('0', 'a') ... ('4', 'e')
inline string_map five_items()
{
    return { { "0", "a" }, { "1", "b" }, { "2", "c" }, { "3", "d" }, { "4", "e" } };
}

//------------------------------------------------------------------------------
} // namespace odict::test
//------------------------------------------------------------------------------
