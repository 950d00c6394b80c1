////////////////////////////////////////////////////////////////////////////////
///
/// Compile-time configuration of odict::ordered_map.
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

#include <boost/unordered_map.hpp>

#include <cstdint>
#include <string>
//------------------------------------------------------------------------------
#ifndef ODICT_DEFAULT_VALIDATE_LINKS
#   define ODICT_DEFAULT_VALIDATE_LINKS 0
#endif
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

// what rename() does when the new key is already present
enum class rename_policy : std::uint8_t
{
    reject_existing, // throw key_collision
    overwrite        // drop the displaced entry (its value and its position)
};

enum class relative_position : std::uint8_t { before, after };

struct ordered_map_options
{
    rename_policy rename        { rename_policy::reject_existing };
    // re-verify the whole list (O(n)) at the end of every mutation (debug builds only, through BOOST_ASSERT)
    bool          validate_links{ ODICT_DEFAULT_VALIDATE_LINKS != 0 };
}; // struct ordered_map_options

// Named (keyword style) initial data. Its iteration order is unspecified so
// the ordered_map constructor and update() accept it only to reject it.
template <typename T>
using keyword_args = boost::unordered_map<std::string, T>;

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
