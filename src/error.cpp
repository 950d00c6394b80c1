////////////////////////////////////////////////////////////////////////////////
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
#include <odict/error.hpp>

#include <string>
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

namespace detail
{
    namespace
    {
        std::string describe( char const * const where, char const * const what )
        {
            std::string message{ where };
            message += ": ";
            message += what;
            return message;
        }
    } // anonymous namespace

    [[ noreturn, gnu::cold ]] void throw_key_not_found        ( char const * const where ) { throw key_not_found        ( describe( where, "key not found"                                   ) ); }
    [[ noreturn, gnu::cold ]] void throw_empty_structure      ( char const * const where ) { throw empty_structure      ( describe( where, "ordered dictionary is empty"                     ) ); }
    [[ noreturn, gnu::cold ]] void throw_index_out_of_range   ( char const * const where ) { throw index_out_of_range   ( describe( where, "index out of range"                              ) ); }
    [[ noreturn, gnu::cold ]] void throw_key_collision        ( char const * const where ) { throw key_collision        ( describe( where, "keys must be distinct"                           ) ); }
    [[ noreturn, gnu::cold ]] void throw_key_exists           ( char const * const where ) { throw key_collision        ( describe( where, "key already present"                             ) ); }
    [[ noreturn, gnu::cold ]] void throw_invalid_arity        ( char const * const where ) { throw invalid_arity        ( describe( where, "expected exactly three fields (prev, value, next)" ) ); }
    [[ noreturn, gnu::cold ]] void throw_invalid_field        ( char const * const where ) { throw invalid_arity        ( describe( where, "expected (link, value, link) fields"               ) ); }
    [[ noreturn, gnu::cold ]] void throw_invalid_configuration( char const * const where ) { throw invalid_configuration( describe( where, "takes no keyword arguments to avoid an ordering trap" ) ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
