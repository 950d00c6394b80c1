////////////////////////////////////////////////////////////////////////////////
/// Exception types reported by odict containers.
///
/// All errors are local, synchronous and non-retryable: they signal a
/// programming error or absent data. Each kind derives from the standard
/// exception closest in meaning so generic handlers (e.g. for std::map::at
/// style std::out_of_range) keep working:
///   - key_not_found, empty_structure, index_out_of_range → std::out_of_range
///   - key_collision, invalid_arity, invalid_configuration → std::invalid_argument
///
/// Throw sites go through the cold, out-of-line detail::throw_* helpers
/// (defined in src/error.cpp) to keep the inlined container code small.
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

#include <stdexcept>
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

class key_not_found         : public std::out_of_range     { public: using std::out_of_range    ::out_of_range;     };
class empty_structure       : public std::out_of_range     { public: using std::out_of_range    ::out_of_range;     };
class index_out_of_range    : public std::out_of_range     { public: using std::out_of_range    ::out_of_range;     };
class key_collision         : public std::invalid_argument { public: using std::invalid_argument::invalid_argument; };
class invalid_arity         : public std::invalid_argument { public: using std::invalid_argument::invalid_argument; };
class invalid_configuration : public std::invalid_argument { public: using std::invalid_argument::invalid_argument; };

namespace detail
{
    // 'where' names the failing operation (e.g. "odict::ordered_map::at")
    [[ noreturn, gnu::cold ]] void throw_key_not_found        ( char const * where );
    [[ noreturn, gnu::cold ]] void throw_empty_structure      ( char const * where );
    [[ noreturn, gnu::cold ]] void throw_index_out_of_range   ( char const * where );
    [[ noreturn, gnu::cold ]] void throw_key_collision        ( char const * where );
    [[ noreturn, gnu::cold ]] void throw_key_exists           ( char const * where ); // key_collision w/ an already stored key
    [[ noreturn, gnu::cold ]] void throw_invalid_arity        ( char const * where );
    [[ noreturn, gnu::cold ]] void throw_invalid_field        ( char const * where ); // invalid_arity w/ a field of the wrong kind
    [[ noreturn, gnu::cold ]] void throw_invalid_configuration( char const * where );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
