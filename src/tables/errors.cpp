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
#include <psi/tables/abi.hpp>

#include <stdexcept>
#include <string>
//------------------------------------------------------------------------------
namespace psi::tables
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_not_found( char const * const container, std::string_view const key )
    {
        std::string message{ container };
        message += ": key not found";
        if ( !key.empty() )
        {
            message += ": ";
            message += key;
        }
        throw std::out_of_range( message );
    }

    [[ noreturn, gnu::cold ]] void throw_empty_container( char const * const container, char const * const operation )
    {
        std::string message{ container };
        message += "::";
        message += operation;
        message += "() called on an empty container";
        throw std::domain_error( message );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
