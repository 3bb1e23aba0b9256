////////////////////////////////////////////////////////////////////////////////
/// Argument passing and error plumbing shared by the psi::tables containers.
///
/// Contents:
///   - can_be_passed_in_reg<T> - trait: pass by value instead of by const &?
///   - key_const_arg_t<Key>    - key-passing type for lookup functions
///   - renderable / append_rendered - value to text for the {k: v} rendering
///   - detail::throw_*         - out-of-line cold throwers (src/tables/errors.cpp)
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

#include <psi/build/disable_warnings.hpp>

#include <boost/config.hpp>

#include <charconv>
#include <concepts>
#include <iterator>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::tables
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

// Keys are hashed and compared on every probe step so trivial/small keys go
// by value, everything else (strings, tuples of strings...) by const &.
template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivially_copyable_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV
}; // can_be_passed_in_reg

template <typename Key>
using key_const_arg_t = std::conditional_t<can_be_passed_in_reg<Key>, Key const, Key const &>;


/// Detects types that behave as strings (basic_string, string_view, char
/// arrays...): rendered verbatim, without quotes.
template <typename T>
concept string_viewable = std::convertible_to<T const &, std::string_view>;

template <typename T>
concept stream_insertable = requires( std::ostream & os, T const & value ) { os << value; };

template <typename T>
concept renderable =
    string_viewable<T>            ||
    std::is_arithmetic_v<T>       ||
    stream_insertable<T>;

namespace detail
{
    /// Appends the textual form of value to out: strings verbatim, bools as
    /// true/false, numbers through to_chars, anything else through its
    /// operator<<.
    template <renderable T>
    void append_rendered( std::string & out, T const & value )
    {
        if constexpr ( string_viewable<T> )
        {
            out += std::string_view{ value };
        }
        else
        if constexpr ( std::is_same_v<T, bool> )
        {
            out += value ? "true" : "false";
        }
        else
        if constexpr ( std::is_same_v<T, char> )
        {
            out += value;
        }
        else
        if constexpr ( std::is_arithmetic_v<T> )
        {
            char buffer[ 64 ];
            auto const result{ std::to_chars( std::begin( buffer ), std::end( buffer ), value ) };
            out.append( buffer, result.ptr );
        }
        else
        {
            std::ostringstream stream;
            stream << value;
            out += std::move( stream ).str();
        }
    }

    template <typename T>
    std::string rendered( T const & value )
    {
        std::string result;
        if constexpr ( renderable<T> )
            append_rendered( result, value );
        return result;
    }

    [[ noreturn, gnu::cold ]] void throw_key_not_found   ( char const * container, std::string_view key );
    [[ noreturn, gnu::cold ]] void throw_empty_container( char const * container, char const * operation );
} // namespace detail

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
