////////////////////////////////////////////////////////////////////////////////
/// Reference counted handle over any psi::tables container
///
/// shared_table<Table> gives the containers reference semantics: copies of a
/// handle alias one and the same table, which lives until the last handle
/// goes away. The table itself is reached through -> and *.
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

#include <concepts>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::tables
{
//------------------------------------------------------------------------------

template <typename Table>
class shared_table
{
public:
    using table_type = Table;

    shared_table() : p_table_{ std::make_shared<Table>() } {}
    explicit shared_table( std::shared_ptr<Table> p_table ) noexcept : p_table_{ std::move( p_table ) } { BOOST_ASSERT( p_table_ ); }

    [[ nodiscard ]] Table * operator->() const noexcept { return  p_table_.get(); }
    [[ nodiscard ]] Table & operator* () const noexcept { return *p_table_;       }

    [[ nodiscard ]] long use_count() const noexcept { return p_table_.use_count(); }

    [[ nodiscard ]] std::string to_string() const { return p_table_->to_string(); }

    friend std::ostream & operator<<( std::ostream & os, shared_table const & table ) { return os << *table; }

    /// Handles compare equal when they alias one table or the tables
    /// themselves compare equal.
    [[ nodiscard ]] friend bool operator==( shared_table const & left, shared_table const & right ) requires std::equality_comparable<Table>
    {
        return ( left.p_table_ == right.p_table_ ) || ( *left == *right );
    }

private:
    std::shared_ptr<Table> p_table_;
}; // class shared_table

template <typename Table, typename ... Args>
[[ nodiscard ]] shared_table<Table> make_shared_table( Args && ... args )
{
    return shared_table<Table>{ std::make_shared<Table>( std::forward<Args>( args )... ) };
}

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
