////////////////////////////////////////////////////////////////////////////////
/// Key frequency counting hash table
///
/// count_table<Key> maps keys to strictly positive counts. A zero count marks
/// an Empty slot, so there is no erase operation and a key can never be seen
/// with a zero count. get() of a missing key returns 0.
///
/// sort() is destructive: it shell sorts the backing array itself by
/// descending count, after which the table no longer satisfies the probing
/// invariant. After sort() the table may only be iterated (in descending
/// count order) or destroyed; lookups give unspecified results and mutation
/// is a contract violation.
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

#include "table_common.hpp"

#include <psi/build/disable_warnings.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ranges>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::tables
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

template
<
    typename Key,
    typename Count    = std::size_t,
    typename Hash     = boost::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class count_table
    : public detail::table_impl<count_table<Key, Count, Hash, KeyEqual>, detail::count_slot<Key, Count>, Hash, KeyEqual>
{
private:
    using base = detail::table_impl<count_table<Key, Count, Hash, KeyEqual>, detail::count_slot<Key, Count>, Hash, KeyEqual>;
    friend base;

public:
    static constexpr char const container_name[]{ "count_table" };

    using typename base::key_type;
    using typename base::size_type;
    using typename base::key_const_arg;
    using count_type = Count;
    using entry      = std::pair<key_type, count_type>;

    // counts are only ever modified through increment() and set()
    using       iterator = typename base::const_iterator;
    using const_iterator = typename base::const_iterator;

    explicit count_table( size_type const initial_capacity = default_initial_capacity, Hash const & hash = {}, KeyEqual const & equal = {} )
        : base{ initial_capacity, hash, equal } {}

    count_table( std::initializer_list<key_type> const keys )
        : count_table( detail::capacity_for( keys.size() ) )
    {
        for ( auto const & key : keys )
            increment( key );
    }

    /// Every occurrence of a key in the range counts once.
    template <std::ranges::input_range Keys>
    static count_table from_keys( Keys && keys )
    {
        size_type initial_capacity{ default_initial_capacity };
        if constexpr ( std::ranges::sized_range<Keys> )
            initial_capacity = detail::capacity_for( static_cast<size_type>( std::ranges::size( keys ) ) );
        count_table result( initial_capacity );
        for ( auto const & key : keys )
            result.increment( key );
        return result;
    }

    [[ nodiscard ]] const_iterator begin() const noexcept { return base::begin(); }
    [[ nodiscard ]] const_iterator end  () const noexcept { return base::end  (); }

    /// \throws std::out_of_range if key was never counted
    /// The count may be adjusted in place but must stay positive: a zero
    /// count would turn the slot Empty behind the table's back.
    [[ nodiscard ]] count_type & at( key_const_arg key )
    {
        BOOST_ASSERT_MSG( !sorted_, "count_table modified after sort()" );
        return base::at( key );
    }
    [[ nodiscard ]] count_type const & at( key_const_arg key ) const { return base::at( key ); }

    /// Overwrites (or inserts) the count of key.
    void set( key_const_arg key, count_type const count )
    {
        BOOST_ASSERT_MSG( count > 0, "Counts must be positive" );
        BOOST_ASSERT_MSG( !sorted_, "count_table modified after sort()" );
        base::set( key, count );
    }

    void increment( key_const_arg key, count_type const delta = 1 )
    {
        BOOST_ASSERT_MSG( delta > 0, "Counts must be positive" );
        BOOST_ASSERT_MSG( !sorted_, "count_table modified after sort()" );
        auto const index{ this->find_index( key ) };
        if ( index != base::engine::npos )
            this->slot( index ).value += delta;
        else
            this->insert_new( key, delta );
    }

    /// The entry with the lowest count (the first one found in iteration
    /// order on ties).
    /// \throws std::domain_error if the table is empty
    [[ nodiscard ]] entry smallest() const { return extreme( "smallest", std::less   <count_type>{} ); }
    /// The entry with the highest count (the first one found in iteration
    /// order on ties).
    /// \throws std::domain_error if the table is empty
    [[ nodiscard ]] entry largest () const { return extreme( "largest" , std::greater<count_type>{} ); }

    /// Shell sort of the backing array by descending count (Knuth's 3h+1
    /// gaps; ties in unspecified order). Destructive, see the file header.
    void sort() noexcept
    {
        auto const slots{ this->slots() };
        auto const n    { slots.size() };

        size_type gap{ 1 };
        while ( gap < n / 3 )
            gap = 3 * gap + 1;
        for ( ; ; )
        {
            for ( auto i{ gap }; i < n; ++i )
            {
                for ( auto j{ i }; ( j >= gap ) && ( slots[ j - gap ].value < slots[ j ].value ); j -= gap )
                {
                    using std::swap;
                    swap( slots[ j ], slots[ j - gap ] );
                }
            }
            if ( gap == 1 )
                break;
            gap /= 3;
        }
        sorted_ = true;
    }

    [[ nodiscard ]] bool sorted() const noexcept { return sorted_; }

private:
    void on_cleared() noexcept { sorted_ = false; }

    template <typename Better>
    entry extreme( char const * const operation, Better const better ) const
    {
        if ( this->empty() ) [[ unlikely ]]
            detail::throw_empty_container( container_name, operation );
        auto       it  { begin() };
        auto       best{ it };
        auto const last{ end() };
        while ( ++it != last )
        {
            if ( better( ( *it ).second, ( *best ).second ) )
                best = it;
        }
        auto const [ key, count ]{ *best };
        return { key, count };
    }

    bool sorted_{ false };
}; // class count_table

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
