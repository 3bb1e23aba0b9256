////////////////////////////////////////////////////////////////////////////////
/// Unordered open addressing hash table
///
/// psi::tables::table<Key, T, Hash, KeyEqual> maps unique keys to values with
/// no ordering guarantee: iteration (and therefore rendering) follows the
/// physical slot order of the backing array.
///
/// Interface summary:
///   - table( initial_capacity = 64 )   - capacity must be a power of two
///   - table::from_pairs( range )       - sized to bit_ceil( size + 10 )
///   - get / operator[]                 - value or T{} for a missing key
///   - at                               - mutable reference, throws on a missing key
///   - set                              - insert or overwrite
///   - add                              - insert without a uniqueness check
///   - erase                            - tombstones the slot
///   - index_by( collection, projection ) (free function)
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

#include <boost/container_hash/hash.hpp>

#include <functional>
#include <initializer_list>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::tables
{
//------------------------------------------------------------------------------

template
<
    typename Key,
    typename T,
    typename Hash     = boost::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class table
    : public detail::table_impl<table<Key, T, Hash, KeyEqual>, detail::kv_slot<Key, T>, Hash, KeyEqual>
{
private:
    using base = detail::table_impl<table<Key, T, Hash, KeyEqual>, detail::kv_slot<Key, T>, Hash, KeyEqual>;
    friend base;

public:
    static constexpr char const container_name[]{ "table" };

    using typename base::size_type;
    using typename base::value_type;

    explicit table( size_type const initial_capacity = default_initial_capacity, Hash const & hash = {}, KeyEqual const & equal = {} )
        : base{ initial_capacity, hash, equal } {}

    table( std::initializer_list<value_type> const pairs )
        : table( detail::capacity_for( pairs.size() ) )
    {
        for ( auto const & [ key, value ] : pairs )
            this->set( key, value );
    }

    /// Later pairs overwrite the values of earlier pairs with an equal key.
    template <std::ranges::input_range Pairs>
    static table from_pairs( Pairs && pairs ) { return base::from_pairs_impl( std::forward<Pairs>( pairs ) ); }
    static table from_pairs( std::initializer_list<value_type> const pairs ) { return base::from_pairs_impl( pairs ); }

    using base::set;
    using base::add;
    using base::erase;

    [[ nodiscard ]] friend bool operator==( table const & left, table const & right ) { return left.equal_to( right ); }
}; // class table


/// Builds a table keyed by projection( element ) for every element of the
/// collection (later elements win for equal keys).
template <std::ranges::input_range Collection, typename Projection>
auto index_by( Collection && collection, Projection projection )
{
    using element_type = std::ranges::range_value_t<Collection>;
    using key_type     = std::remove_cvref_t<std::invoke_result_t<Projection &, element_type const &>>;

    table<key_type, element_type> result;
    for ( element_type const & element : collection )
        result.set( std::invoke( projection, element ), element );
    return result;
}

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
