////////////////////////////////////////////////////////////////////////////////
/// psi::tables::ordered_table unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/tables/ordered_table.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <compare>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::tables {
//------------------------------------------------------------------------------

namespace
{
    template <typename Table>
    auto keys_of( Table const & t )
    {
        std::vector<typename Table::key_type> keys;
        for ( auto const & [ key, value ] : t )
            keys.push_back( key );
        return keys;
    }
} // anonymous namespace

//==============================================================================
// Insertion order
//==============================================================================

TEST( ordered_table, iterates_in_insertion_order )
{
    ordered_table<std::string, int> t;
    t.set( "zeta" , 1 );
    t.set( "alpha", 2 );
    t.set( "mu"   , 3 );
    t.set( "alpha", 4 ); // overwrite keeps the original position

    EXPECT_EQ( keys_of( t ), ( std::vector<std::string>{ "zeta", "alpha", "mu" } ) );
    EXPECT_EQ( t.get( "alpha" ), 4 );
    EXPECT_EQ( t.to_string(), "{zeta: 1, alpha: 4, mu: 3}" );
}

TEST( ordered_table, order_survives_growth )
{
    std::vector<int> keys( 500 );
    std::iota( keys.begin(), keys.end(), 0 );
    std::shuffle( keys.begin(), keys.end(), std::mt19937{ 1234 } );

    ordered_table<int, int> t( 8 );
    for ( auto const key : keys )
        t.set( key, key * 2 );

    EXPECT_GT( t.capacity(), 500 );
    EXPECT_EQ( t.size(), 500 );
    EXPECT_EQ( keys_of( t ), keys );
    for ( auto const key : keys )
        EXPECT_EQ( t.at( key ), key * 2 );
}

TEST( ordered_table, growth_with_arguments_referring_into_the_table )
{
    std::string const long_value( 100, 'x' );
    ordered_table<int, std::string> t( 8 );
    for ( auto key{ 0 }; key < 5; ++key )
        t.set( key, long_value + std::to_string( key ) );

    t.set( 99, t.at( 0 ) ); // grows to 16
    EXPECT_EQ( t.capacity(), 16 );
    EXPECT_EQ( t.get( 99 ), long_value + "0" );
    EXPECT_EQ( keys_of( t ), ( std::vector<int>{ 0, 1, 2, 3, 4, 99 } ) );
}

TEST( ordered_table, from_pairs )
{
    auto const t{ ordered_table<int, char>::from_pairs( { { 3, 'c' }, { 1, 'a' }, { 2, 'b' }, { 3, 'C' } } ) };
    EXPECT_EQ( keys_of( t ), ( std::vector<int>{ 3, 1, 2 } ) );
    EXPECT_EQ( t.get( 3 ), 'C' );
    EXPECT_EQ( t.to_string(), "{3: C, 1: a, 2: b}" );
}

//==============================================================================
// Erase
//==============================================================================

TEST( ordered_table, erase_keeps_the_remaining_order )
{
    ordered_table<int, int> t;
    std::vector<int> expected;
    for ( auto key{ 0 }; key < 30; ++key )
        t.set( key, key );
    for ( auto key{ 0 }; key < 30; ++key )
    {
        if ( key % 3 == 0 )
            EXPECT_EQ( t.erase( key ), 1 );
        else
            expected.push_back( key );
    }
    EXPECT_EQ( t.size(), expected.size() );
    EXPECT_EQ( keys_of( t ), expected );

    // re-inserting an erased key appends it
    t.set( 0, 100 );
    expected.push_back( 0 );
    EXPECT_EQ( keys_of( t ), expected );

    // growth compacts the tombstones away without disturbing the order
    for ( auto key{ 100 }; key < 200; ++key )
    {
        t.set( key, key );
        expected.push_back( key );
    }
    EXPECT_EQ( keys_of( t ), expected );
}

TEST( ordered_table, erase_everything )
{
    ordered_table<int, int> t{ { 1, 1 }, { 2, 2 } };
    t.erase( 1 );
    t.erase( 2 );
    EXPECT_TRUE( t.empty() );
    EXPECT_EQ  ( t.begin(), t.end() );
    EXPECT_EQ  ( t.to_string(), "{}" );

    t.set( 3, 3 );
    EXPECT_EQ( keys_of( t ), std::vector<int>{ 3 } );
}

TEST( ordered_table, tombstone_purge_keeps_the_order )
{
    ordered_table<int, int> t;
    for ( auto key{ 0 }; key < 40; ++key )
        t.set( key, key );
    std::vector<int> expected;
    for ( auto key{ 0 }; key < 40; ++key )
    {
        if ( key % 4 == 0 )
            expected.push_back( key );
        else
            t.erase( key );
    }
    for ( auto key{ 50 }; key < 60; ++key )
    {
        t.set( key, key );
        expected.push_back( key );
    }
    EXPECT_EQ( t.capacity(), 64 );
    EXPECT_EQ( keys_of( t ), expected );
}

//==============================================================================
// Sort
//==============================================================================

TEST( ordered_table, sort_with_less_than_predicate )
{
    ordered_table<int, std::string> t;
    for ( auto const key : { 5, 3, 9, 1, 7, 2 } )
        t.set( key, std::to_string( key ) );

    t.sort( []( auto const & left, auto const & right ) { return left.first < right.first; } );
    EXPECT_EQ( keys_of( t ), ( std::vector<int>{ 1, 2, 3, 5, 7, 9 } ) );
    EXPECT_EQ( t.to_string(), "{1: 1, 2: 2, 3: 3, 5: 5, 7: 7, 9: 9}" );

    // lookups are unaffected
    for ( auto const key : { 5, 3, 9, 1, 7, 2 } )
        EXPECT_EQ( t.at( key ), std::to_string( key ) );
}

TEST( ordered_table, sort_with_three_way_comparator )
{
    ordered_table<std::string, int> t{ { "a", 3 }, { "b", 1 }, { "c", 2 } };
    t.sort( []( auto const & left, auto const & right ) { return left.second - right.second; } );
    EXPECT_EQ( keys_of( t ), ( std::vector<std::string>{ "b", "c", "a" } ) );

    t.sort( []( auto const & left, auto const & right ) { return right.first <=> left.first; } );
    EXPECT_EQ( keys_of( t ), ( std::vector<std::string>{ "c", "b", "a" } ) );
}

TEST( ordered_table, sort_is_stable )
{
    ordered_table<int, int> t;
    for ( auto key{ 0 }; key < 100; ++key )
        t.set( key, key % 3 );

    t.sort( []( auto const & left, auto const & right ) { return left.second < right.second; } );

    std::vector<std::pair<int, int>> entries;
    for ( auto const & [ key, value ] : t )
        entries.emplace_back( value, key );
    ASSERT_EQ  ( entries.size(), 100 );
    EXPECT_TRUE( std::is_sorted( entries.begin(), entries.end() ) ); // by value, then by insertion order
}

TEST( ordered_table, sort_large_random )
{
    std::mt19937 rng{ std::random_device{}() };
    std::uniform_int_distribution<int> dist( -1000, 1000 );

    ordered_table<int, int> t;
    for ( auto i{ 0 }; i < 1000; ++i )
        t.set( i, dist( rng ) );
    for ( auto i{ 0 }; i < 1000; i += 7 )
        t.erase( i );
    auto const size{ t.size() };

    t.sort( []( auto const & left, auto const & right ) { return left.second <=> right.second; } );

    std::vector<int> values;
    for ( auto const & [ key, value ] : t )
        values.push_back( value );
    EXPECT_EQ  ( values.size(), size );
    EXPECT_TRUE( std::is_sorted( values.begin(), values.end() ) );
}

TEST( ordered_table, throwing_comparator_keeps_every_entry )
{
    ordered_table<int, int> t;
    for ( auto key{ 0 }; key < 50; ++key )
        t.set( key, 50 - key );
    t.erase( 7 );

    auto calls{ 0 };
    EXPECT_THROW
    (
        t.sort( [ &calls ]( auto const & left, auto const & right ) { if ( ++calls == 20 ) throw std::runtime_error( "comparison failed" ); return left.second < right.second; } ),
        std::runtime_error
    );

    auto keys{ keys_of( t ) };
    EXPECT_EQ( keys.size(), t.size() );
    std::sort( keys.begin(), keys.end() );
    std::vector<int> expected;
    for ( auto key{ 0 }; key < 50; ++key )
    {
        if ( key != 7 )
            expected.push_back( key );
    }
    EXPECT_EQ( keys, expected );

    t.set( 100, 0 );
    EXPECT_EQ( keys_of( t ).back(), 100 );

    auto const by_key{ []( auto const & left, auto const & right ) noexcept { return left.first < right.first; } };
    static_assert( noexcept( t.sort( by_key ) ) );
    t.sort( by_key );
    EXPECT_EQ( keys_of( t ).front(), 0 );
    EXPECT_EQ( keys_of( t ).back (), 100 );
}

TEST( ordered_table, insertions_after_sort_are_appended )
{
    ordered_table<int, int> t{ { 3, 0 }, { 1, 0 }, { 2, 0 } };
    t.sort( []( auto const & left, auto const & right ) { return left.first < right.first; } );
    t.set( 0, 0 );
    t.set( 2, 5 ); // overwrite: stays in place
    EXPECT_EQ( keys_of( t ), ( std::vector<int>{ 1, 2, 3, 0 } ) );

    for ( auto key{ 10 }; key < 100; ++key )
        t.set( key, 0 );
    auto const keys{ keys_of( t ) };
    ASSERT_EQ( keys.size(), 94 );
    EXPECT_EQ( keys[ 3 ], 0 );
    EXPECT_EQ( keys[ 4 ], 10 );
    EXPECT_EQ( keys.back(), 99 );
}

TEST( ordered_table, sort_empty )
{
    ordered_table<int, int> t;
    t.sort( []( auto const & left, auto const & right ) { return left.first < right.first; } );
    EXPECT_TRUE( t.empty() );
    t.set( 1, 1 );
    EXPECT_EQ( keys_of( t ), std::vector<int>{ 1 } );
}

//==============================================================================
// Iteration, equality & value semantics
//==============================================================================

TEST( ordered_table, mutable_iteration )
{
    ordered_table<int, int> t{ { 1, 1 }, { 2, 2 } };
    for ( auto [ key, value ] : t )
        value *= 10;
    EXPECT_EQ( t.get( 1 ), 10 );
    EXPECT_EQ( t.get( 2 ), 20 );

    ordered_table<int, int>::const_iterator const first{ t.begin() };
    EXPECT_EQ( ( *first ).first, 1 );
    EXPECT_TRUE( first == t.cbegin() );
}

TEST( ordered_table, equality_ignores_order )
{
    using map = ordered_table<int, std::string>;
    EXPECT_EQ( map::from_pairs( { { 1, "a" }, { 2, "b" } } ), map::from_pairs( { { 2, "b" }, { 1, "a" } } ) );
    EXPECT_NE( map::from_pairs( { { 1, "a" }, { 2, "b" } } ), map::from_pairs( { { 1, "a" }, { 2, "c" } } ) );
}

TEST( ordered_table, copy_and_move )
{
    ordered_table<int, int> original{ { 2, 2 }, { 1, 1 } };
    auto copy{ original };
    copy.set( 0, 0 );
    EXPECT_EQ( keys_of( original ), ( std::vector<int>{ 2, 1 } ) );
    EXPECT_EQ( keys_of( copy     ), ( std::vector<int>{ 2, 1, 0 } ) );

    auto moved{ std::move( copy ) };
    EXPECT_EQ  ( keys_of( moved ), ( std::vector<int>{ 2, 1, 0 } ) );
    EXPECT_TRUE( copy.empty() ); // NOLINT(bugprone-use-after-move)
    EXPECT_EQ  ( copy.begin(), copy.end() );
    copy.set( 7, 7 );
    EXPECT_EQ  ( keys_of( copy ), std::vector<int>{ 7 } );

    copy = std::move( moved );
    EXPECT_EQ  ( keys_of( copy ), ( std::vector<int>{ 2, 1, 0 } ) );
}

TEST( ordered_table, clear )
{
    ordered_table<int, int> t{ { 1, 1 }, { 2, 2 } };
    t.clear();
    EXPECT_TRUE( t.empty() );
    EXPECT_EQ  ( t.begin(), t.end() );
    t.set( 5, 5 );
    EXPECT_EQ( keys_of( t ), std::vector<int>{ 5 } );
}

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
