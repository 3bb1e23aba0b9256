////////////////////////////////////////////////////////////////////////////////
/// psi::tables::slot_array (open addressing engine) unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/tables/slot_array.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <functional>
#include <set>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::tables {
//------------------------------------------------------------------------------

namespace
{
    struct identity_hash
    {
        std::size_t operator()( int const key ) const noexcept { return static_cast<std::size_t>( key ); }
    };

    // copy-only hasher whose assignment may throw
    struct throwing_assign_hash : identity_hash
    {
        throwing_assign_hash() = default;
        throwing_assign_hash( throwing_assign_hash const & ) = default;
        throwing_assign_hash & operator=( throwing_assign_hash const & ) noexcept( false ) { return *this; }
    };

    using engine = slot_array<detail::kv_slot<int, int>, identity_hash, std::equal_to<int>>;
} // anonymous namespace

//==============================================================================
// Policy arithmetic
//==============================================================================

TEST( slot_array, probe_sequence_visits_every_slot )
{
    EXPECT_EQ( detail::next_probe( 0, 7 ), 1 );
    EXPECT_EQ( detail::next_probe( 1, 7 ), 6 );
    EXPECT_EQ( detail::next_probe( 6, 7 ), 7 );

    for ( std::size_t const capacity : { 8U, 64U, 1024U } )
    {
        auto const mask{ capacity - 1 };
        std::set<std::size_t> visited;
        auto h{ std::size_t{ 3 } & mask };
        for ( std::size_t i{ 0 }; i < capacity; ++i )
        {
            visited.insert( h );
            h = detail::next_probe( h, mask );
        }
        EXPECT_EQ( visited.size(), capacity );
    }
}

TEST( slot_array, growth_trigger )
{
    EXPECT_FALSE( detail::must_grow( 64, 0  ) );
    EXPECT_FALSE( detail::must_grow( 64, 42 ) );
    EXPECT_TRUE ( detail::must_grow( 64, 43 ) );
    EXPECT_TRUE ( detail::must_grow( 8 , 5  ) ); // fewer than four free slots
    EXPECT_FALSE( detail::must_grow( 16, 10 ) );
    EXPECT_TRUE ( detail::must_grow( 16, 11 ) );
}

TEST( slot_array, capacity_for )
{
    EXPECT_EQ( detail::capacity_for( 0  ), 16 );
    EXPECT_EQ( detail::capacity_for( 6  ), 16 );
    EXPECT_EQ( detail::capacity_for( 7  ), 32 );
    EXPECT_EQ( detail::capacity_for( 54 ), 64 );
    EXPECT_EQ( detail::capacity_for( 55 ), 128 );
}

//==============================================================================
// Probing
//==============================================================================

TEST( slot_array, colliding_keys_follow_the_probe_sequence )
{
    engine slots{ 64 };
    EXPECT_EQ( slots.capacity(), 64 );
    EXPECT_EQ( slots.find_index( 0 ), engine::npos );

    EXPECT_EQ( slots.insert_raw( 0  , 1 ), 0 );
    EXPECT_EQ( slots.insert_raw( 64 , 2 ), 1 );
    EXPECT_EQ( slots.insert_raw( 128, 3 ), 6 );
    for ( auto i{ 0 }; i < 3; ++i )
        slots.note_inserted();
    EXPECT_EQ( slots.size(), 3 );

    EXPECT_EQ( slots.find_index( 0   ), 0 );
    EXPECT_EQ( slots.find_index( 64  ), 1 );
    EXPECT_EQ( slots.find_index( 128 ), 6 );
    EXPECT_EQ( slots.find_index( 192 ), engine::npos );
    EXPECT_EQ( slots.slot( 6 ).value, 3 );
}

TEST( slot_array, tombstones_do_not_terminate_lookups )
{
    engine slots{ 64 };
    slots.insert_raw( 0  , 1 ); slots.note_inserted();
    slots.insert_raw( 64 , 2 ); slots.note_inserted();
    slots.insert_raw( 128, 3 ); slots.note_inserted();

    slots.mark_deleted( 1 );
    EXPECT_EQ( slots.size(), 2 );
    EXPECT_EQ( slots.tombstones(), 1 );
    EXPECT_TRUE( slots.slot( 1 ).deleted() );
    EXPECT_EQ( slots.find_index( 64  ), engine::npos );
    EXPECT_EQ( slots.find_index( 128 ), 6 );

    // fresh entries only ever go into Empty slots
    EXPECT_EQ( slots.insert_raw( 192, 4 ), 31 );
}

//==============================================================================
// Rebuild policy
//==============================================================================

TEST( slot_array, rebuild_capacity )
{
    engine slots{ 64 };
    for ( auto key{ 0 }; key < 43; ++key )
    {
        slots.insert_raw( key, key );
        slots.note_inserted();
    }
    EXPECT_TRUE ( slots.needs_rebuild() );
    EXPECT_EQ   ( slots.rebuild_capacity(), 128 );

    for ( std::size_t index{ 0 }; index < 30; ++index )
        slots.mark_deleted( index );
    EXPECT_TRUE ( slots.needs_rebuild() ); // live + tombstones still 43
    EXPECT_EQ   ( slots.rebuild_capacity(), 64 );

    auto rebuilt{ slots.make_storage( 64 ) };
    for ( auto const & slot : slots.slots() )
    {
        if ( slot.filled() )
            slots.insert_raw( rebuilt, slot.key, slot.value );
    }
    slots.adopt( std::move( rebuilt ) );
    EXPECT_EQ   ( slots.size(), 13 );
    EXPECT_EQ   ( slots.tombstones(), 0 );
    EXPECT_FALSE( slots.needs_rebuild() );
    EXPECT_EQ   ( slots.find_index( 42 ), 42 );
}

TEST( slot_array, moved_from_is_empty )
{
    engine source{ 64 };
    source.insert_raw( 7, 70 );
    source.note_inserted();

    engine target{ std::move( source ) };
    EXPECT_EQ  ( target.size(), 1 );
    EXPECT_EQ  ( target.find_index( 7 ), 7 );

    EXPECT_EQ  ( source.size(), 0 );
    EXPECT_EQ  ( source.capacity(), 0 );
    EXPECT_EQ  ( source.find_index( 7 ), engine::npos );
    EXPECT_TRUE( source.needs_rebuild() );
    EXPECT_EQ  ( source.rebuild_capacity(), default_initial_capacity );
}

TEST( slot_array, move_noexcept_follows_the_hasher )
{
    using throwing_engine = slot_array<detail::kv_slot<int, int>, throwing_assign_hash, std::equal_to<int>>;
    static_assert(  std::is_nothrow_move_assignable_v<engine>          );
    static_assert( !std::is_nothrow_move_assignable_v<throwing_engine> );

    throwing_engine source{ 16 };
    source.insert_raw( 3, 30 );
    source.note_inserted();
    throwing_engine target{ 8 };
    target = std::move( source );
    EXPECT_EQ( target.capacity(), 16 );
    EXPECT_EQ( target.find_index( 3 ), 3 );
    EXPECT_EQ( source.capacity(), 0 );
}

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
