////////////////////////////////////////////////////////////////////////////////
/// Open addressing engine shared by table, ordered_table and count_table.
///
/// Storage is a power-of-two sized array of slots, each Empty, Filled or
/// Deleted. A key's probe sequence starts at hash( key ) & mask and continues
/// with h' = ( 5 * h + 1 ) & mask, which visits every slot of a power-of-two
/// array exactly once before repeating (full period LCG).
///   - lookups stop at the first Empty slot, step over Deleted ones
///   - fresh entries are only ever written into Empty slots
///   - erase only retags the slot as Deleted (a tombstone)
///
/// Growth: before every fresh insertion the array is rebuilt when
/// ( capacity * 2 < used * 3 ) or ( capacity - used < 4 ), where used counts
/// live entries and tombstones. The rebuild doubles the capacity unless the
/// live entries alone fit, in which case it only purges the tombstones.
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

#include "abi.hpp"

#include <psi/build/disable_warnings.hpp>

#include <boost/assert.hpp>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::tables
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

enum class slot_state : std::uint8_t { empty, filled, deleted };

inline constexpr std::size_t default_initial_capacity{ 64 };

namespace detail
{
    inline constexpr std::size_t null_index    { std::numeric_limits<std::size_t>::max() };
    inline constexpr std::size_t growth_factor { 2 };
    inline constexpr std::size_t min_free_slots{ 4 };
    inline constexpr std::size_t probe_stride  { 5 };

    [[ gnu::const ]] constexpr std::size_t next_probe( std::size_t const h, std::size_t const mask ) noexcept
    {
        return ( probe_stride * h + 1 ) & mask;
    }

    [[ gnu::const ]] constexpr bool must_grow( std::size_t const capacity, std::size_t const used ) noexcept
    {
        BOOST_ASSERT( capacity > used );
        return ( capacity * 2 < used * 3 ) || ( capacity - used < min_free_slots );
    }

    /// Initial capacity for a table about to receive count entries.
    [[ gnu::const ]] constexpr std::size_t capacity_for( std::size_t const count ) noexcept
    {
        return std::bit_ceil( count + 10 );
    }


    //==========================================================================
    // Slot layouts
    //
    // Each layout provides key_type, mapped_type, the key/value members and
    //   filled() - holds a live entry
    //   vacant() - Empty: terminates probing and accepts fresh entries
    //   fill()   - writes an entry into a vacant slot
    //==========================================================================

    template <typename Key, typename T>
    struct kv_slot
    {
        using key_type    = Key;
        using mapped_type = T;

        Key        key  {};
        T          value{};
        slot_state state{ slot_state::empty };

        [[ gnu::pure ]] bool filled () const noexcept { return state == slot_state::filled ; }
        [[ gnu::pure ]] bool vacant () const noexcept { return state == slot_state::empty  ; }
        [[ gnu::pure ]] bool deleted() const noexcept { return state == slot_state::deleted; }

        template <typename K, typename V>
        void fill( K && k, V && v )
        {
            key   = std::forward<K>( k );
            value = std::forward<V>( v );
            state = slot_state::filled;
        }

        void erase() noexcept { state = slot_state::deleted; }
    }; // struct kv_slot

    // kv_slot threaded onto the ordered_table traversal list
    template <typename Key, typename T>
    struct linked_slot : kv_slot<Key, T>
    {
        std::size_t next{ null_index };
    }; // struct linked_slot

    // A zero count doubles as the Empty tag: count slots are never Deleted.
    template <typename Key, typename Count>
    struct count_slot
    {
        using key_type    = Key;
        using mapped_type = Count;

        Key   key  {};
        Count value{ 0 };

        [[ gnu::pure ]] bool filled () const noexcept { return value != 0; }
        [[ gnu::pure ]] bool vacant () const noexcept { return value == 0; }
        [[ gnu::pure ]] bool deleted() const noexcept { return false; }

        template <typename K>
        void fill( K && k, Count const count ) noexcept( std::is_nothrow_assignable_v<Key &, K &&> )
        {
            BOOST_ASSERT( count != 0 );
            key   = std::forward<K>( k );
            value = count;
        }
    }; // struct count_slot
} // namespace detail


////////////////////////////////////////////////////////////////////////////////
// \class slot_array
//
// Owns the slot storage and the live/tombstone counters. Policy (when to
// grow, in which order to carry entries over, what to do with a freshly
// written slot) is left to the containers built on top (table_common.hpp).
////////////////////////////////////////////////////////////////////////////////

template <typename Slot, typename Hash, typename KeyEqual>
class slot_array
{
public:
    using slot_type     = Slot;
    using key_type      = typename Slot::key_type;
    using mapped_type   = typename Slot::mapped_type;
    using size_type     = std::size_t;
    using hasher        = Hash;
    using key_equal     = KeyEqual;
    using key_const_arg = key_const_arg_t<key_type>;
    using storage       = std::vector<Slot>;

    static constexpr size_type npos{ detail::null_index };

    explicit slot_array( size_type const initial_capacity = default_initial_capacity, Hash const & hash = {}, KeyEqual const & equal = {} )
        : slots_( initial_capacity ), hash_{ hash }, equal_{ equal }
    {
        BOOST_ASSERT_MSG( std::has_single_bit( initial_capacity ), "Table capacity must be a power of two" );
    }

    slot_array( slot_array const & ) = default;
    slot_array( slot_array && other ) noexcept( std::is_nothrow_move_constructible_v<Hash> && std::is_nothrow_move_constructible_v<KeyEqual> )
        :
        slots_     { std::move( other.slots_ ) },
        live_      { std::exchange( other.live_      , 0 ) },
        tombstones_{ std::exchange( other.tombstones_, 0 ) },
        hash_      { std::move( other.hash_  ) },
        equal_     { std::move( other.equal_ ) }
    {
        other.slots_.clear();
    }

    slot_array & operator=( slot_array const & ) = default;
    slot_array & operator=( slot_array && other ) noexcept( std::is_nothrow_move_assignable_v<Hash> && std::is_nothrow_move_assignable_v<KeyEqual> )
    {
        if ( this != &other )
        {
            slots_      = std::move( other.slots_ );
            live_       = std::exchange( other.live_      , 0 );
            tombstones_ = std::exchange( other.tombstones_, 0 );
            hash_       = std::move( other.hash_  );
            equal_      = std::move( other.equal_ );
            other.slots_.clear();
        }
        return *this;
    }

    [[ nodiscard ]] size_type size      () const noexcept { return live_; }
    [[ nodiscard ]] bool      empty     () const noexcept { return live_ == 0; }
    [[ nodiscard ]] size_type capacity  () const noexcept { return slots_.size(); }
    [[ nodiscard ]] size_type tombstones() const noexcept { return tombstones_; }

    [[ nodiscard ]] hasher    hash_function() const { return hash_;  }
    [[ nodiscard ]] key_equal key_eq       () const { return equal_; }

    [[ nodiscard ]] std::span<Slot      > slots()       noexcept { return slots_; }
    [[ nodiscard ]] std::span<Slot const> slots() const noexcept { return slots_; }

    [[ nodiscard ]] Slot       & slot( size_type const index )       noexcept { BOOST_ASSERT( index < capacity() ); return slots_[ index ]; }
    [[ nodiscard ]] Slot const & slot( size_type const index ) const noexcept { BOOST_ASSERT( index < capacity() ); return slots_[ index ]; }

    /// Index of the first Filled slot holding key along its probe sequence,
    /// npos if an Empty slot is reached first.
    [[ nodiscard, gnu::pure ]] size_type find_index( key_const_arg key ) const noexcept
    {
        if ( slots_.empty() ) [[ unlikely ]] // moved-from
            return npos;
        auto const mask{ capacity() - 1 };
        for ( auto h{ home( key, mask ) }; !slots_[ h ].vacant(); h = detail::next_probe( h, mask ) )
        {
            if ( slots_[ h ].filled() && equal_( slots_[ h ].key, key ) )
                return h;
        }
        return npos;
    }

    /// Writes an entry into the first Empty slot of the key's probe sequence
    /// in target (either the live storage or a rebuild in progress). No
    /// uniqueness check, no bookkeeping.
    template <typename K, typename V>
    size_type insert_raw( storage & target, K && key, V && value ) const
    {
        BOOST_ASSERT( std::has_single_bit( target.size() ) );
        auto const mask{ target.size() - 1 };
        auto h{ home( key, mask ) };
        while ( !target[ h ].vacant() )
            h = detail::next_probe( h, mask );
        target[ h ].fill( std::forward<K>( key ), std::forward<V>( value ) );
        return h;
    }

    template <typename K, typename V>
    size_type insert_raw( K && key, V && value ) { return insert_raw( slots_, std::forward<K>( key ), std::forward<V>( value ) ); }

    [[ nodiscard ]] bool needs_rebuild() const noexcept
    {
        return slots_.empty() || detail::must_grow( capacity(), live_ + tombstones_ );
    }

    [[ nodiscard ]] size_type rebuild_capacity() const noexcept
    {
        if ( slots_.empty() )
            return default_initial_capacity;
        return detail::must_grow( capacity(), live_ ) ? capacity() * detail::growth_factor : capacity();
    }

    void note_inserted() noexcept { ++live_; }

    void mark_deleted( size_type const index ) noexcept
    {
        BOOST_ASSERT( slots_[ index ].filled() );
        slots_[ index ].erase();
        --live_;
        ++tombstones_;
    }

    /// Swaps in a fully populated rebuild (which carries no tombstones).
    void adopt( storage && rebuilt ) noexcept
    {
        BOOST_ASSERT( std::has_single_bit( rebuilt.size() ) );
        slots_.swap( rebuilt );
        tombstones_ = 0;
    }

    void clear() noexcept( std::is_nothrow_default_constructible_v<Slot> && std::is_nothrow_move_assignable_v<Slot> )
    {
        for ( auto & slot : slots_ )
            slot = Slot{};
        live_       = 0;
        tombstones_ = 0;
    }

    [[ nodiscard ]] storage make_storage( size_type const capacity ) const { return storage( capacity ); }

private:
    template <typename K>
    [[ gnu::pure ]] size_type home( K const & key, size_type const mask ) const noexcept
    {
        return static_cast<size_type>( hash_( key ) ) & mask;
    }

    storage   slots_;
    size_type live_      { 0 };
    size_type tombstones_{ 0 };
#ifdef _MSC_VER
    [[ msvc::no_unique_address ]]
#else
    [[ no_unique_address ]]
#endif
    Hash     hash_;
#ifdef _MSC_VER
    [[ msvc::no_unique_address ]]
#else
    [[ no_unique_address ]]
#endif
    KeyEqual equal_;
}; // class slot_array

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
