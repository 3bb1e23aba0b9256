////////////////////////////////////////////////////////////////////////////////
/// Insertion order preserving open addressing hash table
///
/// ordered_table threads its slots onto an intrusive singly linked list
/// (head/tail indices + a next index in every slot) in insertion order.
/// The list is what iteration, rendering and rebuilds walk, so the order
/// survives growth. Erased slots stay threaded (as tombstones, skipped by
/// iteration) until the next rebuild or sort compacts them away.
///
/// sort( comparator ) relinks the list with a bottom-up (non recursive)
/// stable merge sort, never moving slot payloads. It destroys the insertion
/// order for good: later insertions are appended after the sorted run.
/// Lookups and insertions remain valid after sorting.
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
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <functional>
#include <initializer_list>
#include <iterator>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::tables
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

namespace detail
{
    ////////////////////////////////////////////////////////////////////////////
    // \class list_iterator
    //
    // Follows the next links from a starting slot index, stepping over the
    // tombstones still threaded on the list.
    ////////////////////////////////////////////////////////////////////////////

    template <typename Slot, bool is_const>
    class list_iterator
        : public boost::stl_interfaces::proxy_iterator_interface
        <
#       if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
            list_iterator<Slot, is_const>,
#       endif
            std::forward_iterator_tag,
            std::pair<typename Slot::key_type, typename Slot::mapped_type>,
            slot_reference_t<Slot, is_const>
        >
    {
    private:
        using base_type = boost::stl_interfaces::proxy_iterator_interface
        <
#       if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
            list_iterator<Slot, is_const>,
#       endif
            std::forward_iterator_tag,
            std::pair<typename Slot::key_type, typename Slot::mapped_type>,
            slot_reference_t<Slot, is_const>
        >;
        using slot_pointer = maybe_const_t<Slot, is_const> *;

        friend class list_iterator<Slot, !is_const>;

    public:
        using reference = slot_reference_t<Slot, is_const>;

        constexpr list_iterator() noexcept = default;
        constexpr list_iterator( slot_pointer const p_slots, std::size_t const index ) noexcept
            : p_slots_{ p_slots }, index_{ index }
        {
            skip_unfilled();
        }

        constexpr list_iterator( list_iterator<Slot, false> const & other ) noexcept requires( is_const )
            : p_slots_{ other.p_slots_ }, index_{ other.index_ } {}

        [[ gnu::pure ]] constexpr reference operator*() const noexcept
        {
            BOOST_ASSERT( index_ != null_index );
            auto & slot{ p_slots_[ index_ ] };
            return { slot.key, slot.value };
        }

        constexpr list_iterator & operator++() noexcept
        {
            BOOST_ASSERT( index_ != null_index );
            index_ = p_slots_[ index_ ].next;
            skip_unfilled();
            return *this;
        }
        using base_type::operator++;

        [[ gnu::pure ]] friend constexpr bool operator==( list_iterator const & left, list_iterator const & right ) noexcept { return left.index_ == right.index_; }

    private:
        constexpr void skip_unfilled() noexcept
        {
            while ( ( index_ != null_index ) && !p_slots_[ index_ ].filled() )
                index_ = p_slots_[ index_ ].next;
        }

        slot_pointer p_slots_{ nullptr };
        std::size_t  index_  { null_index };
    }; // class list_iterator
} // namespace detail


template
<
    typename Key,
    typename T,
    typename Hash     = boost::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class ordered_table
    : public detail::table_impl<ordered_table<Key, T, Hash, KeyEqual>, detail::linked_slot<Key, T>, Hash, KeyEqual>
{
private:
    using slot = detail::linked_slot<Key, T>;
    using base = detail::table_impl<ordered_table<Key, T, Hash, KeyEqual>, slot, Hash, KeyEqual>;
    friend base;

    static constexpr auto npos{ detail::null_index };

public:
    static constexpr char const container_name[]{ "ordered_table" };

    using typename base::size_type;
    using typename base::value_type;
    using typename base::const_reference;

    using       iterator = detail::list_iterator<slot, false>;
    using const_iterator = detail::list_iterator<slot, true >;

    explicit ordered_table( size_type const initial_capacity = default_initial_capacity, Hash const & hash = {}, KeyEqual const & equal = {} )
        : base{ initial_capacity, hash, equal } {}

    ordered_table( std::initializer_list<value_type> const pairs )
        : ordered_table( detail::capacity_for( pairs.size() ) )
    {
        for ( auto const & [ key, value ] : pairs )
            this->set( key, value );
    }

    ordered_table( ordered_table const & ) = default;
    ordered_table( ordered_table && other ) noexcept( std::is_nothrow_move_constructible_v<base> )
        :
        base { std::move( other ) },
        head_{ std::exchange( other.head_, npos ) },
        tail_{ std::exchange( other.tail_, npos ) }
    {}

    ordered_table & operator=( ordered_table const & ) = default;
    ordered_table & operator=( ordered_table && other ) noexcept( std::is_nothrow_move_assignable_v<base> )
    {
        if ( this != &other )
        {
            base::operator=( std::move( other ) );
            head_ = std::exchange( other.head_, npos );
            tail_ = std::exchange( other.tail_, npos );
        }
        return *this;
    }

    template <std::ranges::input_range Pairs>
    static ordered_table from_pairs( Pairs && pairs ) { return base::from_pairs_impl( std::forward<Pairs>( pairs ) ); }
    static ordered_table from_pairs( std::initializer_list<value_type> const pairs ) { return base::from_pairs_impl( pairs ); }

    using base::set;
    using base::add;
    using base::erase;

    //--------------------------------------------------------------------------
    // Iteration (insertion order, or sorted order after sort())
    //--------------------------------------------------------------------------
    [[ nodiscard ]]       iterator begin()       noexcept { return { this->slots().data(), head_ }; }
    [[ nodiscard ]] const_iterator begin() const noexcept { return { this->slots().data(), head_ }; }
    [[ nodiscard ]]       iterator end  ()       noexcept { return { this->slots().data(), npos  }; }
    [[ nodiscard ]] const_iterator end  () const noexcept { return { this->slots().data(), npos  }; }

    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end  (); }

    /// Stable sort of the traversal list.
    /// The comparator is invoked with two ( key, value ) const_reference pairs
    /// and is either a less-than predicate (returning bool) or a three-way
    /// comparator (an int or std::*_ordering, <= 0 meaning "left first").
    /// Slots are relinked, never moved, so lookups are unaffected.
    /// If the comparator throws, every entry stays reachable but the
    /// traversal order falls back to slot order.
    template <typename Compare>
    void sort( Compare comp ) noexcept( std::is_nothrow_invocable_v<Compare &, const_reference, const_reference> )
    {
        unlink_tombstones();
        if ( head_ == npos )
            return;

        if constexpr ( std::is_nothrow_invocable_v<Compare &, const_reference, const_reference> )
        {
            merge_sort( comp );
        }
        else
        {
            try
            {
                merge_sort( comp );
            }
            catch ( ... )
            {
                relink_in_slot_order();
                throw;
            }
        }
    }

    [[ nodiscard ]] friend bool operator==( ordered_table const & left, ordered_table const & right ) { return left.equal_to( right ); }

private:
    // Bottom-up merge sort of the (tombstone free, non empty) list.
    template <typename Compare>
    void merge_sort( Compare & comp )
    {
        auto const slots{ this->slots() };
        auto const next { [ slots ]( size_type const index ) noexcept -> size_type & { return slots[ index ].next; } };
        auto const left_first
        {
            [ slots, &comp ]( size_type const left, size_type const right )
            {
                const_reference const l{ slots[ left  ].key, slots[ left  ].value };
                const_reference const r{ slots[ right ].key, slots[ right ].value };
                if constexpr ( std::is_same_v<std::invoke_result_t<Compare &, const_reference, const_reference>, bool> )
                    return !comp( r, l );
                else
                    return comp( l, r ) <= 0;
            }
        };

        auto list{ head_ };
        auto tail{ npos  };
        for ( size_type run_length{ 1 }; ; run_length *= 2 )
        {
            auto p{ list };
            list = npos;
            tail = npos;
            size_type merges{ 0 };
            while ( p != npos )
            {
                ++merges;
                // step q at most run_length nodes past p
                auto      q     { p };
                size_type p_size{ 0 };
                while ( ( p_size < run_length ) && ( q != npos ) )
                {
                    ++p_size;
                    q = next( q );
                }
                auto q_size{ run_length };

                // merge the runs starting at p and q
                while ( ( p_size > 0 ) || ( ( q_size > 0 ) && ( q != npos ) ) )
                {
                    size_type e;
                    if ( p_size == 0 )
                    {
                        e = q; q = next( q ); --q_size;
                    }
                    else
                    if ( ( q_size == 0 ) || ( q == npos ) || left_first( p, q ) )
                    {
                        e = p; p = next( p ); --p_size;
                    }
                    else
                    {
                        e = q; q = next( q ); --q_size;
                    }

                    if ( tail != npos )
                        next( tail ) = e;
                    else
                        list = e;
                    tail = e;
                }
                p = q;
            }
            next( tail ) = npos;
            if ( merges <= 1 )
                break;
        }
        head_ = list;
        tail_ = tail;
    }

    //--------------------------------------------------------------------------
    // table_impl hooks
    //--------------------------------------------------------------------------
    void on_inserted( size_type const index ) noexcept
    {
        append( this->slots(), head_, tail_, index );
    }

    void on_cleared() noexcept
    {
        head_ = npos;
        tail_ = npos;
    }

    // Walks the old list, so the relative order of the live entries is kept
    // while tombstones are dropped.
    void rebuild( size_type const new_capacity )
    {
        auto rebuilt{ this->make_storage( new_capacity ) };
        auto new_head{ npos };
        auto new_tail{ npos };
        auto const slots{ this->slots() };
        for ( auto index{ head_ }; index != npos; index = slots[ index ].next )
        {
            auto & old{ slots[ index ] };
            if ( !old.filled() )
                continue;
            auto const new_index{ this->insert_raw( rebuilt, std::move_if_noexcept( old.key ), std::move_if_noexcept( old.value ) ) };
            append( rebuilt, new_head, new_tail, new_index );
        }
        this->adopt( std::move( rebuilt ) );
        head_ = new_head;
        tail_ = new_tail;
    }

    static void append( std::span<slot> const slots, size_type & head, size_type & tail, size_type const index ) noexcept
    {
        slots[ index ].next = npos;
        if ( head == npos )
            head = index;
        if ( tail != npos )
            slots[ tail ].next = index;
        tail = index;
    }

    void relink_in_slot_order() noexcept
    {
        auto const slots{ this->slots() };
        head_ = npos;
        tail_ = npos;
        for ( size_type index{ 0 }; index < slots.size(); ++index )
        {
            if ( slots[ index ].filled() )
                append( slots, head_, tail_, index );
        }
    }

    void unlink_tombstones() noexcept
    {
        auto const slots{ this->slots() };
        auto new_head{ npos };
        auto new_tail{ npos };
        for ( auto index{ head_ }; index != npos; )
        {
            auto const next{ slots[ index ].next };
            if ( slots[ index ].filled() )
                append( slots, new_head, new_tail, index );
            index = next;
        }
        head_ = new_head;
        tail_ = new_tail;
    }

    size_type head_{ npos };
    size_type tail_{ npos };
}; // class ordered_table

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
