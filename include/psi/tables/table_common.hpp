////////////////////////////////////////////////////////////////////////////////
/// Shared foundations for the psi::tables hash containers (table,
/// ordered_table, count_table).
///
/// Contents:
///   - detail::slot_iterator<Slot, is_const>     (physical order iteration)
///   - detail::table_impl<Derived, Slot, ...>    (shared base: put/add/erase,
///                                                growth, equality, rendering)
///
/// table_impl is a CRTP base. A derived container may shadow the hooks
///   on_inserted( index ) - called after every fresh raw insertion
///   rebuild( capacity )  - carries the live entries over into a fresh array
///   on_cleared()         - called after clear()
/// and its begin()/end() (rendering and equality iterate the derived
/// container) and publishes only the operations it supports.
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
#include "slot_array.hpp"

#include <psi/build/disable_warnings.hpp>

#include <boost/assert.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <concepts>
#include <cstddef>
#include <iterator>
#include <ostream>
#include <ranges>
#include <string>
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
    template <typename T, bool is_const>
    using maybe_const_t = std::conditional_t<is_const, T const, T>;

    template <typename Slot, bool is_const>
    using slot_reference_t = std::pair
    <
        typename Slot::key_type const &,
        maybe_const_t<typename Slot::mapped_type, is_const> &
    >;


    ////////////////////////////////////////////////////////////////////////////
    // \class slot_iterator
    //
    // Forward iterator over the Filled slots of a backing array in physical
    // (slot index) order. Dereferences to a ( key const &, value & ) pair.
    ////////////////////////////////////////////////////////////////////////////

    template <typename Slot, bool is_const>
    class slot_iterator
        : public boost::stl_interfaces::proxy_iterator_interface
        <
#       if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
            slot_iterator<Slot, is_const>,
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
            slot_iterator<Slot, is_const>,
#       endif
            std::forward_iterator_tag,
            std::pair<typename Slot::key_type, typename Slot::mapped_type>,
            slot_reference_t<Slot, is_const>
        >;
        using slot_pointer = maybe_const_t<Slot, is_const> *;

        friend class slot_iterator<Slot, !is_const>;

    public:
        using reference = slot_reference_t<Slot, is_const>;

        constexpr slot_iterator() noexcept = default;
        constexpr slot_iterator( slot_pointer const p_slot, slot_pointer const p_end ) noexcept
            : p_slot_{ p_slot }, p_end_{ p_end }
        {
            skip_unfilled();
        }

        // mutable -> const conversion
        constexpr slot_iterator( slot_iterator<Slot, false> const & other ) noexcept requires( is_const )
            : p_slot_{ other.p_slot_ }, p_end_{ other.p_end_ } {}

        [[ gnu::pure ]] constexpr reference operator*() const noexcept
        {
            BOOST_ASSERT( p_slot_ != p_end_ && p_slot_->filled() );
            return { p_slot_->key, p_slot_->value };
        }

        constexpr slot_iterator & operator++() noexcept
        {
            BOOST_ASSERT( p_slot_ != p_end_ );
            ++p_slot_;
            skip_unfilled();
            return *this;
        }
        using base_type::operator++;

        [[ gnu::pure ]] friend constexpr bool operator==( slot_iterator const & left, slot_iterator const & right ) noexcept { return left.p_slot_ == right.p_slot_; }

    private:
        constexpr void skip_unfilled() noexcept
        {
            while ( ( p_slot_ != p_end_ ) && !p_slot_->filled() )
                ++p_slot_;
        }

        slot_pointer p_slot_{ nullptr };
        slot_pointer p_end_ { nullptr };
    }; // class slot_iterator


    ////////////////////////////////////////////////////////////////////////////
    // \class table_impl
    ////////////////////////////////////////////////////////////////////////////

    template <typename Derived, typename Slot, typename Hash, typename KeyEqual>
    class table_impl : protected slot_array<Slot, Hash, KeyEqual>
    {
    protected:
        using engine = slot_array<Slot, Hash, KeyEqual>;

    public:
        using key_type        = typename engine::key_type;
        using mapped_type     = typename engine::mapped_type;
        using value_type      = std::pair<key_type, mapped_type>;
        using size_type       = typename engine::size_type;
        using difference_type = std::ptrdiff_t;
        using hasher          = Hash;
        using key_equal       = KeyEqual;
        using reference       = slot_reference_t<Slot, false>;
        using const_reference = slot_reference_t<Slot, true >;
        using key_const_arg   = typename engine::key_const_arg;

        using engine::size;
        using engine::empty;
        using engine::capacity;
        using engine::hash_function;
        using engine::key_eq;

        //----------------------------------------------------------------------
        // Lookup
        //----------------------------------------------------------------------
        [[ nodiscard ]] bool contains( key_const_arg key ) const noexcept { return this->find_index( key ) != engine::npos; }

        /// Value stored for key or a value-initialised mapped_type if there is
        /// none. Never throws on a missing key.
        [[ nodiscard ]] mapped_type get( key_const_arg key ) const
        {
            auto const index{ this->find_index( key ) };
            if ( index != engine::npos )
                return this->slot( index ).value;
            return mapped_type{};
        }

        [[ nodiscard ]] mapped_type operator[]( key_const_arg key ) const { return get( key ); }

        /// Reference to the value stored for key.
        /// \throws std::out_of_range if key is not present
        [[ nodiscard ]] mapped_type       & at( key_const_arg key )       { return this->slot( existing_index( key ) ).value; }
        [[ nodiscard ]] mapped_type const & at( key_const_arg key ) const { return this->slot( existing_index( key ) ).value; }

        //----------------------------------------------------------------------
        // Iteration (physical slot order)
        //----------------------------------------------------------------------
        using       iterator = slot_iterator<Slot, false>;
        using const_iterator = slot_iterator<Slot, true >;

        [[ nodiscard ]]       iterator begin()       noexcept { auto const s{ this->slots() }; return { s.data(), s.data() + s.size() }; }
        [[ nodiscard ]] const_iterator begin() const noexcept { auto const s{ this->slots() }; return { s.data(), s.data() + s.size() }; }
        [[ nodiscard ]]       iterator end  ()       noexcept { auto const s{ this->slots() }; return { s.data() + s.size(), s.data() + s.size() }; }
        [[ nodiscard ]] const_iterator end  () const noexcept { auto const s{ this->slots() }; return { s.data() + s.size(), s.data() + s.size() }; }

        //----------------------------------------------------------------------
        // Rendering
        //----------------------------------------------------------------------

        /// {k1: v1, k2: v2, ...} in the iteration order of the container,
        /// {} when empty.
        [[ nodiscard ]] std::string to_string() const
        {
            std::string result{ "{" };
            for ( auto const & [ key, value ] : derived() )
            {
                if ( result.size() > 1 )
                    result += ", ";
                append_rendered( result, key );
                result += ": ";
                append_rendered( result, value );
            }
            result += '}';
            return result;
        }

        friend std::ostream & operator<<( std::ostream & os, Derived const & table ) { return os << table.to_string(); }

        /// Slot level layout dump to stdout (table_print.hpp).
        void print() const;

        void clear()
        {
            engine::clear();
            derived().on_cleared();
        }

    protected:
        explicit table_impl( size_type const initial_capacity, Hash const & hash = {}, KeyEqual const & equal = {} )
            : engine{ initial_capacity, hash, equal } {}

        [[ nodiscard ]] Derived       & derived()       noexcept { return static_cast<Derived       &>( *this ); }
        [[ nodiscard ]] Derived const & derived() const noexcept { return static_cast<Derived const &>( *this ); }

        //----------------------------------------------------------------------
        // Modifiers (published selectively by the derived containers)
        //----------------------------------------------------------------------

        /// Upsert: overwrites the value of an existing key in place.
        template <typename M>
        void set( key_const_arg key, M && value )
        {
            auto const index{ this->find_index( key ) };
            if ( index != engine::npos )
                this->slot( index ).value = std::forward<M>( value );
            else
                insert_new( key, std::forward<M>( value ) );
        }

        /// Inserts even if an equal key is already present. Which of the
        /// duplicates a later lookup finds is decided by the probe sequence.
        template <typename M>
        void add( key_const_arg key, M && value ) { insert_new( key, std::forward<M>( value ) ); }

        size_type erase( key_const_arg key ) noexcept
        {
            auto const index{ this->find_index( key ) };
            if ( index == engine::npos )
                return 0;
            this->mark_deleted( index );
            return 1;
        }

        template <typename K, typename M>
        size_type insert_new( K && key, M && value )
        {
            if ( this->needs_rebuild() ) [[ unlikely ]]
            {
                // key and value may refer into the storage the rebuild releases
                key_type    key_copy  ( std::forward<K>( key   ) );
                mapped_type value_copy( std::forward<M>( value ) );
                derived().rebuild( this->rebuild_capacity() );
                return emplace_new( std::move( key_copy ), std::move( value_copy ) );
            }
            return emplace_new( std::forward<K>( key ), std::forward<M>( value ) );
        }

        // Requires a prior capacity check: always finds an Empty slot.
        template <typename K, typename M>
        size_type emplace_new( K && key, M && value )
        {
            auto const index{ this->insert_raw( std::forward<K>( key ), std::forward<M>( value ) ) };
            derived().on_inserted( index );
            this->note_inserted();
            return index;
        }

        //----------------------------------------------------------------------
        // Default hooks
        //----------------------------------------------------------------------
        void on_inserted( size_type /*index*/ ) noexcept {}
        void on_cleared () noexcept {}

        // Carries the Filled slots over in physical order. The old array is
        // left untouched (copied from) unless moving cannot throw.
        void rebuild( size_type const new_capacity )
        {
            auto rebuilt{ this->make_storage( new_capacity ) };
            for ( auto & slot : this->slots() )
            {
                if ( slot.filled() )
                    this->insert_raw( rebuilt, std::move_if_noexcept( slot.key ), std::move_if_noexcept( slot.value ) );
            }
            this->adopt( std::move( rebuilt ) );
        }

        //----------------------------------------------------------------------
        // Shared algorithms
        //----------------------------------------------------------------------

        /// Same live count and every entry of this one found in other with an
        /// equal value. Physical layouts (insertion histories) may differ.
        [[ nodiscard ]] bool equal_to( table_impl const & other ) const
        {
            if ( this->size() != other.size() )
                return false;
            for ( auto const & [ key, value ] : derived() )
            {
                auto const index{ other.find_index( key ) };
                if ( index == engine::npos )
                    return false;
                if ( !( other.slot( index ).value == value ) )
                    return false;
            }
            return true;
        }

        template <std::ranges::input_range Pairs>
        static Derived from_pairs_impl( Pairs && pairs )
        {
            size_type initial_capacity{ default_initial_capacity };
            if constexpr ( std::ranges::sized_range<Pairs> )
                initial_capacity = capacity_for( static_cast<size_type>( std::ranges::size( pairs ) ) );
            Derived result( initial_capacity );
            for ( auto && [ key, value ] : pairs )
                result.set( key, value );
            return result;
        }

        [[ nodiscard ]] size_type existing_index( key_const_arg key ) const
        {
            auto const index{ this->find_index( key ) };
            if ( index == engine::npos ) [[ unlikely ]]
                throw_key_not_found( Derived::container_name, rendered( key ) );
            return index;
        }
    }; // class table_impl
} // namespace detail

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
