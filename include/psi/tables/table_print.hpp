#pragma once

#include "table_common.hpp"

#include <cstdio>
#include <string>
//------------------------------------------------------------------------------
namespace psi::tables
{
//------------------------------------------------------------------------------

template <typename Derived, typename Slot, typename Hash, typename KeyEqual>
void detail::table_impl<Derived, Slot, Hash, KeyEqual>::print() const
{
    auto const slots{ this->slots() };
    if ( slots.empty() )
    {
        std::puts( "The table holds no storage (moved-from)." );
        return;
    }

    std::string line;
    for ( std::size_t i{ 0 }; i < slots.size(); ++i )
    {
        auto const & slot{ slots[ i ] };
        line.clear();
        if ( slot.filled() )
        {
            append_rendered( line, slot.key );
            line += ": ";
            append_rendered( line, slot.value );
        }
        else
        {
            line = slot.deleted() ? "<deleted>" : "<empty>";
        }
        std::printf( "%5zu\t%s\n", i, line.c_str() );
    }
    std::printf( "[%zu live, %zu tombstones, capacity %zu]\n", this->size(), this->tombstones(), this->capacity() );
}

//------------------------------------------------------------------------------
} // namespace psi::tables
//------------------------------------------------------------------------------
