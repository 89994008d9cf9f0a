#pragma once

#include "sparse_vector.hpp"

#include <cstdio>
#include <print>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

template <trivially_copyable T>
void sparse_vector<T>::print() const
{
    if ( empty() )
    {
        std::puts( "The container is empty." );
        return;
    }

    for ( auto const & e : index_ )
    {
        auto const p_block{ blocks_.find( e.key ) };
        std::print( "[{:#x}, {:#x}) #{}", e.range.begin, e.range.end, e.key );
        if ( !p_block )
            std::println( " <no block>" );
        else
        if ( p_block->range != e.range )
            std::println( " <block at [{:#x}, {:#x})>", p_block->range.begin, p_block->range.end );
        else
            std::println( " ({} elements)", p_block->data.size() );
    }
    std::println( "{} blocks w/ {} elements ({} stored blocks)", block_count(), stored_size(), blocks_.size() );
}

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
