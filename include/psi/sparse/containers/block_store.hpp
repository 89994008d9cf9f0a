////////////////////////////////////////////////////////////////////////////////
/// psi::sparse::block_store
///
/// Keyed storage of element blocks: storage key -> (address range, buffer).
///
/// Keys and blocks live in two parallel vectors kept sorted by key (the
/// flat_map paired storage layout) - keys are compact for lookups while the
/// (much larger) blocks are only touched once found. Keys are handed out by a
/// monotonic counter so insertion is always an append.
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

#include <psi/sparse/address_range.hpp>
#include <psi/sparse/detail/reserve.hpp>

#include <psi/build/disable_warnings.hpp>

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

template <typename T>
struct block
{
    address_range  range;
    std::vector<T> data; // data[ i ] <-> address range.begin + i
}; // struct block

template <typename T>
class block_store
{
public:
    using block_type = block<T>;
    using size_type  = std::size_t;

    [[ gnu::pure ]] bool      empty() const noexcept { return keys_.empty(); }
    [[ gnu::pure ]] size_type size () const noexcept { return keys_.size (); }

    std::span<storage_key const> keys  () const noexcept { return keys_  ; }
    std::span<block_type  const> blocks() const noexcept { return blocks_; }

    [[ gnu::pure ]] block_type * find( storage_key const key ) noexcept
    {
        auto const pos{ std::ranges::lower_bound( keys_, key ) };
        if ( ( pos == keys_.end() ) || ( *pos != key ) )
            return nullptr;
        return &blocks_[ static_cast<size_type>( pos - keys_.begin() ) ];
    }
    [[ gnu::pure ]] block_type const * find( storage_key const key ) const noexcept { return const_cast<block_store &>( *this ).find( key ); }

    // the key has to be present
    block_type       & operator[]( storage_key const key )       noexcept { auto const p_block{ find( key ) }; BOOST_ASSUME( p_block ); return *p_block; }
    block_type const & operator[]( storage_key const key ) const noexcept { auto const p_block{ find( key ) }; BOOST_ASSUME( p_block ); return *p_block; }

    // keys have to be inserted in ascending order (as handed out by a
    // monotonic counter)
    void insert( storage_key const key, block_type && block )
    {
        BOOST_ASSERT( block.data.size() == block.range.size() );
        BOOST_ASSERT_MSG( keys_.empty() || ( key > keys_.back() ), "Storage keys out of order" );
        keys_.push_back( key );
        try {
            blocks_.push_back( std::move( block ) );
        } catch ( ... ) {
            keys_.pop_back();
            throw;
        }
    }

    // with room for 'additional' more blocks insert() does not allocate
    void reserve_additional( size_type const additional )
    {
        detail::reserve_geometric( keys_  , keys_  .size() + additional );
        detail::reserve_geometric( blocks_, blocks_.size() + additional );
    }

    bool erase( storage_key const key ) noexcept
    {
        auto const pos{ std::ranges::lower_bound( keys_, key ) };
        if ( ( pos == keys_.end() ) || ( *pos != key ) )
            return false;
        auto const offset{ pos - keys_.begin() };
        keys_  .erase( pos );
        blocks_.erase( blocks_.begin() + offset );
        return true;
    }

    // keeps only the blocks whose keys satisfy the predicate, returns the
    // number of removed blocks
    template <typename Predicate>
    size_type retain( Predicate && keep )
    {
        size_type kept{ 0 };
        for ( size_type i{ 0 }; i < keys_.size(); ++i )
        {
            if ( !keep( std::as_const( keys_[ i ] ) ) )
                continue;
            if ( kept != i )
            {
                keys_  [ kept ] = keys_[ i ];
                blocks_[ kept ] = std::move( blocks_[ i ] );
            }
            ++kept;
        }
        auto const removed{ keys_.size() - kept };
        keys_  .erase( keys_  .begin() + static_cast<std::ptrdiff_t>( kept ), keys_  .end() );
        blocks_.erase( blocks_.begin() + static_cast<std::ptrdiff_t>( kept ), blocks_.end() );
        return removed;
    }

    void clear() noexcept
    {
        keys_  .clear();
        blocks_.clear();
    }

private:
    std::vector<storage_key> keys_;
    std::vector<block_type > blocks_;
}; // class block_store

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
