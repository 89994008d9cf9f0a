////////////////////////////////////////////////////////////////////////////////
/// psi::sparse::sparse_vector
///
/// Sparse, range indexed container over the flat 64 bit address space: only
/// written ranges are stored, contiguous writes coalesce and overlapping
/// writes are resolved element by element in favour of the newest one (while
/// the non-overlapped parts of older writes are preserved).
///
/// Architecture:
///   sparse_vector_base - type agnostic part (range_index, key allocation,
///     lease bookkeeping, validation of writes), compiled into the library.
///   sparse_vector<T>   - owns the block_store and drives both structures
///     through an insert. All allocations (the new block, the split off
///     part, index and store slots, the capacity of the block that absorbs
///     the write) are made upfront, the steps below then cannot fail:
///       0) split a block that strictly contains the new range on its upper
///          side (the range_index would otherwise leave two pieces with the
///          same key),
///       1) index and store the new block (the index clips everything it
///          overlaps),
///       2) resync the buffers of the (clipped) neighbours with their index
///          ranges,
///       3) merge with neighbours that touch the new range,
///       4) drop the blocks of entries the new range covered completely,
///       5) (PSI_SPARSE_VALIDATE_INSERTS builds) full self-check.
///     Steps 2 and 3 only have to look at the two immediate neighbours: only
///     they can have been clipped (and a clipped neighbour always ends up
///     touching the new range) and, adjacent blocks having always been merged
///     before, no other pair can have become adjacent.
///
/// Queries never span blocks: contiguous data always lives in a single block
/// so a range that does not fit into one block necessarily covers a gap.
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

#include "block_store.hpp"
#include "range_index.hpp"

#include <psi/sparse/address_range.hpp>
#include <psi/sparse/config.hpp>
#include <psi/sparse/detail/reserve.hpp>

#include <psi/build/disable_warnings.hpp>

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_address_overflow();
    [[ noreturn, gnu::cold ]] void throw_modification_while_leased();
    [[ noreturn, gnu::cold ]] void report_corruption( char const * operation ) noexcept;
} // namespace detail

template <typename T>
concept trivially_copyable = std::is_trivially_copyable_v<T> && !std::is_const_v<T>;


////////////////////////////////////////////////////////////////////////////////
// \class sparse_vector_base
////////////////////////////////////////////////////////////////////////////////

class sparse_vector_base
{
public:
    using size_type = std::size_t;

    [[ gnu::pure ]] bool      empty      () const noexcept { return index_.empty(); }
    [[ gnu::pure ]] size_type block_count() const noexcept { return index_.size (); }

    [[ gnu::pure ]] bool overlaps( address_range const query ) const noexcept { return index_.overlaps( query ); }

    // ascending, restartable view of the stored ranges (not to be held across
    // modifications)
    auto ranges() const noexcept { return std::views::transform( index_.entries(), &range_index::entry::range ); }

    range_index const & index() const noexcept { return index_; }

protected:
    using entry = range_index::entry;

    sparse_vector_base() noexcept = default;
    // moving with outstanding mutable views is not allowed
    sparse_vector_base( sparse_vector_base && ) noexcept;
    sparse_vector_base & operator=( sparse_vector_base && ) noexcept;
   ~sparse_vector_base() noexcept;

    // validates a write of 'size' elements at 'addr', returns the written range
    address_range prepare_insert( address addr, std::size_t size ) const;
    void          verify_not_leased() const;

    storage_key allocate_key() noexcept { return next_key_++; }

    // the entry covering the whole range and reaching beyond its end (which
    // has to be split before the range can be indexed)
    std::optional<entry> containing_entry( address_range ) const noexcept;

    // entries touching the range from the left/right
    std::optional<entry> left_neighbour ( address_range ) const noexcept;
    std::optional<entry> right_neighbour( address_range ) const noexcept;

    // The block a write ends up in once merged with its neighbours: its
    // extent and the key of the stored block that absorbs the write (none
    // when the written block itself survives). Evaluated before the write.
    struct merge_target
    {
        address_range              extent;
        std::optional<storage_key> key;
    };
    merge_target merge_target_of( address_range ) const noexcept;

    // entries lying completely within the range (orphaned by its insertion)
    std::span<entry const> covered_entries( address_range ) const noexcept;

    // range_index ordering + no two entries touch
    [[ nodiscard ]] bool check_index_invariants() const noexcept;

protected:
    range_index   index_;
    storage_key   next_key_     { 0 }; // never reused (survives clear())
    std::uint32_t active_leases_{ 0 }; // outstanding mutable views
}; // class sparse_vector_base


////////////////////////////////////////////////////////////////////////////////
// \class sparse_vector
////////////////////////////////////////////////////////////////////////////////

template <trivially_copyable T>
class sparse_vector : public sparse_vector_base
{
public:
    using value_type = T;
    using block_type = block<T>;
    using store_type = block_store<T>;

    ////////////////////////////////////////////////////////////////////////////
    // Writable view into a single block. Holds a lease on the container: the
    // structure (insert(), clear()) cannot be modified while any is alive.
    ////////////////////////////////////////////////////////////////////////////
    class [[ nodiscard ]] mutable_view : public std::span<T>
    {
    public:
        mutable_view( mutable_view && other ) noexcept
            : std::span<T>{ other.span() }, p_leases_{ std::exchange( other.p_leases_, nullptr ) } {}
        mutable_view & operator=( mutable_view && ) = delete;
       ~mutable_view() noexcept { if ( p_leases_ ) { BOOST_ASSUME( *p_leases_ ); --*p_leases_; } }

        std::span<T> span() const noexcept { return static_cast<std::span<T> const &>( *this ); }

    private: friend class sparse_vector;
        mutable_view( std::span<T> const view, std::uint32_t & leases ) noexcept
            : std::span<T>{ view }, p_leases_{ &leases } { ++leases; }

        std::uint32_t * p_leases_;
    }; // class mutable_view

    sparse_vector() noexcept = default;
    sparse_vector( sparse_vector && ) noexcept = default;
    sparse_vector & operator=( sparse_vector && ) noexcept = default;

    void insert( std::span<T const> data, address addr );

    std::optional<std::span<T const>> get    ( address_range range ) const noexcept;
    std::optional<mutable_view      > get_mut( address_range range )       noexcept;

    // total number of stored elements
    [[ gnu::pure ]] size_type stored_size() const noexcept
    {
        return std::ranges::fold_left( blocks_.blocks() | std::views::transform( []( block_type const & b ) noexcept { return b.data.size(); } ), size_type{ 0 }, std::plus{} );
    }

    void clear()
    {
        verify_not_leased();
        index_ .clear();
        blocks_.clear();
    }

    store_type const & blocks() const noexcept { return blocks_; }

    // cross-checks the complete state (without allocating):
    // - index entries are well formed, ordered, disjoint, do not touch and
    //   use unique keys
    // - every indexed key has a block with the same range and a buffer of
    //   matching size
    // - the store holds nothing else
    [[ nodiscard ]] bool check_invariants() const;

    void print() const; // sparse_vector_print.hpp

private:
    block_type const * block_for( address_range ) const noexcept;

    void          split_containing_block( address_range inserted, entry const & old, block_type && upper ) noexcept;
    void          resync( entry const & ) noexcept;
    address_range merge ( entry const & lower, entry const & upper ) noexcept;
    void          collect_garbage( std::span<storage_key> orphans ) noexcept;

    static void shrink( block_type &, address_range ) noexcept;

private:
    store_type blocks_;
}; // class sparse_vector


template <trivially_copyable T>
void sparse_vector<T>::insert( std::span<T const> const data, address const addr )
{
    if ( data.empty() )
        return;
    auto const inserted{ prepare_insert( addr, data.size() ) };

    // Allocation stage: everything that can throw is done (or reserved)
    // before the first modification so that a failure leaves the container
    // untouched.
    auto const old   { containing_entry( inserted ) };
    auto const target{ merge_target_of ( inserted ) };
    auto       orphans{ std::ranges::to<std::vector>( covered_entries( inserted ) | std::views::transform( &entry::key ) ) };

    block_type fresh{ inserted, {} };
    fresh.data.reserve( target.key ? inserted.size() : target.extent.size() );
    fresh.data.assign ( data.begin(), data.end() );

    block_type upper;
    if ( old )
    {
        upper.range = { inserted.end, old->range.end };
        auto const & source{ blocks_[ old->key ].data };
        auto const   tail  { upper.range.relative_to( old->range.begin ) };
        upper.data.assign( source.begin() + static_cast<std::ptrdiff_t>( tail.begin ), source.begin() + static_cast<std::ptrdiff_t>( tail.end ) );
    }

    if ( target.key )
        detail::reserve_geometric( blocks_[ *target.key ].data, target.extent.size() );
    index_ .reserve_additional( 2 ); // the carved upper part and the new range
    blocks_.reserve_additional( 2 );

    // Commit stage: nothing below allocates.
    if ( old )
        split_containing_block( inserted, *old, std::move( upper ) );

    auto const key{ allocate_key() };
    index_ .insert( inserted, key );
    blocks_.insert( key, std::move( fresh ) );

    auto const left { left_neighbour ( inserted ) };
    auto const right{ right_neighbour( inserted ) };
    if ( left  ) resync( *left  );
    if ( right ) resync( *right );

    entry merged{ inserted, key };
    if ( left  ) merged = { merge( *left , merged ), left->key };
    if ( right ) merged = { merge( merged, *right ), merged.key };
    BOOST_ASSERT( merged.range == target.extent );

    collect_garbage( orphans );

#if PSI_SPARSE_VALIDATE_INSERTS
    if ( !check_invariants() ) [[ unlikely ]]
        detail::report_corruption( "psi::sparse::sparse_vector::insert" );
#endif
}

template <trivially_copyable T>
void sparse_vector<T>::split_containing_block( address_range const inserted, entry const & old, block_type && upper ) noexcept
{
    BOOST_ASSUME( !upper.range.empty() );
    auto const upper_key{ allocate_key() };
    index_ .insert( upper.range, upper_key );
    blocks_.insert( upper_key, std::move( upper ) );

    // what is left of the old entry now ends with the inserted range: cut it
    // back to the lower part (or drop it altogether)
    address_range const lower{ old.range.begin, inserted.begin };
    index_.erase( inserted );
    if ( lower.empty() )
        blocks_.erase( old.key );
    else
        shrink( blocks_[ old.key ], lower );
}

template <trivially_copyable T>
void sparse_vector<T>::resync( entry const & clipped ) noexcept
{
    auto & b{ blocks_[ clipped.key ] };
    if ( b.range != clipped.range )
        shrink( b, clipped.range );
}

template <trivially_copyable T>
address_range sparse_vector<T>::merge( entry const & lower, entry const & upper ) noexcept
{
    BOOST_ASSUME( lower.range.touches( upper.range ) );
    auto & target{ blocks_[ lower.key ] };
    auto & source{ blocks_[ upper.key ] };
    BOOST_ASSERT( target.range == lower.range );
    BOOST_ASSERT( source.range == upper.range );

    BOOST_ASSERT_MSG( target.data.capacity() >= target.data.size() + source.data.size(), "Merge target not reserved" );
    target.data.insert( target.data.end(), source.data.begin(), source.data.end() );
    target.range.end = upper.range.end;
    auto const merged_range{ target.range };

    index_ .insert( merged_range, lower.key ); // replaces both entries
    blocks_.erase ( upper.key );               // invalidates target & source
    return merged_range;
}

template <trivially_copyable T>
void sparse_vector<T>::collect_garbage( std::span<storage_key> const orphans ) noexcept
{
    if ( orphans.empty() )
        return;
    std::ranges::sort( orphans );
    blocks_.retain( [ = ]( storage_key const key ) noexcept { return !std::ranges::binary_search( orphans, key ); } );
}

template <trivially_copyable T>
void sparse_vector<T>::shrink( block_type & b, address_range const range ) noexcept
{
    BOOST_ASSUME( !range.empty() );
    BOOST_ASSUME( b.range.contains( range ) );
    auto const kept{ range.relative_to( b.range.begin ) };
    b.data.erase( b.data.begin() + static_cast<std::ptrdiff_t>( kept.end ), b.data.end() );
    b.data.erase( b.data.begin(), b.data.begin() + static_cast<std::ptrdiff_t>( kept.begin ) );
    b.range = range;
}

template <trivially_copyable T>
typename sparse_vector<T>::block_type const *
sparse_vector<T>::block_for( address_range const range ) const noexcept
{
    if ( range.end < range.begin )
        return nullptr;
    auto const p_entry{ index_.find( range.begin ) };
    if ( !p_entry || ( range.end > p_entry->range.end ) )
        return nullptr;
    return &blocks_[ p_entry->key ];
}

template <trivially_copyable T>
std::optional<std::span<T const>> sparse_vector<T>::get( address_range const range ) const noexcept
{
    auto const p_block{ block_for( range ) };
    if ( !p_block )
        return std::nullopt;
    auto const offsets{ range.relative_to( p_block->range.begin ) };
    return std::span<T const>{ p_block->data }.subspan( offsets.begin, offsets.size() );
}

template <trivially_copyable T>
std::optional<typename sparse_vector<T>::mutable_view> sparse_vector<T>::get_mut( address_range const range ) noexcept
{
    auto const p_block{ const_cast<block_type *>( block_for( range ) ) };
    if ( !p_block )
        return std::nullopt;
    auto const offsets{ range.relative_to( p_block->range.begin ) };
    return mutable_view{ std::span<T>{ p_block->data }.subspan( offsets.begin, offsets.size() ), active_leases_ };
}

template <trivially_copyable T>
bool sparse_vector<T>::check_invariants() const
{
    if ( !check_index_invariants() )
        return false;
    // Every entry has to match its block's range exactly so two (disjoint)
    // entries cannot share a key. With the keys thus unique and every one of
    // them found below, equal sizes mean there is nothing else in the store.
    if ( blocks_.size() != index_.size() )
        return false;
    return std::ranges::all_of( index_, [ this ]( entry const & e ) noexcept {
        auto const p_block{ blocks_.find( e.key ) };
        return p_block && ( p_block->range == e.range ) && ( p_block->data.size() == e.range.size() );
    });
}

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
