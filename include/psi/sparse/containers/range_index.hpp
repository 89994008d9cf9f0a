////////////////////////////////////////////////////////////////////////////////
/// psi::sparse::range_index
///
/// Ordered, non-overlapping mapping of half-open address ranges to storage
/// keys. Owns no element data - only address -> key associations.
///
/// Layout: a single sorted contiguous vector of (range, key) entries (the
/// flat_set approach) - lookups are binary searches over the entry begins.
///
/// insert()/erase() clip whatever they overlap:
///   - entries fully covered are removed,
///   - entries partially covered are truncated (keeping their key),
///   - an entry strictly containing the range is split into two pieces that
///     both keep the original key.
/// The last case leaves the index with a duplicated key - users that require
/// unique keys (sparse_vector) have to split such an entry themselves before
/// inserting.
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

#include <cstddef>
#include <span>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

////////////////////////////////////////////////////////////////////////////////
// \class range_index
////////////////////////////////////////////////////////////////////////////////

class range_index
{
public:
    struct entry
    {
        address_range range;
        storage_key   key;

        bool operator==( entry const & ) const noexcept = default;
    }; // struct entry

    using value_type     = entry;
    using size_type      = std::size_t;
    using const_iterator = std::vector<entry>::const_iterator;
    using iterator       = const_iterator; // entries are not user modifiable

    [[ gnu::pure ]] bool      empty() const noexcept { return entries_.empty(); }
    [[ gnu::pure ]] size_type size () const noexcept { return entries_.size (); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end  () const noexcept { return entries_.end  (); }

    std::span<entry const> entries() const noexcept { return entries_; }

    // point lookup: the entry covering the address (nullptr if none)
    [[ gnu::pure ]] entry const * find( address point ) const noexcept;

    // the first entry that ends after the address (i.e. the entry covering it
    // or the next one above it)
    [[ gnu::pure ]] const_iterator upper_bound( address point ) const noexcept;

    [[ gnu::pure ]] bool overlaps( address_range query ) const noexcept;

    void insert( address_range range, storage_key key );
    void erase ( address_range range );

    void clear() noexcept { entries_.clear(); }

    // with room for 'additional' more entries insert() and erase() do not
    // allocate (an insert adds at most two entries, an erase at most one)
    void reserve_additional( size_type const additional ) { detail::reserve_geometric( entries_, entries_.size() + additional ); }

    // well formed (non-empty) ranges, ascending order, no overlaps
    [[ nodiscard ]] bool check_ordering() const noexcept;
    // check_ordering() + no key used more than once
    [[ nodiscard ]] bool check_invariants() const;

private:
    void splice( address_range cleared, entry const * p_replacement );

private:
    std::vector<entry> entries_; // sorted by range.begin
}; // class range_index

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
