////////////////////////////////////////////////////////////////////////////////
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
#include <psi/sparse/containers/range_index.hpp>

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <iterator>
#include <ranges>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

namespace
{
    // entries do not overlap so their ends are sorted just like their begins
    constexpr auto range_begin{ []( range_index::entry const & e ) noexcept { return e.range.begin; } };
    constexpr auto range_end  { []( range_index::entry const & e ) noexcept { return e.range.end  ; } };
} // anonymous namespace

range_index::const_iterator
range_index::upper_bound( address const point ) const noexcept
{
    return std::ranges::upper_bound( entries_, point, std::less{}, range_end );
}

range_index::entry const *
range_index::find( address const point ) const noexcept
{
    auto const pos{ upper_bound( point ) };
    if ( ( pos != end() ) && pos->range.contains( point ) )
        return &*pos;
    return nullptr;
}

bool range_index::overlaps( address_range const query ) const noexcept
{
    if ( query.empty() )
        return false;
    auto const pos{ upper_bound( query.begin ) };
    return ( pos != end() ) && ( pos->range.begin < query.end );
}

void range_index::insert( address_range const range, storage_key const key )
{
    BOOST_ASSERT_MSG( !range.empty(), "Only non-empty ranges can be indexed" );
    entry const replacement{ range, key };
    splice( range, &replacement );
}

void range_index::erase( address_range const range )
{
    if ( !range.empty() )
        splice( range, nullptr );
}

void range_index::splice( address_range const cleared, entry const * const p_replacement )
{
    BOOST_ASSUME( !p_replacement || ( p_replacement->range == cleared ) );

    // [first, last) = the entries overlapping the cleared range
    auto const first{ std::ranges::upper_bound( entries_, cleared.begin, std::less{}, range_end ) };
    auto const last { std::ranges::lower_bound( first, entries_.end(), cleared.end, std::less{}, range_begin ) };

    // what remains of the overlapped entries (at most a head and a tail) with
    // the replacement in between, in address order
    std::array<entry, 3> survivors{};
    std::uint8_t         count    { 0 };
    if ( ( first != last ) && ( first->range.begin < cleared.begin ) )
        survivors[ count++ ] = { { first->range.begin, cleared.begin }, first->key };
    if ( p_replacement )
        survivors[ count++ ] = *p_replacement;
    if ( first != last )
    {
        auto const & back{ *std::prev( last ) };
        if ( back.range.end > cleared.end )
            survivors[ count++ ] = { { cleared.end, back.range.end }, back.key };
    }

    auto const overlapped{ static_cast<std::size_t>( last - first ) };
    if ( overlapped >= count )
    {
        std::copy_n( survivors.begin(), count, first );
        entries_.erase( first + count, last );
    }
    else
    {
        std::copy_n( survivors.begin(), overlapped, first );
        entries_.insert( last, survivors.begin() + static_cast<std::ptrdiff_t>( overlapped ), survivors.begin() + count );
    }
}

bool range_index::check_ordering() const noexcept
{
    if ( std::ranges::any_of( entries_, []( entry const & e ) noexcept { return e.range.empty(); } ) )
        return false;
    // with non-empty ranges 'previous ends before next begins' implies both
    // the ordering and the absence of overlaps
    auto const misplaced{ std::ranges::adjacent_find( entries_, []( entry const & left, entry const & right ) noexcept {
        return left.range.end > right.range.begin;
    }) };
    return misplaced == entries_.end();
}

bool range_index::check_invariants() const
{
    if ( !check_ordering() )
        return false;
    auto keys{ std::ranges::to<std::vector>( entries_ | std::views::transform( &entry::key ) ) };
    std::ranges::sort( keys );
    return std::ranges::adjacent_find( keys ) == keys.end();
}

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
