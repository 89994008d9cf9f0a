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
#include <psi/sparse/containers/sparse_vector.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <print>
#include <ranges>
#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_address_overflow() { throw std::overflow_error( "psi::sparse: write extends past the end of the address space" ); }
    [[ noreturn, gnu::cold ]] void throw_modification_while_leased() { throw std::logic_error( "psi::sparse: structural modification with outstanding mutable views" ); }

    [[ noreturn, gnu::cold ]] void report_corruption( char const * const operation ) noexcept
    {
        std::println( stderr, "{}: container invariants violated.", operation );
        std::abort();
    }
} // namespace detail

sparse_vector_base::sparse_vector_base( sparse_vector_base && other ) noexcept
    :
    index_        { std::move( other.index_ ) },
    next_key_     { other.next_key_ },
    active_leases_{ 0 }
{
    BOOST_ASSERT_MSG( !other.active_leases_, "Moving a container with outstanding mutable views" );
    other.index_.clear();
}

sparse_vector_base & sparse_vector_base::operator=( sparse_vector_base && other ) noexcept
{
    BOOST_ASSERT_MSG( !active_leases_ && !other.active_leases_, "Moving a container with outstanding mutable views" );
    index_    = std::move( other.index_ );
    next_key_ = other.next_key_;
    other.index_.clear();
    return *this;
}

sparse_vector_base::~sparse_vector_base() noexcept
{
    BOOST_ASSERT_MSG( !active_leases_, "Container destroyed while mutable views are still alive" );
}

address_range sparse_vector_base::prepare_insert( address const addr, std::size_t const size ) const
{
    BOOST_ASSUME( size != 0 );
    verify_not_leased();
    // the end of the range has to be representable
    if ( size > std::numeric_limits<address>::max() - addr ) [[ unlikely ]]
        detail::throw_address_overflow();
    return { addr, addr + size };
}

void sparse_vector_base::verify_not_leased() const
{
    if ( active_leases_ ) [[ unlikely ]]
        detail::throw_modification_while_leased();
}

std::optional<range_index::entry>
sparse_vector_base::containing_entry( address_range const range ) const noexcept
{
    auto const p_at_begin{ index_.find( range.begin ) };
    if ( !p_at_begin )
        return std::nullopt;
    auto const p_at_end{ index_.find( range.end ) };
    if ( !p_at_end || ( p_at_end->key != p_at_begin->key ) )
        return std::nullopt;
    return *p_at_begin;
}

std::optional<range_index::entry>
sparse_vector_base::left_neighbour( address_range const range ) const noexcept
{
    if ( range.begin == 0 )
        return std::nullopt;
    // an entry covering the preceding address cannot extend into the range
    if ( auto const p_entry{ index_.find( range.begin - 1 ) } )
    {
        BOOST_ASSUME( p_entry->range.touches( range ) );
        return *p_entry;
    }
    return std::nullopt;
}

std::optional<range_index::entry>
sparse_vector_base::right_neighbour( address_range const range ) const noexcept
{
    if ( auto const p_entry{ index_.find( range.end ) } )
    {
        BOOST_ASSUME( range.touches( p_entry->range ) );
        return *p_entry;
    }
    return std::nullopt;
}

sparse_vector_base::merge_target
sparse_vector_base::merge_target_of( address_range const inserted ) const noexcept
{
    // entries covering the addresses just outside of the written range are
    // clipped to it (or split around it) and then merged with it
    merge_target target{ inserted, std::nullopt };
    if ( inserted.begin != 0 )
    {
        if ( auto const p_left{ index_.find( inserted.begin - 1 ) } )
        {
            target.extent.begin = p_left->range.begin;
            target.key          = p_left->key;
        }
    }
    if ( auto const p_right{ index_.find( inserted.end ) } )
        target.extent.end = p_right->range.end;
    return target;
}

std::span<range_index::entry const>
sparse_vector_base::covered_entries( address_range const range ) const noexcept
{
    auto first{ index_.upper_bound( range.begin ) };
    if ( ( first != index_.end() ) && ( first->range.begin < range.begin ) )
        ++first; // only clipped
    auto const last{ std::find_if( first, index_.end(), [ = ]( entry const & e ) noexcept { return e.range.end > range.end; } ) };
    return { first, last };
}

bool sparse_vector_base::check_index_invariants() const noexcept
{
    if ( !index_.check_ordering() )
        return false;
    auto const touching{ std::ranges::adjacent_find( index_, []( entry const & left, entry const & right ) noexcept {
        return left.range.touches( right.range );
    }) };
    return touching == index_.end();
}

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
