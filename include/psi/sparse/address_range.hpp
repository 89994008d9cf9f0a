////////////////////////////////////////////////////////////////////////////////
///
/// \file address_range.hpp
/// -----------------------
///
/// Half-open [begin, end) intervals over the flat 64 bit address space.
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

#include <psi/build/disable_warnings.hpp>

#include <boost/config_ex.hpp>

#include <algorithm>
#include <cstdint>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

using address     = std::uint64_t;
using storage_key = std::uint64_t;

struct [[ clang::trivial_abi ]] address_range
{
    address begin{};
    address end  {};

    // a default constructed or reversed range is simply empty - queries with
    // malformed ranges match nothing instead of failing
    [[ gnu::pure ]] constexpr bool    empty() const noexcept { return end <= begin; }
    [[ gnu::pure ]] constexpr address size () const noexcept { return empty() ? 0 : end - begin; }

    [[ gnu::pure ]] constexpr bool contains( address const point ) const noexcept { return ( point >= begin ) && ( point < end ); }
    [[ gnu::pure ]] constexpr bool contains( address_range const other ) const noexcept { return ( other.begin >= begin ) && ( other.end <= end ); }
    [[ gnu::pure ]] constexpr bool overlaps( address_range const other ) const noexcept
    {
        return !empty() && !other.empty() && ( begin < other.end ) && ( other.begin < end );
    }
    [[ gnu::pure ]] constexpr bool touches( address_range const next ) const noexcept { return end == next.begin; }

    // offsets relative to a base address (e.g. the start of a block buffer)
    [[ gnu::pure ]] constexpr address_range relative_to( address const base ) const noexcept
    {
        BOOST_ASSUME( begin >= base );
        return { begin - base, end - base };
    }

    [[ gnu::pure ]] constexpr bool operator==( address_range const & ) const noexcept = default;
}; // struct address_range

[[ gnu::pure ]] constexpr address_range intersection( address_range const a, address_range const b ) noexcept
{
    return { std::max( a.begin, b.begin ), std::min( a.end, b.end ) };
}

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
