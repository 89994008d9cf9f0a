////////////////////////////////////////////////////////////////////////////////
///
/// \file reserve.hpp
/// -----------------
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

#include <algorithm>
//------------------------------------------------------------------------------
namespace psi::sparse::detail
{
//------------------------------------------------------------------------------

// Ensures room for at least min_capacity elements while keeping geometric
// growth (repeated exact reserve() calls would reallocate on every call).
template <typename Vector>
void reserve_geometric( Vector & vector, typename Vector::size_type const min_capacity )
{
    if ( min_capacity > vector.capacity() )
        vector.reserve( std::max( min_capacity, 2 * vector.capacity() ) );
}

//------------------------------------------------------------------------------
} // namespace psi::sparse::detail
//------------------------------------------------------------------------------
