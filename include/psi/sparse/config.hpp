////////////////////////////////////////////////////////////////////////////////
///
/// \file config.hpp
/// ----------------
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
//------------------------------------------------------------------------------

// Full (and expensive - the complete global state is cross-checked) container
// self-check after every sparse_vector::insert() - failures abort. Defaults
// to debug builds only.
#if !defined( PSI_SPARSE_VALIDATE_INSERTS )
#   ifdef NDEBUG
#       define PSI_SPARSE_VALIDATE_INSERTS 0
#   else
#       define PSI_SPARSE_VALIDATE_INSERTS 1
#   endif
#endif // !defined( PSI_SPARSE_VALIDATE_INSERTS )

//------------------------------------------------------------------------------
