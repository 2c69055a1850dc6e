// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_SUPPORT_MATHCONST_P_H_INCLUDED
#define POLYARC_SUPPORT_MATHCONST_P_H_INCLUDED

#include <polyarc/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup polyarc_support
//! \{

namespace pa {
namespace Math {

//! \name Math Constants
//! \{

static constexpr double kPI            = 3.14159265358979323846;  //!< pi.
static constexpr double kPI_MUL_2      = 6.28318530717958647692;  //!< pi * 2.
static constexpr double kPI_DIV_2      = 1.57079632679489661923;  //!< pi / 2.

//! Tolerance used when comparing angles in radians.
static constexpr double kANGLE_EPSILON = 1e-8;

//! \}

} // {Math}
} // {pa}

//! \}
//! \endcond

#endif // POLYARC_SUPPORT_MATHCONST_P_H_INCLUDED
