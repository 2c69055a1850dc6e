// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_CORE_POLYLINEBOOLEAN_P_H_INCLUDED
#define POLYARC_CORE_POLYLINEBOOLEAN_P_H_INCLUDED

#include <polyarc/core/api-internal_p.h>
#include <polyarc/core/polyline.h>
#include <polyarc/geometry/tolerance_p.h>

//! \cond INTERNAL
//! \addtogroup pa_internal
//! \{

namespace pa::PolylineInternal {

//! \name Polyline Boolean
//! \{

//! Position of a slice of one polyline relative to the other one.
enum class SliceLocation : uint32_t {
  //! Outside of the other polyline.
  kOutside = 0,
  //! Inside of the other polyline.
  kInside = 1,
  //! On the boundary of the other polyline, both going in the same direction.
  kCoincidentSame = 2,
  //! On the boundary of the other polyline, going in opposite directions.
  kCoincidentOpposite = 3
};

//! Combines closed polylines `a` and `b` by `op` and appends the resulting polylines to `out`.
//!
//! Both inputs must be valid closed polylines that don't intersect themselves and have no repeated positions.
//! Outer polylines have the orientation of `a`, holes have the opposite one. Throws `std::bad_alloc` on allocation
//! failure.
PA_HIDDEN void boolean_combine(PAPolylineArray& out, const PAPolyline& a, const PAPolyline& b, PABooleanOperator op, const Geometry::Tolerance& tol);

//! \}

} // {pa::PolylineInternal}

//! \}
//! \endcond

#endif // POLYARC_CORE_POLYLINEBOOLEAN_P_H_INCLUDED
