// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_GEOMETRY_TOLERANCE_P_H_INCLUDED
#define POLYARC_GEOMETRY_TOLERANCE_P_H_INCLUDED

#include <polyarc/geometry/commons_p.h>

//! \cond INTERNAL
//! \addtogroup polyarc_geometry
//! \{

namespace pa::Geometry {

struct Tolerance {
  //! Position equality and intersection tolerance.
  double pos_equal_eps;
  //! Tolerance used to join slice end points when stitching.
  double slice_join_eps;
  //! Distance tolerance used when validating offset slices.
  double offset_dist_eps;
  //! Area below which a closed result is considered collapsed.
  double collapsed_area_eps;
};

static PA_INLINE Tolerance make_tolerance(double tolerance, double join_tolerance, double offset_tolerance) noexcept {
  double area = pa_max(tolerance * tolerance * 4.0, 1e-12);
  return Tolerance{tolerance, join_tolerance, offset_tolerance, area};
}

static PA_INLINE Tolerance make_tolerance(double tolerance) noexcept {
  return make_tolerance(tolerance, tolerance * 10.0, tolerance * 10.0);
}

} // {pa::Geometry}

//! \}
//! \endcond

#endif // POLYARC_GEOMETRY_TOLERANCE_P_H_INCLUDED
