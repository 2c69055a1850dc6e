// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_CORE_POLYLINESTITCH_P_H_INCLUDED
#define POLYARC_CORE_POLYLINESTITCH_P_H_INCLUDED

#include <polyarc/core/api-internal_p.h>
#include <polyarc/core/polyline.h>
#include <polyarc/geometry/tolerance_p.h>

#include <vector>

//! \cond INTERNAL
//! \addtogroup pa_internal
//! \{

namespace pa::PolylineInternal {

//! Open piece of a polyline produced by slicing, ready to be stitched.
struct StitchSlice {
  //! Vertices of the slice, the last vertex is the end point and has zero bulge.
  PAPolyline polyline;
  //! Identifies the polyline the slice was cut from.
  uint32_t source_id;
  //! Index of the source segment that contains the start point.
  size_t start_index;
  //! Number of vertices of the source polyline.
  size_t source_size;

  PA_INLINE_NODEBUG PAPoint start_point() const noexcept { return polyline.at(0).pos(); }
  PA_INLINE_NODEBUG PAPoint end_point() const noexcept { return polyline.last().pos(); }
};

//! Point where a polyline is split into slices.
struct SlicePoint {
  //! Index of the segment that contains the point.
  size_t index;
  //! Position along the segment, see `Geometry::seg_parameter()`.
  double param;
  PAPoint point;
};

//! Stitching mode.
enum class StitchMode : uint32_t {
  //! Chains that don't return to their start are discarded.
  kClosedOnly = 0,
  //! Chains that don't return to their start are kept as open polylines.
  kKeepOpen = 1
};

//! Sorts `points` by segment index and position along the segment and removes points closer than `eps` on the
//! same segment.
PA_HIDDEN void sort_slice_points(std::vector<SlicePoint>& points, double eps) noexcept;

//! Joins `slices` end to start and appends the resulting polylines to `out`.
//!
//! When the end of a chain meets the start of more than one slice the continuation with the smallest signed turning
//! angle is chosen, ties are broken by the smallest forward index distance within the same source and then by the
//! slice index. Closed loops with an area below `tol.collapsed_area_eps` are discarded.
PA_HIDDEN void stitch_slices(PAPolylineArray& out, const std::vector<StitchSlice>& slices, const Geometry::Tolerance& tol, StitchMode mode);

} // {pa::PolylineInternal}

//! \}
//! \endcond

#endif // POLYARC_CORE_POLYLINESTITCH_P_H_INCLUDED
