// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_CORE_POLYLINEOFFSET_P_H_INCLUDED
#define POLYARC_CORE_POLYLINEOFFSET_P_H_INCLUDED

#include <polyarc/core/api-internal_p.h>
#include <polyarc/core/polyline.h>
#include <polyarc/geometry/polylineview_p.h>
#include <polyarc/geometry/tolerance_p.h>

#include <vector>

//! \cond INTERNAL
//! \addtogroup pa_internal
//! \{

namespace pa::PolylineInternal {

//! \name Polyline Offset
//!
//! The offset engine works with a left-positive `offset`: positive values move every segment to the left of its
//! direction (inward for a counter-clockwise polyline). The public API negates the distance it receives.
//!
//! \{

//! Raw offset of a single segment of the input.
struct RawOffsetSeg {
  //! Start vertex of the offset segment, its bulge describes the offset segment.
  PAVertex v1;
  //! End vertex of the offset segment.
  PAVertex v2;
  //! Start position of the input segment.
  PAPoint orig_v1;
  //! End position of the input segment (the center of a connecting fillet).
  PAPoint orig_v2;
  //! The input segment was an arc whose radius collapsed, the offset segment is a line.
  bool collapsed_arc;
};

//! Creates raw offset segments of every segment of `input`.
PA_HIDDEN void create_raw_offset_segments(std::vector<RawOffsetSeg>& out, const Geometry::PolylineRef& input, double offset, double eps);

//! Joins raw offset `segments` of `input` into a single raw offset polyline stored in `out`.
//!
//! Convex corners are connected by arcs centered at the input vertex, concave corners are trimmed at the
//! intersection of both segments if one exists. The result may intersect itself.
PA_HIDDEN void create_raw_offset_polyline(PAPolyline& out, const Geometry::PolylineRef& input, const std::vector<RawOffsetSeg>& segments, double offset, double eps);

//! Offsets `input` by `offset` and appends all resulting polylines to `out`.
//!
//! The input must be valid and must not contain repeated positions. Throws `std::bad_alloc` on allocation failure.
PA_HIDDEN void parallel_offset(PAPolylineArray& out, const Geometry::PolylineRef& input, double offset, const Geometry::Tolerance& tol, uint32_t flags);

//! \}

} // {pa::PolylineInternal}

//! \}
//! \endcond

#endif // POLYARC_CORE_POLYLINEOFFSET_P_H_INCLUDED
