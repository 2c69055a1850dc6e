// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_GEOMETRY_POLYLINEINTERSECT_P_H_INCLUDED
#define POLYARC_GEOMETRY_POLYLINEINTERSECT_P_H_INCLUDED

#include <polyarc/geometry/aabbindex_p.h>
#include <polyarc/geometry/intersect_p.h>
#include <polyarc/geometry/polylineview_p.h>

#include <vector>

//! \cond INTERNAL
//! \addtogroup polyarc_geometry
//! \{

namespace pa::Geometry {

//! \name Polyline Intersects
//! \{

//! Single point where segment `start_index1` of the first polyline meets segment `start_index2` of the second one
//! (both indexes refer to the same polyline for self intersects).
struct BasicIntersect {
  size_t start_index1;
  size_t start_index2;
  PAPoint point;
};

//! Range shared by two overlapping segments, `point1` and `point2` are ordered along the first segment.
struct OverlappingIntersect {
  size_t start_index1;
  size_t start_index2;
  PAPoint point1;
  PAPoint point2;
};

//! Intersects between two polylines.
struct IntersectsResult {
  std::vector<BasicIntersect> basic;
  std::vector<OverlappingIntersect> overlapping;

  PA_INLINE_NODEBUG bool empty() const noexcept { return basic.empty() && overlapping.empty(); }

  PA_INLINE_NODEBUG void clear() noexcept {
    basic.clear();
    overlapping.clear();
  }
};

//! Adds the bounding box of every segment of `polyline`, expanded by `fuzz`, to `index` and finishes it.
PA_HIDDEN void build_segment_index(AABBIndex& index, const PolylineRef& polyline, double fuzz);

//! Finds intersects of adjacent segments that are not at their shared vertex.
PA_HIDDEN void find_local_self_intersects(std::vector<BasicIntersect>& out, const PolylineRef& polyline, double eps);

//! Finds intersects of non-adjacent segments, each pair is visited once (`start_index1 < start_index2`).
//!
//! `index` must be built from `polyline` by `build_segment_index()`.
PA_HIDDEN void find_global_self_intersects(std::vector<BasicIntersect>& out, const PolylineRef& polyline, const AABBIndex& index, double eps);

//! Finds all intersects between `a` and `b`, `a_index` must be built from `a`.
//!
//! A point at the end of a segment is only reported as the start of the following segment, so no point is
//! reported twice because it lies on a shared vertex.
PA_HIDDEN void find_intersects(IntersectsResult& out, const PolylineRef& a, const PolylineRef& b, const AABBIndex& a_index, double eps);

//! Tests whether `polyline` intersects itself anywhere other than at vertices shared by adjacent segments.
PA_HIDDEN bool is_self_intersecting(const PolylineRef& polyline, double eps);

//! \}

} // {pa::Geometry}

//! \}
//! \endcond

#endif // POLYARC_GEOMETRY_POLYLINEINTERSECT_P_H_INCLUDED
