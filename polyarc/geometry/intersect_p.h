// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_GEOMETRY_INTERSECT_P_H_INCLUDED
#define POLYARC_GEOMETRY_INTERSECT_P_H_INCLUDED

#include <polyarc/geometry/segment_p.h>

//! \cond INTERNAL
//! \addtogroup polyarc_geometry
//! \{

namespace pa::Geometry {

//! \name Segment Intersection
//! \{

//! Classification of an intersection between two segments.
enum class IntersectType : uint32_t {
  //! Segments are disjoint within tolerance.
  kNone = 0,
  //! Segments touch at a single point without crossing (`p0`).
  kTangent = 1,
  //! Segments cross transversally or meet at an end point, `count` is 1 or 2.
  kCrossing = 2,
  //! Collinear lines or co-circular arcs share a sub-range from `p0` to `p1`.
  kOverlap = 3
};

//! Result of a segment intersection.
//!
//! Points are always ordered by their position along the first segment (from its start).
struct SegIntersect {
  IntersectType type;
  uint32_t count;
  PAPoint p0;
  PAPoint p1;

  PA_INLINE_NODEBUG bool has_intersection() const noexcept { return type != IntersectType::kNone; }
  PA_INLINE_NODEBUG bool is_overlap() const noexcept { return type == IntersectType::kOverlap; }
};

static PA_INLINE SegIntersect make_no_intersect() noexcept {
  return SegIntersect{IntersectType::kNone, 0u, PAPoint(0.0, 0.0), PAPoint(0.0, 0.0)};
}

//! Returns the position of `pt` along the segment `seg` (distance from start for lines, swept angle for arcs).
static PA_INLINE double seg_parameter(const Segment& seg, const PAPoint& pt) noexcept {
  if (seg.is_line())
    return dot(pt - seg.start, seg.end - seg.start);

  double s = sweep_angle(seg.start_angle(), angle(seg.center, pt), seg.is_ccw());
  double total = pa_abs(seg.sweep);

  // A point slightly before the start wraps to almost a full turn.
  if (s > total && Math::kPI_MUL_2 - s < s - total)
    s -= Math::kPI_MUL_2;
  return s;
}

//! \}

//! \name Line & Circle Primitives
//! \{

//! Relation of two infinite lines.
enum class LineRelation : uint32_t {
  //! Lines are parallel and don't coincide.
  kParallel = 0,
  //! Lines coincide.
  kCollinear = 1,
  //! Lines intersect at a single point, see `LineLineParams::t` and `LineLineParams::u`.
  kIntersect = 2
};

//! Intersection of infinite lines through `p0 -> p1` and `q0 -> q1` in parametric form.
struct LineLineParams {
  LineRelation relation;
  //! Parameter of the intersection along `p0 -> p1`.
  double t;
  //! Parameter of the intersection along `q0 -> q1`.
  double u;
};

//! Intersection of an infinite line with a circle in parametric form, parameters sorted ascending.
struct LineCircleParams {
  uint32_t count;
  double t[2];
};

//! Intersection points of two circles.
struct CircleCirclePoints {
  uint32_t count;
  PAPoint pts[2];
};

//! Intersects infinite lines through `p0 -> p1` and `q0 -> q1`.
PA_HIDDEN LineLineParams line_line_params(const PAPoint& p0, const PAPoint& p1, const PAPoint& q0, const PAPoint& q1, double eps) noexcept;

//! Intersects the infinite line through `p0 -> p1` with a circle, a tangent line yields a single parameter.
PA_HIDDEN LineCircleParams line_circle_params(const PAPoint& p0, const PAPoint& p1, const PAPoint& center, double radius, double eps) noexcept;

//! Intersects two circles, coincident and concentric circles yield no points.
PA_HIDDEN CircleCirclePoints circle_circle_points(const PAPoint& c1, double r1, const PAPoint& c2, double r2, double eps) noexcept;

//! \}

//! \name Segment / Segment
//! \{

//! Intersects line segments `p0 -> p1` and `q0 -> q1`.
PA_HIDDEN SegIntersect line_line_intersect(const PAPoint& p0, const PAPoint& p1, const PAPoint& q0, const PAPoint& q1, double eps) noexcept;

//! Intersects line segment `p0 -> p1` with an arc segment `arc`.
PA_HIDDEN SegIntersect line_arc_intersect(const PAPoint& p0, const PAPoint& p1, const Segment& arc, double eps) noexcept;

//! Intersects arc segments `a` and `b`.
PA_HIDDEN SegIntersect arc_arc_intersect(const Segment& a, const Segment& b, double eps) noexcept;

//! Intersects the segment `v1 -> v2` with the segment `u1 -> u2`, lines and arcs in any combination.
PA_HIDDEN SegIntersect seg_intersect(const PAVertex& v1, const PAVertex& v2, const PAVertex& u1, const PAVertex& u2, double eps) noexcept;

//! \}

} // {pa::Geometry}

//! \}
//! \endcond

#endif // POLYARC_GEOMETRY_INTERSECT_P_H_INCLUDED
