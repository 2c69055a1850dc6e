// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_GEOMETRY_SEGMENT_P_H_INCLUDED
#define POLYARC_GEOMETRY_SEGMENT_P_H_INCLUDED

#include <polyarc/geometry/commons_p.h>

//! \cond INTERNAL
//! \addtogroup polyarc_geometry
//! \{

namespace pa::Geometry {

//! \name Segment Model
//! \{

//! Type of a segment between two consecutive vertices.
enum class SegmentType : uint32_t {
  kLine = 0,
  kArc = 1
};

//! Segment derived from two consecutive vertices, never stored in a polyline.
struct Segment {
  SegmentType type;
  PAPoint start;
  PAPoint end;
  //! Arc center, only valid if `type` is `SegmentType::kArc`.
  PAPoint center;
  //! Arc radius, only valid if `type` is `SegmentType::kArc`.
  double radius;
  //! Signed included angle of the arc (positive is counter-clockwise), zero for lines.
  double sweep;

  PA_INLINE_NODEBUG bool is_line() const noexcept { return type == SegmentType::kLine; }
  PA_INLINE_NODEBUG bool is_arc() const noexcept { return type == SegmentType::kArc; }
  PA_INLINE_NODEBUG bool is_ccw() const noexcept { return sweep > 0.0; }

  //! Angle of `start` relative to `center`.
  PA_INLINE double start_angle() const noexcept { return angle(center, start); }
};

//! Result of splitting a segment at a point.
struct SplitResult {
  //! Start vertex with its bulge updated to describe the segment up to the split point.
  PAVertex updated_start;
  //! Vertex at the split point, its bulge describes the remaining segment.
  PAVertex split_vertex;
};

//! Arc radius and center derived from two vertices and a bulge.
struct ArcGeometry {
  double radius;
  PAPoint center;
};

//! Computes radius and center of the arc that goes from `v1` to `v2` with `v1.bulge`.
//!
//! The chord must not be zero and the bulge must not be zero.
static PA_INLINE ArcGeometry arc_radius_and_center(const PAVertex& v1, const PAVertex& v2) noexcept {
  double b = pa_abs(v1.bulge);
  PAPoint chord = v2.pos() - v1.pos();
  double chord_len = magnitude(chord);

  double radius = chord_len * (b * b + 1.0) / (4.0 * b);
  double sagitta = b * chord_len * 0.5;
  double m = radius - sagitta;

  PAPoint offset = normal(chord) * (m / chord_len);
  if (v1.bulge < 0.0)
    offset = -offset;

  return ArcGeometry{radius, v1.pos() + chord * 0.5 + offset};
}

//! Creates a segment from two consecutive vertices.
static PA_INLINE Segment make_segment(const PAVertex& v1, const PAVertex& v2) noexcept {
  if (v1.bulge == 0.0)
    return Segment{SegmentType::kLine, v1.pos(), v2.pos(), PAPoint(0.0, 0.0), 0.0, 0.0};

  ArcGeometry arc = arc_radius_and_center(v1, v2);
  return Segment{SegmentType::kArc, v1.pos(), v2.pos(), arc.center, arc.radius, angle_from_bulge(v1.bulge)};
}

//! Tests whether an arc between `v1` and `v2` has no radius (its end points coincide).
static PA_INLINE bool is_degenerate_arc(const PAVertex& v1, const PAVertex& v2, double eps) noexcept {
  return v1.bulge != 0.0 && fuzzy_equal(v1.pos(), v2.pos(), eps);
}

//! \}

//! \name Arc Sweep Queries
//! \{

//! Tests whether the direction `a` (radians) lies within the arc sweep that starts at `start_angle`.
//!
//! `sweep` is signed, `angle_eps` is the angular tolerance applied on both ends.
static PA_INLINE bool angle_within_sweep(double start_angle, double sweep, double a, double angle_eps) noexcept {
  double s = sweep_angle(start_angle, a, sweep > 0.0);
  double total = pa_abs(sweep);
  return s <= total + angle_eps || s >= Math::kPI_MUL_2 - angle_eps;
}

//! Tests whether `pt` (assumed on the circle of `seg`) lies within the arc sweep of `seg`.
static PA_INLINE bool point_within_arc_sweep(const Segment& seg, const PAPoint& pt, double eps) noexcept {
  double angle_eps = eps / pa_max(seg.radius, eps);
  return angle_within_sweep(seg.start_angle(), seg.sweep, angle(seg.center, pt), angle_eps);
}

//! \}

//! \name Segment Queries
//! \{

//! Returns the length of the segment between `v1` and `v2`.
static PA_INLINE double seg_length(const PAVertex& v1, const PAVertex& v2) noexcept {
  if (v1.bulge == 0.0 || v1.pos() == v2.pos())
    return length(v1.pos(), v2.pos());

  ArcGeometry arc = arc_radius_and_center(v1, v2);
  return arc.radius * pa_abs(angle_from_bulge(v1.bulge));
}

//! Returns the point at parameter `t` in [0, 1] on the segment (angular parameter for arcs).
static PA_INLINE PAPoint seg_point_at(const PAVertex& v1, const PAVertex& v2, double t) noexcept {
  if (v1.bulge == 0.0 || v1.pos() == v2.pos())
    return lerp(v1.pos(), v2.pos(), t);

  ArcGeometry arc = arc_radius_and_center(v1, v2);
  double a = angle(arc.center, v1.pos()) + angle_from_bulge(v1.bulge) * t;
  return point_on_circle(arc.radius, arc.center, a);
}

//! Returns the midpoint of the segment, following the arc for arc segments.
static PA_INLINE PAPoint seg_midpoint(const PAVertex& v1, const PAVertex& v2) noexcept {
  return seg_point_at(v1, v2, 0.5);
}

//! Returns the direction of the segment at `pt` (not normalized).
static PA_INLINE PAPoint seg_tangent(const PAVertex& v1, const PAVertex& v2, const PAPoint& pt) noexcept {
  if (v1.bulge == 0.0 || v1.pos() == v2.pos())
    return v2.pos() - v1.pos();

  ArcGeometry arc = arc_radius_and_center(v1, v2);
  PAPoint r = pt - arc.center;
  return v1.bulge > 0.0 ? normal(r) : -normal(r);
}

//! Returns the tight bounding box of the segment, arcs include every axis crossing within their sweep.
PA_HIDDEN PABox seg_bounding_box(const PAVertex& v1, const PAVertex& v2) noexcept;

//! Returns the point on the segment closest to `pt`.
PA_HIDDEN PAPoint seg_closest_point(const PAVertex& v1, const PAVertex& v2, const PAPoint& pt, double eps) noexcept;

//! Splits the segment at `pt`, which must lie on the segment.
PA_HIDDEN SplitResult seg_split_at_point(const PAVertex& v1, const PAVertex& v2, const PAPoint& pt, double eps) noexcept;

//! Returns the signed area between the arc and its chord (zero for lines).
PA_HIDDEN double seg_arc_chord_area(const PAVertex& v1, const PAVertex& v2) noexcept;

//! \}

} // {pa::Geometry}

//! \}
//! \endcond

#endif // POLYARC_GEOMETRY_SEGMENT_P_H_INCLUDED
