// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_GEOMETRY_COMMONS_P_H_INCLUDED
#define POLYARC_GEOMETRY_COMMONS_P_H_INCLUDED

#include <polyarc/core/geometry.h>
#include <polyarc/support/math_p.h>

//! \cond INTERNAL
//! \addtogroup polyarc_geometry
//! \{

namespace pa::Geometry {

using Math::lerp;

//! \name Vector Operations
//! \{

static PA_INLINE double dot(const PAPoint& a, const PAPoint& b) noexcept { return a.x * b.x + a.y * b.y; }
static PA_INLINE double cross(const PAPoint& a, const PAPoint& b) noexcept { return a.x * b.y - a.y * b.x; }

static PA_INLINE double magnitude_squared(const PAPoint& v) noexcept { return v.x * v.x + v.y * v.y; }
static PA_INLINE double magnitude(const PAPoint& v) noexcept { return Math::sqrt(magnitude_squared(v)); }

static PA_INLINE double length_squared(const PAPoint& a, const PAPoint& b) noexcept { return magnitude_squared(b - a); }
static PA_INLINE double length(const PAPoint& a, const PAPoint& b) noexcept { return Math::sqrt(length_squared(a, b)); }

//! Returns `v` rotated by 90 degrees counter-clockwise.
static PA_INLINE PAPoint normal(const PAPoint& v) noexcept { return PAPoint(-v.y, v.x); }
static PA_INLINE PAPoint unit_vector(const PAPoint& v) noexcept { return v / magnitude(v); }

//! Returns the unit vector perpendicular to `v` pointing to its left side.
static PA_INLINE PAPoint unit_normal(const PAPoint& v) noexcept { return unit_vector(normal(v)); }

static PA_INLINE PAPoint midpoint(const PAPoint& a, const PAPoint& b) noexcept { return lerp(a, b); }

//! Tests whether `p` lies on the left side of the directed line `p0 -> p1`.
static PA_INLINE bool is_left(const PAPoint& p0, const PAPoint& p1, const PAPoint& p) noexcept {
  return cross(p1 - p0, p - p0) > 0.0;
}

//! Like `is_left()`, but also returns true when `p` is collinear with the line.
static PA_INLINE bool is_left_or_equal(const PAPoint& p0, const PAPoint& p1, const PAPoint& p) noexcept {
  return cross(p1 - p0, p - p0) >= 0.0;
}

static PA_INLINE bool fuzzy_equal(const PAPoint& a, const PAPoint& b, double eps) noexcept {
  return length_squared(a, b) <= eps * eps;
}

//! Returns the point on the line segment `p0 -> p1` closest to `p`.
static PA_INLINE PAPoint line_closest_point(const PAPoint& p0, const PAPoint& p1, const PAPoint& p) noexcept {
  PAPoint v = p1 - p0;
  double len_sq = magnitude_squared(v);
  if (len_sq == 0.0)
    return p0;

  double t = dot(p - p0, v) / len_sq;
  if (t <= 0.0)
    return p0;
  if (t >= 1.0)
    return p1;
  return p0 + v * t;
}

//! \}

//! \name Angles
//! \{

//! Returns the angle of the direction `p0 -> p1` in radians.
static PA_INLINE double angle(const PAPoint& p0, const PAPoint& p1) noexcept {
  return Math::atan2(p1.y - p0.y, p1.x - p0.x);
}

//! Normalizes `a` into `[0, 2*PI)` range.
static PA_INLINE double normalize_radians(double a) noexcept {
  return Math::repeat(a, Math::kPI_MUL_2);
}

//! Returns the magnitude of the sweep from `a0` to `a1` travelled in the given direction, in `[0, 2*PI)` range.
static PA_INLINE double sweep_angle(double a0, double a1, bool ccw) noexcept {
  return ccw ? normalize_radians(a1 - a0) : normalize_radians(a0 - a1);
}

//! Converts an included arc angle (sign gives the direction) to a bulge.
static PA_INLINE double bulge_from_angle(double sweep) noexcept { return Math::tan(sweep * 0.25); }

//! Converts a bulge to the included arc angle (sign gives the direction).
static PA_INLINE double angle_from_bulge(double bulge) noexcept { return 4.0 * Math::atan(bulge); }

static PA_INLINE PAPoint point_on_circle(double radius, const PAPoint& center, double a) noexcept {
  return PAPoint(center.x + radius * Math::cos(a), center.y + radius * Math::sin(a));
}

//! \}

//! \name Box Operations
//! \{

static PA_INLINE PABox empty_box() noexcept {
  return PABox(Math::inf<double>(), Math::inf<double>(), -Math::inf<double>(), -Math::inf<double>());
}

static PA_INLINE void bound(PABox& box, const PAPoint& p) noexcept {
  box.reset(pa_min(box.x0, p.x), pa_min(box.y0, p.y),
            pa_max(box.x1, p.x), pa_max(box.y1, p.y));
}

static PA_INLINE void bound(PABox& box, const PABox& other) noexcept {
  box.reset(pa_min(box.x0, other.x0), pa_min(box.y0, other.y0),
            pa_max(box.x1, other.x1), pa_max(box.y1, other.y1));
}

static PA_INLINE PABox expand(const PABox& box, double amount) noexcept {
  return PABox(box.x0 - amount, box.y0 - amount, box.x1 + amount, box.y1 + amount);
}

//! Tests whether boxes `a` and `b` overlap, touching edges count as overlap.
static PA_INLINE bool overlaps(const PABox& a, const PABox& b) noexcept {
  return PAInternal::bool_and(a.x1 >= b.x0, a.y1 >= b.y0, a.x0 <= b.x1, a.y0 <= b.y1);
}

//! \}

} // {pa::Geometry}

//! \}
//! \endcond

#endif // POLYARC_GEOMETRY_COMMONS_P_H_INCLUDED
