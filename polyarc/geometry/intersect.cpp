// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_p.h>
#include <polyarc/geometry/intersect_p.h>
#include <polyarc/support/algorithm_p.h>

namespace pa::Geometry {

// pa::Geometry - Intersection Utilities
// =====================================

static PA_INLINE SegIntersect make_point_intersect(IntersectType type, const PAPoint& pt) noexcept {
  return SegIntersect{type, 1u, pt, pt};
}

static PA_INLINE SegIntersect make_points_intersect(const PAPoint* pts, uint32_t count) noexcept {
  if (count == 0)
    return make_no_intersect();
  return SegIntersect{IntersectType::kCrossing, count, pts[0], pts[count - 1u]};
}

//! Replaces `pt` by one of the segment end points if it's within `eps`, so splits happen exactly at vertices.
static PA_INLINE PAPoint snap_to_end_points(const PAPoint& pt, const PAPoint& a0, const PAPoint& a1, const PAPoint& b0, const PAPoint& b1, double eps) noexcept {
  if (fuzzy_equal(pt, a0, eps)) return a0;
  if (fuzzy_equal(pt, a1, eps)) return a1;
  if (fuzzy_equal(pt, b0, eps)) return b0;
  if (fuzzy_equal(pt, b1, eps)) return b1;
  return pt;
}

static PA_INLINE bool on_circle(const Segment& arc, const PAPoint& pt, double eps) noexcept {
  return pa_abs(length(arc.center, pt) - arc.radius) <= eps;
}

// pa::Geometry - Line & Circle Primitives
// =======================================

LineLineParams line_line_params(const PAPoint& p0, const PAPoint& p1, const PAPoint& q0, const PAPoint& q1, double eps) noexcept {
  PAPoint d1 = p1 - p0;
  PAPoint d2 = q1 - q0;
  PAPoint w = q0 - p0;

  double len1 = magnitude(d1);
  double len2 = magnitude(d2);
  double denom = cross(d1, d2);

  if (pa_abs(denom) <= 1e-14 * len1 * len2) {
    double dist = len1 > 0.0 ? pa_abs(cross(d1, w)) / len1 : length(p0, q0);
    return LineLineParams{dist <= eps ? LineRelation::kCollinear : LineRelation::kParallel, 0.0, 0.0};
  }

  return LineLineParams{LineRelation::kIntersect, cross(w, d2) / denom, cross(w, d1) / denom};
}

LineCircleParams line_circle_params(const PAPoint& p0, const PAPoint& p1, const PAPoint& center, double radius, double eps) noexcept {
  LineCircleParams result{0u, {0.0, 0.0}};

  PAPoint d = p1 - p0;
  double len_sq = magnitude_squared(d);
  if (len_sq == 0.0)
    return result;

  double t_foot = dot(center - p0, d) / len_sq;
  double h = length(center, p0 + d * t_foot);

  if (h > radius + eps)
    return result;

  if (h >= radius - eps) {
    result.count = 1;
    result.t[0] = t_foot;
    return result;
  }

  // Distance from the foot point to both intersections, in parametric units.
  double dt = Math::sqrt(pa_max(radius * radius - h * h, 0.0) / len_sq);
  result.count = 2;
  result.t[0] = t_foot - dt;
  result.t[1] = t_foot + dt;
  return result;
}

CircleCirclePoints circle_circle_points(const PAPoint& c1, double r1, const PAPoint& c2, double r2, double eps) noexcept {
  CircleCirclePoints result{0u, {PAPoint(0.0, 0.0), PAPoint(0.0, 0.0)}};

  PAPoint cv = c2 - c1;
  double d = magnitude(cv);

  if (d <= eps || d > r1 + r2 + eps || d < pa_abs(r1 - r2) - eps)
    return result;

  PAPoint u = cv / d;
  double x = (r1 * r1 - r2 * r2 + d * d) / (2.0 * d);
  double h_sq = r1 * r1 - x * x;

  if (h_sq <= 0.0 || d >= r1 + r2 - eps || d <= pa_abs(r1 - r2) + eps) {
    result.count = 1;
    result.pts[0] = c1 + u * Math::copy_sign(r1, x);
    return result;
  }

  PAPoint base = c1 + u * x;
  PAPoint n = normal(u) * Math::sqrt(h_sq);

  result.count = 2;
  result.pts[0] = base + n;
  result.pts[1] = base - n;
  return result;
}

// pa::Geometry - Line / Line
// ==========================

SegIntersect line_line_intersect(const PAPoint& p0, const PAPoint& p1, const PAPoint& q0, const PAPoint& q1, double eps) noexcept {
  PAPoint d1 = p1 - p0;
  PAPoint d2 = q1 - q0;

  double len1 = magnitude(d1);
  double len2 = magnitude(d2);

  // Degenerate segments are handled as points.
  if (len1 <= eps || len2 <= eps) {
    if (len1 <= eps && len2 <= eps)
      return fuzzy_equal(p0, q0, eps) ? make_point_intersect(IntersectType::kCrossing, p0) : make_no_intersect();

    if (len1 <= eps)
      return fuzzy_equal(line_closest_point(q0, q1, p0), p0, eps) ? make_point_intersect(IntersectType::kCrossing, p0) : make_no_intersect();
    else
      return fuzzy_equal(line_closest_point(p0, p1, q0), q0, eps) ? make_point_intersect(IntersectType::kCrossing, q0) : make_no_intersect();
  }

  double t_eps = eps / len1;

  double dist_q0 = cross(d1, q0 - p0) / len1;
  double dist_q1 = cross(d1, q1 - p0) / len1;

  if (pa_abs(dist_q0) <= eps && pa_abs(dist_q1) <= eps) {
    // Collinear, intersect the parametric ranges along `d1`.
    double len1_sq = len1 * len1;
    double t0 = dot(q0 - p0, d1) / len1_sq;
    double t1 = dot(q1 - p0, d1) / len1_sq;

    if (t0 > t1)
      std::swap(t0, t1);

    double start = pa_max(t0, 0.0);
    double end = pa_min(t1, 1.0);

    if (end < start - t_eps)
      return make_no_intersect();

    PAPoint a = snap_to_end_points(p0 + d1 * start, p0, p1, q0, q1, eps);
    if ((end - start) * len1 <= eps)
      return make_point_intersect(IntersectType::kTangent, a);

    PAPoint b = snap_to_end_points(p0 + d1 * end, p0, p1, q0, q1, eps);
    return SegIntersect{IntersectType::kOverlap, 2u, a, b};
  }

  double denom = cross(d1, d2);
  if (pa_abs(denom) <= 1e-14 * len1 * len2)
    return make_no_intersect();

  PAPoint w = q0 - p0;
  double t = cross(w, d2) / denom;
  double u = cross(w, d1) / denom;
  double u_eps = eps / len2;

  if (t < -t_eps || t > 1.0 + t_eps || u < -u_eps || u > 1.0 + u_eps)
    return make_no_intersect();

  return make_point_intersect(IntersectType::kCrossing, snap_to_end_points(p0 + d1 * t, p0, p1, q0, q1, eps));
}

// pa::Geometry - Line / Arc
// =========================

SegIntersect line_arc_intersect(const PAPoint& p0, const PAPoint& p1, const Segment& arc, double eps) noexcept {
  PAPoint d = p1 - p0;
  double len = magnitude(d);

  if (len <= eps) {
    if (on_circle(arc, p0, eps) && point_within_arc_sweep(arc, p0, eps))
      return make_point_intersect(IntersectType::kCrossing, p0);
    return make_no_intersect();
  }

  double len_sq = len * len;
  double t_eps = eps / len;

  double t_foot = dot(arc.center - p0, d) / len_sq;
  PAPoint foot = p0 + d * t_foot;
  double h = length(arc.center, foot);

  if (h > arc.radius + eps)
    return make_no_intersect();

  if (h >= arc.radius - eps) {
    // The line touches the circle at the foot of the perpendicular from its center.
    if (t_foot < -t_eps || t_foot > 1.0 + t_eps || !point_within_arc_sweep(arc, foot, eps))
      return make_no_intersect();
    return make_point_intersect(IntersectType::kTangent, snap_to_end_points(foot, p0, p1, arc.start, arc.end, eps));
  }

  PAPoint f = p0 - arc.center;
  double roots[2];
  size_t root_count = Math::quad_roots(roots, len_sq, 2.0 * dot(f, d), magnitude_squared(f) - arc.radius * arc.radius, -t_eps, 1.0 + t_eps);

  PAPoint pts[2];
  uint32_t count = 0;

  // Roots are sorted, so are the points along the line.
  for (size_t i = 0; i < root_count; i++) {
    PAPoint pt = p0 + d * roots[i];
    if (!point_within_arc_sweep(arc, pt, eps))
      continue;

    pt = snap_to_end_points(pt, p0, p1, arc.start, arc.end, eps);
    if (count == 0 || !fuzzy_equal(pts[0], pt, eps))
      pts[count++] = pt;
  }

  return make_points_intersect(pts, count);
}

// pa::Geometry - Arc / Arc
// ========================

static SegIntersect co_circular_intersect(const Segment& a, const Segment& b, double eps) noexcept {
  PAPoint pts[4];
  uint32_t count = 0;

  auto add_unique = [&](const PAPoint& pt) noexcept {
    for (uint32_t i = 0; i < count; i++)
      if (fuzzy_equal(pts[i], pt, eps))
        return;
    pts[count++] = pt;
  };

  if (point_within_arc_sweep(b, a.start, eps)) add_unique(a.start);
  if (point_within_arc_sweep(b, a.end, eps)) add_unique(a.end);
  if (point_within_arc_sweep(a, b.start, eps)) add_unique(b.start);
  if (point_within_arc_sweep(a, b.end, eps)) add_unique(b.end);

  if (count == 0)
    return make_no_intersect();

  if (count == 1)
    return make_point_intersect(IntersectType::kTangent, pts[0]);

  insertion_sort(pts, count, [&](const PAPoint& x, const PAPoint& y) noexcept -> int {
    double sx = seg_parameter(a, x);
    double sy = seg_parameter(a, y);
    return sx < sy ? -1 : sx > sy ? 1 : 0;
  });

  // The first range between consecutive points that lies on both arcs is the overlap.
  double a0 = a.start_angle();
  for (uint32_t i = 0; i + 1u < count; i++) {
    double mid = (seg_parameter(a, pts[i]) + seg_parameter(a, pts[i + 1u])) * 0.5;
    PAPoint mid_pt = point_on_circle(a.radius, a.center, a0 + Math::copy_sign(mid, a.sweep));
    if (point_within_arc_sweep(b, mid_pt, eps))
      return SegIntersect{IntersectType::kOverlap, 2u, pts[i], pts[i + 1u]};
  }

  // Arcs only meet at their end points.
  return SegIntersect{IntersectType::kCrossing, 2u, pts[0], pts[1]};
}

SegIntersect arc_arc_intersect(const Segment& a, const Segment& b, double eps) noexcept {
  if (fuzzy_equal(a.center, b.center, eps) && pa_abs(a.radius - b.radius) <= eps)
    return co_circular_intersect(a, b, eps);

  PAPoint cv = b.center - a.center;
  double d = magnitude(cv);

  double r_sum = a.radius + b.radius;
  double r_diff = pa_abs(a.radius - b.radius);

  if (d <= eps || d > r_sum + eps || d < r_diff - eps)
    return make_no_intersect();

  PAPoint u = cv / d;
  double x = (a.radius * a.radius - b.radius * b.radius + d * d) / (2.0 * d);

  if (d >= r_sum - eps || d <= r_diff + eps) {
    // Circles touch at a single point on the line through both centers.
    PAPoint pt = a.center + u * Math::copy_sign(a.radius, x);
    if (!point_within_arc_sweep(a, pt, eps) || !point_within_arc_sweep(b, pt, eps))
      return make_no_intersect();
    return make_point_intersect(IntersectType::kTangent, snap_to_end_points(pt, a.start, a.end, b.start, b.end, eps));
  }

  double h = Math::sqrt(pa_max(a.radius * a.radius - x * x, 0.0));
  PAPoint base = a.center + u * x;
  PAPoint n = normal(u) * h;

  PAPoint candidates[2] = { base + n, base - n };
  PAPoint pts[2];
  uint32_t count = 0;

  for (uint32_t i = 0; i < 2; i++) {
    const PAPoint& pt = candidates[i];
    if (!point_within_arc_sweep(a, pt, eps) || !point_within_arc_sweep(b, pt, eps))
      continue;

    PAPoint snapped = snap_to_end_points(pt, a.start, a.end, b.start, b.end, eps);
    if (count == 0 || !fuzzy_equal(pts[0], snapped, eps))
      pts[count++] = snapped;
  }

  if (count == 2 && seg_parameter(a, pts[0]) > seg_parameter(a, pts[1]))
    std::swap(pts[0], pts[1]);

  return make_points_intersect(pts, count);
}

// pa::Geometry - Segment / Segment
// ================================

SegIntersect seg_intersect(const PAVertex& v1, const PAVertex& v2, const PAVertex& u1, const PAVertex& u2, double eps) noexcept {
  bool v_is_line = v1.bulge == 0.0 || fuzzy_equal(v1.pos(), v2.pos(), eps);
  bool u_is_line = u1.bulge == 0.0 || fuzzy_equal(u1.pos(), u2.pos(), eps);

  if (v_is_line && u_is_line)
    return line_line_intersect(v1.pos(), v2.pos(), u1.pos(), u2.pos(), eps);

  if (v_is_line)
    return line_arc_intersect(v1.pos(), v2.pos(), make_segment(u1, u2), eps);

  Segment v_seg = make_segment(v1, v2);
  if (u_is_line) {
    SegIntersect result = line_arc_intersect(u1.pos(), u2.pos(), v_seg, eps);
    if (result.count == 2u && seg_parameter(v_seg, result.p0) > seg_parameter(v_seg, result.p1))
      std::swap(result.p0, result.p1);
    return result;
  }

  return arc_arc_intersect(v_seg, make_segment(u1, u2), eps);
}

} // {pa::Geometry}
