// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_p.h>
#include <polyarc/geometry/segment_p.h>

namespace pa::Geometry {

// pa::Geometry - Segment Bounding Box
// ===================================

PABox seg_bounding_box(const PAVertex& v1, const PAVertex& v2) noexcept {
  PABox box(pa_min(v1.x, v2.x), pa_min(v1.y, v2.y), pa_max(v1.x, v2.x), pa_max(v1.y, v2.y));
  if (v1.bulge == 0.0 || v1.pos() == v2.pos())
    return box;

  Segment seg = make_segment(v1, v2);
  double a0 = seg.start_angle();

  // Axis crossings in order: +X, +Y, -X, -Y.
  static const double crossing_angles[4] = { 0.0, Math::kPI_DIV_2, Math::kPI, Math::kPI + Math::kPI_DIV_2 };
  static const PAPoint crossing_dirs[4] = { PAPoint(1.0, 0.0), PAPoint(0.0, 1.0), PAPoint(-1.0, 0.0), PAPoint(0.0, -1.0) };

  for (uint32_t i = 0; i < 4; i++) {
    if (angle_within_sweep(a0, seg.sweep, crossing_angles[i], 0.0))
      bound(box, seg.center + crossing_dirs[i] * seg.radius);
  }

  return box;
}

// pa::Geometry - Segment Closest Point
// ====================================

PAPoint seg_closest_point(const PAVertex& v1, const PAVertex& v2, const PAPoint& pt, double eps) noexcept {
  if (v1.bulge == 0.0 || fuzzy_equal(v1.pos(), v2.pos(), eps))
    return line_closest_point(v1.pos(), v2.pos(), pt);

  Segment seg = make_segment(v1, v2);

  // Every point of the arc is equally close to its center.
  if (fuzzy_equal(pt, seg.center, eps))
    return v1.pos();

  double a = angle(seg.center, pt);
  if (angle_within_sweep(seg.start_angle(), seg.sweep, a, 0.0))
    return point_on_circle(seg.radius, seg.center, a);

  double d1 = length_squared(v1.pos(), pt);
  double d2 = length_squared(v2.pos(), pt);
  return d1 <= d2 ? v1.pos() : v2.pos();
}

// pa::Geometry - Segment Split
// ============================

SplitResult seg_split_at_point(const PAVertex& v1, const PAVertex& v2, const PAPoint& pt, double eps) noexcept {
  if (v1.bulge == 0.0)
    return SplitResult{v1, PAVertex(pt, 0.0)};

  if (fuzzy_equal(v1.pos(), v2.pos(), eps) || fuzzy_equal(v1.pos(), pt, eps))
    return SplitResult{PAVertex(pt, 0.0), PAVertex(pt, v1.bulge)};

  if (fuzzy_equal(v2.pos(), pt, eps))
    return SplitResult{v1, PAVertex(v2.pos(), 0.0)};

  ArcGeometry arc = arc_radius_and_center(v1, v2);
  double total = angle_from_bulge(v1.bulge);
  double total_abs = pa_abs(total);

  double s = sweep_angle(angle(arc.center, v1.pos()), angle(arc.center, pt), v1.bulge > 0.0);

  // A point that numerically falls outside of the sweep snaps to the closer end.
  if (s > total_abs)
    s = (s - total_abs) < (Math::kPI_MUL_2 - s) ? total_abs : 0.0;

  double theta1 = Math::copy_sign(s, total);
  double theta2 = total - theta1;

  return SplitResult{PAVertex(v1.x, v1.y, bulge_from_angle(theta1)), PAVertex(pt, bulge_from_angle(theta2))};
}

// pa::Geometry - Segment Area
// ===========================

double seg_arc_chord_area(const PAVertex& v1, const PAVertex& v2) noexcept {
  if (v1.bulge == 0.0 || v1.pos() == v2.pos())
    return 0.0;

  ArcGeometry arc = arc_radius_and_center(v1, v2);
  double theta = angle_from_bulge(v1.bulge);
  return 0.5 * arc.radius * arc.radius * (theta - Math::sin(theta));
}

} // {pa::Geometry}
