// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_GEOMETRY_POLYLINEUTILS_P_H_INCLUDED
#define POLYARC_GEOMETRY_POLYLINEUTILS_P_H_INCLUDED

#include <polyarc/geometry/polylineview_p.h>

//! \cond INTERNAL
//! \addtogroup polyarc_geometry
//! \{

namespace pa::Geometry {

//! \name Polyline Queries
//! \{

//! Returns the signed area of a closed view, positive if counter-clockwise, zero if open.
template<typename View>
static double area(const View& view) noexcept {
  if (!view.is_closed() || view.size() < 2u)
    return 0.0;

  double double_area = 0.0;
  double arc_area = 0.0;

  for (PASegmentVertices seg : view.segments()) {
    double_area += cross(seg.v1.pos(), seg.v2.pos());
    arc_area += seg_arc_chord_area(seg.v1, seg.v2);
  }

  return double_area * 0.5 + arc_area;
}

template<typename View>
static double path_length(const View& view) noexcept {
  double len = 0.0;
  for (PASegmentVertices seg : view.segments())
    len += seg_length(seg.v1, seg.v2);
  return len;
}

//! Returns the tight bounding box of all segments, or a zero box if the view is empty.
template<typename View>
static PABox bounding_box(const View& view) noexcept {
  if (view.size() == 0)
    return PABox(0.0, 0.0, 0.0, 0.0);

  PAPoint p = view.at(0).pos();
  PABox box(p.x, p.y, p.x, p.y);

  for (PASegmentVertices seg : view.segments())
    bound(box, seg_bounding_box(seg.v1, seg.v2));
  return box;
}

template<typename View>
static PAOrientation orientation(const View& view) noexcept {
  if (!view.is_closed())
    return PA_ORIENTATION_OPEN;
  return area(view) < 0.0 ? PA_ORIENTATION_CLOCKWISE : PA_ORIENTATION_COUNTER_CLOCKWISE;
}

namespace Internal {

static PA_INLINE int line_winding(const PAVertex& v1, const PAVertex& v2, const PAPoint& pt) noexcept {
  if (v1.y <= pt.y) {
    // Upward crossing with the point on the left.
    if (v2.y > pt.y && is_left(v1.pos(), v2.pos(), pt))
      return 1;
  }
  else if (v2.y <= pt.y && !is_left(v1.pos(), v2.pos(), pt)) {
    // Downward crossing with the point on the right.
    return -1;
  }
  return 0;
}

static PA_INLINE int arc_winding(const PAVertex& v1, const PAVertex& v2, const PAPoint& pt) noexcept {
  bool ccw = v1.bulge > 0.0;
  bool pt_is_left = ccw ? is_left(v1.pos(), v2.pos(), pt) : is_left_or_equal(v1.pos(), v2.pos(), pt);

  auto inside_circle = [&]() noexcept -> bool {
    ArcGeometry arc = arc_radius_and_center(v1, v2);
    return length_squared(arc.center, pt) < arc.radius * arc.radius;
  };

  if (v1.y <= pt.y) {
    if (v2.y > pt.y) {
      // Upward crossing of the chord.
      if (ccw)
        return pt_is_left || inside_circle() ? 1 : 0;
      else
        return pt_is_left && !inside_circle() ? 1 : 0;
    }

    // Chord is below the point, the point may still be inside of the arc sector.
    if (ccw && !pt_is_left && v2.x < pt.x && pt.x < v1.x && inside_circle())
      return 1;
    if (!ccw && pt_is_left && v1.x < pt.x && pt.x < v2.x && inside_circle())
      return -1;
    return 0;
  }

  if (v2.y <= pt.y) {
    // Downward crossing of the chord.
    if (ccw)
      return !pt_is_left && !inside_circle() ? -1 : 0;
    else
      return !pt_is_left || inside_circle() ? -1 : 0;
  }

  // Chord is above the point.
  if (ccw && !pt_is_left && v1.x < pt.x && pt.x < v2.x && inside_circle())
    return 1;
  if (!ccw && pt_is_left && v2.x < pt.x && pt.x < v1.x && inside_circle())
    return -1;
  return 0;
}

} // {Internal}

//! Returns the winding number of `pt`, always zero for open views.
//!
//! The result is positive for points inside of a counter-clockwise view and negative for points inside of a
//! clockwise view. Points exactly on the path may be counted either way.
template<typename View>
static int winding_number(const View& view, const PAPoint& pt) noexcept {
  if (!view.is_closed() || view.size() < 2u)
    return 0;

  int winding = 0;
  for (PASegmentVertices seg : view.segments()) {
    if (seg.v1.bulge == 0.0)
      winding += Internal::line_winding(seg.v1, seg.v2, pt);
    else
      winding += Internal::arc_winding(seg.v1, seg.v2, pt);
  }
  return winding;
}

//! Finds the point of a non-empty view closest to `pt`, the first segment wins ties.
template<typename View>
static PAClosestPoint closest_point(const View& view, const PAPoint& pt, double eps) noexcept {
  PA_ASSERT(view.size() != 0);

  PAPoint p0 = view.at(0).pos();
  PAClosestPoint result{0u, p0, length(p0, pt)};

  size_t index = 0;
  for (PASegmentVertices seg : view.segments()) {
    PAPoint cp = seg_closest_point(seg.v1, seg.v2, pt, eps);
    double d = length(cp, pt);
    if (d < result.distance) {
      result.segment_index = index;
      result.point = cp;
      result.distance = d;
    }
    index++;
  }

  return result;
}

//! \}

//! \name Polyline Modification
//! \{

//! Reverses the direction of a read-write view in place.
//!
//! Bulges are shifted by one vertex and negated so every arc keeps its shape. The last vertex takes the negated
//! bulge of the first one, so inverting twice restores the exact original data, also for open views.
template<typename View>
static void invert_direction(View& view) noexcept {
  size_t n = view.size();
  if (n < 2u)
    return;

  for (size_t i = 0, j = n - 1u; i < j; i++, j--) {
    PAVertex a = view.at(i);
    PAVertex b = view.at(j);
    view.set_at(i, b);
    view.set_at(j, a);
  }

  double first_bulge = view.at(0).bulge;
  for (size_t i = 1; i < n; i++)
    view.set_at(i - 1u, view.at(i - 1u).with_bulge(-view.at(i).bulge));
  view.set_at(n - 1u, view.at(n - 1u).with_bulge(-first_bulge));
}

template<typename View>
static void scale(View& view, double factor) noexcept {
  for (size_t i = 0; i < view.size(); i++) {
    const PAVertex& v = view.at(i);
    view.set_at(i, PAVertex(v.x * factor, v.y * factor, v.bulge));
  }
}

template<typename View>
static void translate(View& view, double dx, double dy) noexcept {
  for (size_t i = 0; i < view.size(); i++) {
    const PAVertex& v = view.at(i);
    view.set_at(i, PAVertex(v.x + dx, v.y + dy, v.bulge));
  }
}

//! Appends vertices of `view` to the create view `out`, a vertex at the position of the last vertex of `out` only
//! replaces its bulge.
template<typename Out, typename View>
static void extend_remove_repeat(Out& out, const View& view, double eps) {
  size_t n = view.size();
  for (size_t i = 0; i < n; i++) {
    PAVertex v = view.at(i);
    if (out.size() != 0 && fuzzy_equal(out.last().pos(), v.pos(), eps)) {
      out.set_at(out.size() - 1u, out.last().with_bulge(v.bulge));
      continue;
    }
    out.add_vertex(v);
  }
}

//! Stores `view` without consecutive vertices at the same position into the create view `out`.
template<typename Out, typename View>
static void remove_repeat_pos(Out& out, const View& view, double eps) {
  out.clear();
  out.set_closed(view.is_closed());
  out.reserve(view.size());

  extend_remove_repeat(out, view, eps);

  if (out.is_closed() && out.size() > 1u && fuzzy_equal(out.last().pos(), out.at(0).pos(), eps))
    out.remove_last();
}

namespace Internal {

//! Tests whether segments `v1 -> v2` and `v2 -> v3` can be replaced by a single segment and computes its bulge.
static bool merge_segments(double* bulge_out, const PAVertex& v1, const PAVertex& v2, const PAVertex& v3, double eps) noexcept {
  if (v1.bulge == 0.0 && v2.bulge == 0.0) {
    PAPoint chord = v3.pos() - v1.pos();
    double chord_len = magnitude(chord);
    if (chord_len <= eps)
      return false;

    // Collinear and going in the same direction.
    double dist = pa_abs(cross(chord, v2.pos() - v1.pos())) / chord_len;
    if (dist > eps || dot(v2.pos() - v1.pos(), v3.pos() - v2.pos()) <= 0.0)
      return false;

    *bulge_out = 0.0;
    return true;
  }

  if (v1.bulge == 0.0 || v2.bulge == 0.0 || (v1.bulge > 0.0) != (v2.bulge > 0.0))
    return false;

  ArcGeometry a1 = arc_radius_and_center(v1, v2);
  ArcGeometry a2 = arc_radius_and_center(v2, v3);
  if (pa_abs(a1.radius - a2.radius) > eps || !fuzzy_equal(a1.center, a2.center, eps))
    return false;

  double total = angle_from_bulge(v1.bulge) + angle_from_bulge(v2.bulge);
  if (pa_abs(total) > Math::kPI + Math::kANGLE_EPSILON)
    return false;

  *bulge_out = bulge_from_angle(total);
  return true;
}

} // {Internal}

//! Stores `view` into the create view `out` with repeated positions removed, collinear same direction lines and
//! co-circular same direction arcs merged (merged arcs never sweep more than a half circle).
template<typename Out, typename View>
static void remove_redundant(Out& out, const View& view, double eps) {
  Out tmp;
  remove_repeat_pos(tmp, view, eps);

  out.clear();
  out.set_closed(tmp.is_closed());
  out.reserve(tmp.size());

  size_t n = tmp.size();
  if (n < 3u) {
    extend_remove_repeat(out, tmp, eps);
    return;
  }

  double bulge;
  for (size_t i = 0; i < n; i++) {
    const PAVertex& v = tmp.at(i);
    size_t count = out.size();
    if (count >= 2u && Internal::merge_segments(&bulge, out.at(count - 2u), out.at(count - 1u), v, eps)) {
      out.remove_last();
      out.set_at(count - 2u, out.at(count - 2u).with_bulge(bulge));
    }
    out.add_vertex(v);
  }

  if (!out.is_closed())
    return;

  // Closing segment, merge at the last vertex first, then at the first vertex.
  size_t count = out.size();
  if (count > 2u && Internal::merge_segments(&bulge, out.at(count - 2u), out.at(count - 1u), out.at(0), eps)) {
    out.remove_last();
    out.set_at(count - 2u, out.at(count - 2u).with_bulge(bulge));
    count--;
  }

  if (count > 2u && Internal::merge_segments(&bulge, out.at(count - 1u), out.at(0), out.at(1), eps)) {
    out.set_at(count - 1u, out.at(count - 1u).with_bulge(bulge));

    // Drop the first vertex by shifting the rest.
    for (size_t i = 1; i < count; i++)
      out.set_at(i - 1u, out.at(i));
    out.remove_last();
  }
}

//! Stores the closed `view` restarted at `pt` (on segment `index`) into the create view `out`.
template<typename Out, typename View>
static void rotate_start(Out& out, const View& view, size_t index, const PAPoint& pt, double eps) {
  size_t n = view.size();
  PA_ASSERT(view.is_closed() && n >= 2u && index < n);

  out.clear();
  out.set_closed(true);
  out.reserve(n + 1u);

  size_t next = next_index(view, index);
  SplitResult split = seg_split_at_point(view.at(index), view.at(next), pt, eps);

  out.add_vertex(split.split_vertex);
  for (size_t i = next; i != index; i = next_index(view, i))
    out.add_vertex(view.at(i));
  out.add_vertex(split.updated_start);

  // The point was at an existing vertex.
  if (out.size() > 1u && fuzzy_equal(out.at(0).pos(), out.at(1).pos(), eps)) {
    for (size_t i = 1; i < out.size(); i++)
      out.set_at(i - 1u, out.at(i));
    out.remove_last();
  }

  if (out.size() > 1u && fuzzy_equal(out.last().pos(), out.at(0).pos(), eps))
    out.remove_last();
}

//! Stores `view` with every arc replaced by line segments into the create view `out`.
//!
//! End points of all lines lie on the arc and no chord deviates from it by more than `error`.
template<typename Out, typename View>
static void arcs_to_approx_lines(Out& out, const View& view, double error) {
  out.clear();
  out.set_closed(view.is_closed());

  size_t n = view.size();
  if (n == 0)
    return;

  double abs_error = pa_abs(error);

  for (PASegmentVertices seg : view.segments()) {
    const PAVertex& v1 = seg.v1;
    const PAVertex& v2 = seg.v2;

    if (v1.bulge == 0.0 || v1.pos() == v2.pos()) {
      out.add_vertex(v1.with_bulge(0.0));
      continue;
    }

    ArcGeometry arc = arc_radius_and_center(v1, v2);
    if (arc.radius <= abs_error) {
      out.add_vertex(v1.with_bulge(0.0));
      continue;
    }

    double sweep = angle_from_bulge(v1.bulge);
    double sub_angle = 2.0 * Math::acos(1.0 - abs_error / arc.radius);
    size_t count = size_t(Math::ceil(pa_abs(sweep) / sub_angle));
    double step = sweep / double(count);
    double a0 = angle(arc.center, v1.pos());

    out.add_vertex(v1.with_bulge(0.0));
    for (size_t i = 1; i < count; i++)
      out.add_vertex(PAVertex(point_on_circle(arc.radius, arc.center, a0 + step * double(i)), 0.0));
  }

  if (!view.is_closed())
    out.add_vertex(view.at(n - 1u).with_bulge(0.0));
}

//! \}

} // {pa::Geometry}

//! \}
//! \endcond

#endif // POLYARC_GEOMETRY_POLYLINEUTILS_P_H_INCLUDED
