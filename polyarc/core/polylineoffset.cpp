// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_p.h>
#include <polyarc/core/polylineoffset_p.h>
#include <polyarc/core/polylinestitch_p.h>
#include <polyarc/core/trace_p.h>
#include <polyarc/geometry/polylineintersect_p.h>
#include <polyarc/geometry/polylineutils_p.h>

namespace pa::PolylineInternal {

// pa::PolylineInternal - Offset - Trace
// =====================================

#if defined(PA_TRACE_ALL) || defined(PA_TRACE_OFFSET)
  #define Trace DebugTrace
#else
  #define Trace DummyTrace
#endif

using Geometry::PolylineRef;
using Geometry::Segment;
using Geometry::fuzzy_equal;

// pa::PolylineInternal - Offset - Utilities
// =========================================

//! Converts a distance tolerance to a parameter tolerance of the line `p0 -> p1`.
static PA_INLINE double param_eps(const PAPoint& p0, const PAPoint& p1, double eps) noexcept {
  double len = Geometry::length(p0, p1);
  return len > 0.0 ? eps / len : 0.0;
}

static PA_INLINE bool is_within_unit(double t, double t_eps) noexcept {
  return t >= -t_eps && t <= 1.0 + t_eps;
}

// pa::PolylineInternal - Offset - Raw Offset Segments
// ===================================================

void create_raw_offset_segments(std::vector<RawOffsetSeg>& out, const PolylineRef& input, double offset, double eps) {
  out.clear();
  out.reserve(input.segment_count());

  for (PASegmentVertices seg : input.segments()) {
    const PAVertex& v1 = seg.v1;
    const PAVertex& v2 = seg.v2;

    RawOffsetSeg raw;
    raw.orig_v1 = v1.pos();
    raw.orig_v2 = v2.pos();
    raw.collapsed_arc = false;

    if (v1.bulge == 0.0) {
      PAPoint offset_v = Geometry::unit_normal(v2.pos() - v1.pos()) * offset;
      raw.v1 = PAVertex(v1.pos() + offset_v, 0.0);
      raw.v2 = PAVertex(v2.pos() + offset_v, 0.0);
    }
    else {
      Geometry::ArcGeometry arc = Geometry::arc_radius_and_center(v1, v2);

      // Moving to the left shrinks a counter-clockwise arc and grows a clockwise one.
      double arc_offset = v1.bulge < 0.0 ? offset : -offset;
      double bulge = v1.bulge;

      if (arc.radius + arc_offset <= eps) {
        bulge = 0.0;
        raw.collapsed_arc = true;
      }

      raw.v1 = PAVertex(v1.pos() + Geometry::unit_vector(v1.pos() - arc.center) * arc_offset, bulge);
      raw.v2 = PAVertex(v2.pos() + Geometry::unit_vector(v2.pos() - arc.center) * arc_offset, 0.0);
    }

    out.push_back(raw);
  }
}

// pa::PolylineInternal - Offset - Joins
// =====================================

//! Appends joins of consecutive raw offset segments to a polyline.
//!
//! Each join appends vertices up to and including the start vertex of the second segment.
class RawOffsetJoiner {
public:
  PA_INLINE RawOffsetJoiner(PAPolyline& result, bool connection_arcs_ccw, double eps) noexcept
    : _result(result),
      _connection_arcs_ccw(connection_arcs_ccw),
      _eps(eps) {}

  //! Adds `v`, a vertex at the position of the last vertex only replaces its bulge.
  void add_or_replace(const PAVertex& v) {
    size_t n = _result.size();
    if (n && fuzzy_equal(_result.last().pos(), v.pos(), _eps)) {
      _result.set_at(n - 1u, _result.last().with_bulge(v.bulge));
      return;
    }
    _result.add_vertex(v);
  }

  void join(const RawOffsetSeg& s1, const RawOffsetSeg& s2) {
    bool s1_is_line = s1.v1.bulge == 0.0;
    bool s2_is_line = s2.v1.bulge == 0.0;

    if (s1_is_line && s2_is_line)
      line_line_join(s1, s2);
    else if (s1_is_line)
      line_arc_join(s1, s2);
    else if (s2_is_line)
      arc_line_join(s1, s2);
    else
      arc_arc_join(s1, s2);
  }

private:
  //! Connects both segments by an arc centered at the input vertex they share.
  void connect_using_arc(const RawOffsetSeg& s1, const RawOffsetSeg& s2) {
    PAPoint center = s1.orig_v2;
    PAPoint sp = s1.v2.pos();
    PAPoint ep = s2.v1.pos();

    double sweep = Geometry::sweep_angle(Geometry::angle(center, sp), Geometry::angle(center, ep), _connection_arcs_ccw);
    add_or_replace(PAVertex(sp, Geometry::bulge_from_angle(_connection_arcs_ccw ? sweep : -sweep)));
    add_or_replace(s2.v1);
  }

  //! Ends the arc that starts at the last vertex (the start of `s1`) at `pt`.
  void trim_last_arc(const RawOffsetSeg& s1, const PAPoint& pt) {
    if (_result.empty())
      return;

    const PAVertex& prev = _result.last();
    if (prev.bulge == 0.0 || fuzzy_equal(prev.pos(), s1.v2.pos(), _eps))
      return;

    _result.set_at(_result.size() - 1u, Geometry::seg_split_at_point(prev, s1.v2, pt, _eps).updated_start);
  }

  void line_line_join(const RawOffsetSeg& s1, const RawOffsetSeg& s2) {
    if (s1.collapsed_arc || s2.collapsed_arc) {
      connect_using_arc(s1, s2);
      return;
    }

    PAPoint v1 = s1.v1.pos();
    PAPoint v2 = s1.v2.pos();
    PAPoint u1 = s2.v1.pos();
    PAPoint u2 = s2.v2.pos();

    Geometry::LineLineParams r = Geometry::line_line_params(v1, v2, u1, u2, _eps);
    switch (r.relation) {
      case Geometry::LineRelation::kParallel:
        // The input turns back by 180 degrees, connect by a half circle.
        add_or_replace(PAVertex(v2, _connection_arcs_ccw ? 1.0 : -1.0));
        add_or_replace(s2.v1);
        break;

      case Geometry::LineRelation::kCollinear:
        add_or_replace(PAVertex(v2, 0.0));
        add_or_replace(s2.v1);
        break;

      case Geometry::LineRelation::kIntersect:
        if (is_within_unit(r.t, param_eps(v1, v2, _eps)) && is_within_unit(r.u, param_eps(u1, u2, _eps))) {
          add_or_replace(PAVertex(Math::lerp(v1, v2, r.t), 0.0));
        }
        else if (r.t > 1.0 && (r.u < 0.0 || r.u > 1.0)) {
          connect_using_arc(s1, s2);
        }
        else {
          add_or_replace(PAVertex(v2, 0.0));
          add_or_replace(s2.v1);
        }
        break;
    }
  }

  void line_arc_join(const RawOffsetSeg& s1, const RawOffsetSeg& s2) {
    if (s1.collapsed_arc || s2.collapsed_arc) {
      connect_using_arc(s1, s2);
      return;
    }

    PAPoint v1 = s1.v1.pos();
    PAPoint v2 = s1.v2.pos();
    Segment arc = Geometry::make_segment(s2.v1, s2.v2);

    Geometry::LineCircleParams r = Geometry::line_circle_params(v1, v2, arc.center, arc.radius, _eps);
    if (r.count == 0) {
      connect_using_arc(s1, s2);
      return;
    }

    double t = r.t[0];
    if (r.count == 2u && Geometry::length_squared(Math::lerp(v1, v2, r.t[1]), s1.orig_v2) < Geometry::length_squared(Math::lerp(v1, v2, t), s1.orig_v2))
      t = r.t[1];

    PAPoint pt = Math::lerp(v1, v2, t);
    bool true_line_intersect = is_within_unit(t, param_eps(v1, v2, _eps));
    bool true_arc_intersect = Geometry::point_within_arc_sweep(arc, pt, _eps);

    if (true_line_intersect && true_arc_intersect) {
      add_or_replace(Geometry::seg_split_at_point(s2.v1, s2.v2, pt, _eps).split_vertex);
    }
    else if (t > 1.0 && !true_arc_intersect) {
      connect_using_arc(s1, s2);
    }
    else {
      add_or_replace(PAVertex(v2, 0.0));
      add_or_replace(s2.v1);
    }
  }

  void arc_line_join(const RawOffsetSeg& s1, const RawOffsetSeg& s2) {
    if (s1.collapsed_arc || s2.collapsed_arc) {
      connect_using_arc(s1, s2);
      return;
    }

    Segment arc = Geometry::make_segment(s1.v1, s1.v2);
    PAPoint u1 = s2.v1.pos();
    PAPoint u2 = s2.v2.pos();

    Geometry::LineCircleParams r = Geometry::line_circle_params(u1, u2, arc.center, arc.radius, _eps);
    if (r.count == 0) {
      connect_using_arc(s1, s2);
      return;
    }

    double t = r.t[0];
    if (r.count == 2u && Geometry::length_squared(Math::lerp(u1, u2, r.t[1]), s1.orig_v2) < Geometry::length_squared(Math::lerp(u1, u2, t), s1.orig_v2))
      t = r.t[1];

    PAPoint pt = Math::lerp(u1, u2, t);
    if (is_within_unit(t, param_eps(u1, u2, _eps)) && Geometry::point_within_arc_sweep(arc, pt, _eps)) {
      trim_last_arc(s1, pt);
      add_or_replace(PAVertex(pt, 0.0));
    }
    else {
      connect_using_arc(s1, s2);
    }
  }

  void arc_arc_join(const RawOffsetSeg& s1, const RawOffsetSeg& s2) {
    if (s1.collapsed_arc || s2.collapsed_arc) {
      connect_using_arc(s1, s2);
      return;
    }

    Segment a1 = Geometry::make_segment(s1.v1, s1.v2);
    Segment a2 = Geometry::make_segment(s2.v1, s2.v2);

    auto within_both_sweeps = [&](const PAPoint& pt) noexcept -> bool {
      return Geometry::point_within_arc_sweep(a1, pt, _eps) && Geometry::point_within_arc_sweep(a2, pt, _eps);
    };

    Geometry::CircleCirclePoints r = Geometry::circle_circle_points(a1.center, a1.radius, a2.center, a2.radius, _eps);
    if (r.count == 0) {
      connect_using_arc(s1, s2);
      return;
    }

    PAPoint pt = r.pts[0];
    bool valid = within_both_sweeps(pt);

    if (r.count == 2u) {
      bool valid2 = within_both_sweeps(r.pts[1]);
      if (valid == valid2) {
        if (Geometry::length_squared(r.pts[1], s1.orig_v2) < Geometry::length_squared(pt, s1.orig_v2))
          pt = r.pts[1];
      }
      else if (valid2) {
        pt = r.pts[1];
        valid = true;
      }
    }

    if (!valid) {
      connect_using_arc(s1, s2);
      return;
    }

    trim_last_arc(s1, pt);
    add_or_replace(Geometry::seg_split_at_point(s2.v1, s2.v2, pt, _eps).split_vertex);
  }

  PAPolyline& _result;
  bool _connection_arcs_ccw;
  double _eps;
};

// pa::PolylineInternal - Offset - Raw Offset Polyline
// ===================================================

void create_raw_offset_polyline(PAPolyline& out, const PolylineRef& input, const std::vector<RawOffsetSeg>& segments, double offset, double eps) {
  out.clear();
  out.set_closed(input.is_closed());

  size_t count = segments.size();
  if (count == 0 || (count == 1u && segments[0].collapsed_arc))
    return;

  bool connection_arcs_ccw = offset < 0.0;
  RawOffsetJoiner joiner(out, connection_arcs_ccw, eps);

  out.reserve(count * 2u);
  out.add_vertex(segments[0].v1);

  if (count >= 2u)
    joiner.join(segments[0], segments[1]);
  bool first_vertex_replaced = out.size() == 1u;

  for (size_t i = 1; i + 1u < count; i++)
    joiner.join(segments[i], segments[i + 1u]);

  if (!input.is_closed()) {
    joiner.add_or_replace(segments[count - 1u].v2.with_bulge(0.0));
    return;
  }

  if (out.size() < 2u)
    return;

  // Join the last segment with the first one separately, it may move the first vertex.
  PAPolyline closing;
  closing.add_vertex(out.last());

  RawOffsetJoiner closing_joiner(closing, connection_arcs_ccw, eps);
  closing_joiner.join(segments[count - 1u], segments[0]);

  out.set_at(out.size() - 1u, closing.at(0));
  for (size_t i = 1; i < closing.size(); i++)
    out.add_vertex(closing.at(i));

  if (!first_vertex_replaced) {
    PAPoint updated_first = closing.last().pos();
    const PAVertex& first = out.at(0);

    if (first.bulge == 0.0)
      out.set_at(0, PAVertex(updated_first, 0.0));
    else
      out.set_at(0, Geometry::seg_split_at_point(first, out.at(1), updated_first, eps).split_vertex);
  }

  while (out.size() > 2u && fuzzy_equal(out.last().pos(), out.at(0).pos(), eps))
    out.remove_last();
}

// pa::PolylineInternal - Offset - Engine
// ======================================

class PolylineOffsetter {
public:
  PA_NONCOPYABLE(PolylineOffsetter)

  PA_INLINE PolylineOffsetter(const PolylineRef& input, double offset, const Geometry::Tolerance& tol, uint32_t flags) noexcept
    : _input(input),
      _offset(offset),
      _tol(tol),
      _flags(flags) {}

  void run(PAPolylineArray& out) {
    Trace trace;
    trace.info("pa::PolylineInternal::parallel_offset [Vertices=%zu Closed=%u Offset=%g]\n", _input.size(), unsigned(_input.is_closed()), _offset);
    trace.indent();

    double eps = _tol.pos_equal_eps;

    std::vector<RawOffsetSeg> segments;
    create_raw_offset_segments(segments, _input, _offset, eps);
    create_raw_offset_polyline(_raw, _input, segments, _offset, eps);

    if (_raw.size() < 2u) {
      trace.info("Raw offset collapsed\n");
      return;
    }

    trace.info("RawOffset [Vertices=%zu]\n", _raw.size());

    Geometry::build_segment_index(_input_index, _input, eps);
    Geometry::build_segment_index(_raw_index, _raw, eps);

    collect_self_intersects();

    if ((_flags & PA_OFFSET_FLAG_HANDLE_SELF_INTERSECTS) != 0u)
      collect_dual_intersects();

    // End points of an open input are surrounded by circles that cut off the parts wrapping around them.
    if (!_input.is_closed()) {
      add_circle_points(_input.at(0).pos());
      add_circle_points(_input.at(_input.size() - 1u).pos());
    }

    trace.info("SlicePoints [Count=%zu]\n", _points.size());

    if (_points.empty())
      create_whole_slice();
    else
      create_slices();

    trace.info("Slices [Valid=%zu Rejected=%zu]\n", _slices.size(), _rejected_count);

    size_t prev_count = out.size();
    stitch_slices(out, _slices, _tol, _input.is_closed() ? StitchMode::kClosedOnly : StitchMode::kKeepOpen);

    trace.info("Result [Polylines=%zu]\n", out.size() - prev_count);
    trace.deindent();
  }

private:
  //! \name Slice Points
  //! \{

  void add_point(size_t index, const PAPoint& pt) {
    double param = Geometry::seg_parameter(Geometry::segment_at(_raw, index), pt);
    _points.push_back(SlicePoint{index, param, pt});
  }

  void collect_self_intersects() {
    std::vector<Geometry::BasicIntersect> intersects;
    Geometry::find_local_self_intersects(intersects, _raw, _tol.pos_equal_eps);
    Geometry::find_global_self_intersects(intersects, _raw, _raw_index, _tol.pos_equal_eps);

    for (const Geometry::BasicIntersect& intersect : intersects) {
      add_point(intersect.start_index1, intersect.point);
      add_point(intersect.start_index2, intersect.point);
    }
  }

  void collect_dual_intersects() {
    double eps = _tol.pos_equal_eps;

    std::vector<RawOffsetSeg> segments;
    create_raw_offset_segments(segments, _input, -_offset, eps);

    PAPolyline dual;
    create_raw_offset_polyline(dual, _input, segments, -_offset, eps);
    if (dual.size() < 2u)
      return;

    Geometry::IntersectsResult intersects;
    Geometry::find_intersects(intersects, _raw, dual, _raw_index, eps);

    for (const Geometry::BasicIntersect& intersect : intersects.basic)
      add_point(intersect.start_index1, intersect.point);

    for (const Geometry::OverlappingIntersect& intersect : intersects.overlapping) {
      add_point(intersect.start_index1, intersect.point1);
      add_point(intersect.start_index1, intersect.point2);
    }
  }

  void add_circle_points(const PAPoint& center) {
    double eps = _tol.pos_equal_eps;
    double radius = pa_abs(_offset);
    PABox query(center.x - radius - eps, center.y - radius - eps, center.x + radius + eps, center.y + radius + eps);

    _raw_index.visit(query, [&](size_t index) {
      const PAVertex& v1 = _raw.at(index);
      const PAVertex& v2 = _raw.at(Geometry::next_index(_raw, index));

      // Intersections at segment end points are excluded, both raw offset end points lie on the circles.
      if (v1.bulge == 0.0) {
        Geometry::LineCircleParams r = Geometry::line_circle_params(v1.pos(), v2.pos(), center, radius, eps);
        double t_eps = param_eps(v1.pos(), v2.pos(), eps);

        for (uint32_t i = 0; i < r.count; i++) {
          if (r.t[i] > t_eps && r.t[i] < 1.0 - t_eps)
            add_point(index, Math::lerp(v1.pos(), v2.pos(), r.t[i]));
        }
      }
      else {
        Segment arc = Geometry::make_segment(v1, v2);
        Geometry::CircleCirclePoints r = Geometry::circle_circle_points(arc.center, arc.radius, center, radius, eps);

        for (uint32_t i = 0; i < r.count; i++) {
          const PAPoint& pt = r.pts[i];
          if (!fuzzy_equal(pt, v1.pos(), eps) && !fuzzy_equal(pt, v2.pos(), eps) && Geometry::point_within_arc_sweep(arc, pt, eps))
            add_point(index, pt);
        }
      }
      return true;
    });
  }

  //! \}

  //! \name Validation
  //! \{

  //! Tests whether `pt` is not closer to the input than the offset distance.
  bool point_valid(const PAPoint& pt) const {
    double dist = pa_abs(_offset);
    double min_dist = dist - _tol.offset_dist_eps;
    if (min_dist <= 0.0)
      return true;

    double min_dist_sq = min_dist * min_dist;
    double query_expand = dist + _tol.offset_dist_eps;
    bool valid = true;

    PABox query(pt.x - query_expand, pt.y - query_expand, pt.x + query_expand, pt.y + query_expand);
    _input_index.visit(query, [&](size_t index) {
      const PAVertex& v1 = _input.at(index);
      const PAVertex& v2 = _input.at(Geometry::next_index(_input, index));

      PAPoint cp = Geometry::seg_closest_point(v1, v2, pt, _tol.pos_equal_eps);
      valid = Geometry::length_squared(cp, pt) >= min_dist_sq;
      return valid;
    });

    return valid;
  }

  bool intersects_input(const PAVertex& v1, const PAVertex& v2) const {
    double eps = _tol.pos_equal_eps;
    bool found = false;

    _input_index.visit(Geometry::expand(Geometry::seg_bounding_box(v1, v2), eps), [&](size_t index) {
      const PAVertex& u1 = _input.at(index);
      const PAVertex& u2 = _input.at(Geometry::next_index(_input, index));

      found = Geometry::seg_intersect(v1, v2, u1, u2, eps).has_intersection();
      return !found;
    });

    return found;
  }

  //! Checks end points, vertices and segment midpoints of a slice against the input.
  //!
  //! An offset within the distance tolerance stays within the intersection tolerance of the input, so its slices
  //! are not tested for crossing the input.
  template<typename View>
  bool slice_is_valid(const View& view) const {
    bool check_crossing = pa_abs(_offset) > pa_max(_tol.offset_dist_eps, _tol.pos_equal_eps);

    for (PASegmentVertices seg : view.segments()) {
      if (!point_valid(seg.v1.pos()) || !point_valid(Geometry::seg_midpoint(seg.v1, seg.v2)))
        return false;

      if (check_crossing && intersects_input(seg.v1, seg.v2))
        return false;
    }

    return point_valid(view.at(view.size() - 1u).pos());
  }

  //! \}

  //! \name Slices
  //! \{

  void add_slice(const Geometry::SliceData& data) {
    Geometry::PolylineSubView<PAPolyline> view(_raw, data);
    if (!slice_is_valid(view)) {
      _rejected_count++;
      return;
    }

    StitchSlice slice{PAPolyline(), 0u, data.start_index, _raw.size()};
    Geometry::extend_remove_repeat(slice.polyline, view, _tol.pos_equal_eps);

    if (slice.polyline.size() >= 2u)
      _slices.push_back(std::move(slice));
  }

  void try_add_slice(size_t start_index, const PAPoint& start_pt, size_t end_index, const PAPoint& end_pt, bool full_loop) {
    size_t offset_count;

    if (full_loop)
      offset_count = _raw.size();
    else if (_input.is_closed())
      offset_count = Geometry::forward_distance(_raw, start_index, end_index);
    else if (end_index >= start_index)
      offset_count = end_index - start_index;
    else
      return;

    Geometry::SliceData data;
    if (Geometry::make_slice(data, _raw, start_index, start_pt, offset_count, end_pt, _tol.pos_equal_eps))
      add_slice(data);
  }

  //! The raw offset doesn't intersect itself, it's either valid or invalid as a whole.
  void create_whole_slice() {
    size_t n = _raw.size();
    bool closed = _input.is_closed();

    size_t end_offset = closed ? n - 1u : n - 2u;
    PAPoint end_pt = closed ? _raw.at(0).pos() : _raw.last().pos();

    Geometry::SliceData data;
    if (Geometry::make_slice(data, _raw, 0, _raw.at(0).pos(), end_offset, end_pt, _tol.pos_equal_eps))
      add_slice(data);
  }

  void create_slices() {
    sort_slice_points(_points, _tol.pos_equal_eps);

    size_t count = _points.size();
    bool closed = _input.is_closed();

    if (!closed)
      try_add_slice(0, _raw.at(0).pos(), _points[0].index, _points[0].point, false);

    size_t i = 0;
    while (i < count) {
      size_t index = _points[i].index;
      size_t end = i + 1u;

      while (end < count && _points[end].index == index)
        end++;

      for (size_t j = i; j + 1u < end; j++)
        try_add_slice(index, _points[j].point, index, _points[j + 1u].point, false);

      const PAPoint& last = _points[end - 1u].point;
      if (end < count)
        try_add_slice(index, last, _points[end].index, _points[end].point, false);
      else if (closed)
        try_add_slice(index, last, _points[0].index, _points[0].point, i == 0);
      else
        try_add_slice(index, last, _raw.size() - 2u, _raw.last().pos(), false);

      i = end;
    }
  }

  //! \}

  PolylineRef _input;
  double _offset;
  Geometry::Tolerance _tol;
  uint32_t _flags;

  PAPolyline _raw;
  Geometry::AABBIndex _input_index;
  Geometry::AABBIndex _raw_index;

  std::vector<SlicePoint> _points;
  std::vector<StitchSlice> _slices;
  size_t _rejected_count = 0;
};

void parallel_offset(PAPolylineArray& out, const PolylineRef& input, double offset, const Geometry::Tolerance& tol, uint32_t flags) {
  PolylineOffsetter offsetter(input, offset, tol, flags);
  offsetter.run(out);
}

} // {pa::PolylineInternal}
