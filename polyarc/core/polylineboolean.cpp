// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_p.h>
#include <polyarc/core/polylineboolean_p.h>
#include <polyarc/core/polylinestitch_p.h>
#include <polyarc/core/trace_p.h>
#include <polyarc/geometry/polylineintersect_p.h>
#include <polyarc/geometry/polylineutils_p.h>

namespace pa::PolylineInternal {

// pa::PolylineInternal - Boolean - Trace
// ======================================

#if defined(PA_TRACE_ALL) || defined(PA_TRACE_BOOLEAN)
  #define Trace DebugTrace
#else
  #define Trace DummyTrace
#endif

static const char* const location_names[] = {
  "Outside",
  "Inside",
  "CoincidentSame",
  "CoincidentOpposite"
};

// pa::PolylineInternal - Boolean - Slices
// =======================================

struct ClassifiedSlice {
  StitchSlice slice;
  SliceLocation location;
};

//! Finds the point in the middle of the path of an open polyline and the path direction there.
static void path_midpoint(const PAPolyline& polyline, PAPoint& pt_out, PAPoint& tangent_out) noexcept {
  double remaining = Geometry::path_length(polyline) * 0.5;
  size_t seg_count = polyline.segment_count();

  for (size_t i = 0; i < seg_count; i++) {
    const PAVertex& v1 = polyline.at(i);
    const PAVertex& v2 = polyline.at(i + 1u);

    double len = Geometry::seg_length(v1, v2);
    if (remaining <= len || i + 1u == seg_count) {
      double t = len > 0.0 ? pa_min(remaining / len, 1.0) : 0.0;
      pt_out = Geometry::seg_point_at(v1, v2, t);
      tangent_out = Geometry::seg_tangent(v1, v2, pt_out);
      return;
    }

    remaining -= len;
  }

  pt_out = polyline.at(0).pos();
  tangent_out = PAPoint(0, 0);
}

static SliceLocation classify_slice(const PAPolyline& slice, const PAPolyline& other, const Geometry::Tolerance& tol) noexcept {
  PAPoint mid;
  PAPoint tangent;
  path_midpoint(slice, mid, tangent);

  PAClosestPoint cp = Geometry::closest_point(other, mid, tol.pos_equal_eps);
  if (cp.distance < tol.slice_join_eps) {
    const PAVertex& v1 = other.at(cp.segment_index);
    const PAVertex& v2 = other.at(Geometry::next_index(other, cp.segment_index));

    PAPoint other_tangent = Geometry::seg_tangent(v1, v2, cp.point);
    return Geometry::dot(tangent, other_tangent) > 0.0 ? SliceLocation::kCoincidentSame : SliceLocation::kCoincidentOpposite;
  }

  return Geometry::winding_number(other, mid) != 0 ? SliceLocation::kInside : SliceLocation::kOutside;
}

static void add_point(std::vector<SlicePoint>& points, const PAPolyline& polyline, size_t index, const PAPoint& pt) {
  double param = Geometry::seg_parameter(Geometry::segment_at(polyline, index), pt);
  points.push_back(SlicePoint{index, param, pt});
}

//! Splits closed `polyline` at `points` and classifies every slice against `other`.
static void slice_polyline(std::vector<ClassifiedSlice>& out, const PAPolyline& polyline, std::vector<SlicePoint>& points, uint32_t source_id, const PAPolyline& other, const Geometry::Tolerance& tol) {
  double eps = tol.pos_equal_eps;
  sort_slice_points(points, eps);

  size_t count = points.size();
  size_t n = polyline.size();

  for (size_t i = 0; i < count; i++) {
    const SlicePoint& start = points[i];
    const SlicePoint& end = points[i + 1u == count ? 0u : i + 1u];

    // Returning to the same segment behind the start point goes around the whole polyline.
    size_t offset_count = Geometry::forward_distance(polyline, start.index, end.index);
    if (offset_count == 0 && end.param <= start.param)
      offset_count = n;

    Geometry::SliceData data;
    if (!Geometry::make_slice(data, polyline, start.index, start.point, offset_count, end.point, eps))
      continue;

    ClassifiedSlice classified{StitchSlice{PAPolyline(), source_id, data.start_index, n}, SliceLocation::kOutside};
    Geometry::extend_remove_repeat(classified.slice.polyline, Geometry::PolylineSubView<PAPolyline>(polyline, data), eps);

    if (classified.slice.polyline.size() < 2u)
      continue;

    classified.location = classify_slice(classified.slice.polyline, other, tol);
    out.push_back(std::move(classified));
  }
}

static void take_slices(std::vector<StitchSlice>& out, const std::vector<ClassifiedSlice>& slices, SliceLocation location, bool invert) {
  for (const ClassifiedSlice& classified : slices) {
    if (classified.location != location)
      continue;

    out.push_back(classified.slice);
    if (invert)
      Geometry::invert_direction(out.back().polyline);
  }
}

// pa::PolylineInternal - Boolean - Disjoint Inputs
// ================================================

static PA_INLINE PAPolyline inverted_copy(const PAPolyline& polyline) {
  PAPolyline copy(polyline);
  Geometry::invert_direction(copy);
  return copy;
}

//! Returns a copy of `hole` oriented opposite to `outer`.
static PAPolyline hole_copy(const PAPolyline& hole, const PAPolyline& outer) {
  PAPolyline copy(hole);
  if ((Geometry::area(hole) < 0.0) == (Geometry::area(outer) < 0.0))
    Geometry::invert_direction(copy);
  return copy;
}

//! Combines polylines whose boundaries don't intersect. Polylines that are part of the result are returned as
//! passed, holes are oriented opposite to their outer polyline.
static void combine_disjoint(PAPolylineArray& out, const PAPolyline& a, const PAPolyline& b, PABooleanOperator op) {
  bool a_in_b = Geometry::winding_number(b, a.at(0).pos()) != 0;
  bool b_in_a = !a_in_b && Geometry::winding_number(a, b.at(0).pos()) != 0;

  switch (op) {
    case PA_BOOLEAN_OPERATOR_UNION:
      if (a_in_b) {
        out.push_back(b);
      }
      else if (b_in_a) {
        out.push_back(a);
      }
      else {
        out.push_back(a);
        out.push_back(b);
      }
      break;

    case PA_BOOLEAN_OPERATOR_INTERSECTION:
      if (a_in_b)
        out.push_back(a);
      else if (b_in_a)
        out.push_back(b);
      break;

    case PA_BOOLEAN_OPERATOR_DIFFERENCE:
      if (b_in_a) {
        out.push_back(a);
        out.push_back(hole_copy(b, a));
      }
      else if (!a_in_b) {
        out.push_back(a);
      }
      break;

    case PA_BOOLEAN_OPERATOR_XOR:
      if (a_in_b) {
        out.push_back(b);
        out.push_back(hole_copy(a, b));
      }
      else if (b_in_a) {
        out.push_back(a);
        out.push_back(hole_copy(b, a));
      }
      else {
        out.push_back(a);
        out.push_back(b);
      }
      break;

    default:
      PA_NOT_REACHED();
  }
}

// pa::PolylineInternal - Boolean - Combine
// ========================================

//! Combines counter-clockwise polylines whose boundaries intersect at `intersects`.
static void combine_ccw(PAPolylineArray& out, const PAPolyline& a, const PAPolyline& b, const Geometry::IntersectsResult& intersects, PABooleanOperator op, const Geometry::Tolerance& tol) {
  Trace trace;

  std::vector<SlicePoint> a_points;
  std::vector<SlicePoint> b_points;

  for (const Geometry::BasicIntersect& intersect : intersects.basic) {
    add_point(a_points, a, intersect.start_index1, intersect.point);
    add_point(b_points, b, intersect.start_index2, intersect.point);
  }

  for (const Geometry::OverlappingIntersect& intersect : intersects.overlapping) {
    add_point(a_points, a, intersect.start_index1, intersect.point1);
    add_point(a_points, a, intersect.start_index1, intersect.point2);
    add_point(b_points, b, intersect.start_index2, intersect.point1);
    add_point(b_points, b, intersect.start_index2, intersect.point2);
  }

  std::vector<ClassifiedSlice> a_slices;
  std::vector<ClassifiedSlice> b_slices;

  slice_polyline(a_slices, a, a_points, 0u, b, tol);
  slice_polyline(b_slices, b, b_points, 1u, a, tol);

  trace.info("Slices [A=%zu B=%zu]\n", a_slices.size(), b_slices.size());
  trace.indent();
  for (const ClassifiedSlice& classified : a_slices)
    trace.info("A [Start=%zu Vertices=%zu] %s\n", classified.slice.start_index, classified.slice.polyline.size(), location_names[size_t(classified.location)]);
  for (const ClassifiedSlice& classified : b_slices)
    trace.info("B [Start=%zu Vertices=%zu] %s\n", classified.slice.start_index, classified.slice.polyline.size(), location_names[size_t(classified.location)]);
  trace.deindent();

  std::vector<StitchSlice> selected;

  switch (op) {
    case PA_BOOLEAN_OPERATOR_UNION:
      take_slices(selected, a_slices, SliceLocation::kOutside, false);
      take_slices(selected, b_slices, SliceLocation::kOutside, false);
      take_slices(selected, a_slices, SliceLocation::kCoincidentSame, false);
      stitch_slices(out, selected, tol, StitchMode::kClosedOnly);
      break;

    case PA_BOOLEAN_OPERATOR_INTERSECTION:
      take_slices(selected, a_slices, SliceLocation::kInside, false);
      take_slices(selected, b_slices, SliceLocation::kInside, false);
      take_slices(selected, a_slices, SliceLocation::kCoincidentSame, false);
      stitch_slices(out, selected, tol, StitchMode::kClosedOnly);
      break;

    case PA_BOOLEAN_OPERATOR_DIFFERENCE:
      take_slices(selected, a_slices, SliceLocation::kOutside, false);
      take_slices(selected, b_slices, SliceLocation::kInside, true);
      take_slices(selected, a_slices, SliceLocation::kCoincidentOpposite, false);
      stitch_slices(out, selected, tol, StitchMode::kClosedOnly);
      break;

    case PA_BOOLEAN_OPERATOR_XOR:
      // Both differences are stitched separately, their boundaries touch.
      take_slices(selected, a_slices, SliceLocation::kOutside, false);
      take_slices(selected, b_slices, SliceLocation::kInside, true);
      take_slices(selected, a_slices, SliceLocation::kCoincidentOpposite, false);
      stitch_slices(out, selected, tol, StitchMode::kClosedOnly);

      selected.clear();
      take_slices(selected, b_slices, SliceLocation::kOutside, false);
      take_slices(selected, a_slices, SliceLocation::kInside, true);
      take_slices(selected, b_slices, SliceLocation::kCoincidentOpposite, false);
      stitch_slices(out, selected, tol, StitchMode::kClosedOnly);
      break;

    default:
      PA_NOT_REACHED();
  }
}

void boolean_combine(PAPolylineArray& out, const PAPolyline& a, const PAPolyline& b, PABooleanOperator op, const Geometry::Tolerance& tol) {
  Trace trace;
  trace.info("pa::PolylineInternal::boolean_combine [Op=%u A=%zu B=%zu]\n", unsigned(op), a.size(), b.size());
  trace.indent();

  double eps = tol.pos_equal_eps;

  // Intersecting inputs are combined counter-clockwise, the result takes the orientation of `a`.
  bool a_is_cw = Geometry::area(a) < 0.0;
  bool b_is_cw = Geometry::area(b) < 0.0;

  PAPolyline a_ccw = a_is_cw ? inverted_copy(a) : a;
  PAPolyline b_ccw = b_is_cw ? inverted_copy(b) : b;

  Geometry::AABBIndex a_index;
  Geometry::build_segment_index(a_index, a_ccw, eps);

  Geometry::IntersectsResult intersects;
  Geometry::find_intersects(intersects, a_ccw, b_ccw, a_index, eps);

  trace.info("Intersects [Basic=%zu Overlapping=%zu]\n", intersects.basic.size(), intersects.overlapping.size());

  size_t prev_size = out.size();

  if (intersects.empty()) {
    combine_disjoint(out, a, b, op);
  }
  else {
    PAPolylineArray result;
    combine_ccw(result, a_ccw, b_ccw, intersects, op, tol);

    for (PAPolyline& polyline : result) {
      if (a_is_cw)
        polyline.invert_direction();
      out.push_back(std::move(polyline));
    }
  }

  trace.info("Result [Polylines=%zu]\n", out.size() - prev_size);
  trace.deindent();
}

} // {pa::PolylineInternal}
