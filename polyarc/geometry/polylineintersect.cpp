// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_p.h>
#include <polyarc/geometry/polylineintersect_p.h>

namespace pa::Geometry {

// pa::Geometry - Segment Index
// ============================

void build_segment_index(AABBIndex& index, const PolylineRef& polyline, double fuzz) {
  size_t seg_count = polyline.segment_count();
  index.reserve(seg_count);

  for (PASegmentVertices seg : polyline.segments())
    index.add(expand(seg_bounding_box(seg.v1, seg.v2), fuzz));

  index.finish();
}

// pa::Geometry - Self Intersects
// ==============================

template<typename Callback>
static PA_INLINE void for_each_intersect_point(const SegIntersect& r, Callback&& callback) {
  switch (r.type) {
    case IntersectType::kNone:
      break;

    case IntersectType::kTangent:
      callback(r.p0);
      break;

    case IntersectType::kCrossing:
    case IntersectType::kOverlap:
      callback(r.p0);
      if (r.count > 1u)
        callback(r.p1);
      break;
  }
}

void find_local_self_intersects(std::vector<BasicIntersect>& out, const PolylineRef& polyline, double eps) {
  size_t seg_count = polyline.segment_count();
  if (seg_count < 2u)
    return;

  size_t n = polyline.size();
  bool two_vertex_loop = polyline.is_closed() && n == 2u;

  // Both segments of a closed two vertex polyline form a single adjacent pair that shares both vertices.
  size_t pair_count = polyline.is_closed() ? (two_vertex_loop ? 1u : n) : seg_count - 1u;

  for (size_t i = 0; i < pair_count; i++) {
    size_t j = next_index(polyline, i);

    const PAVertex& v1 = polyline.at(i);
    const PAVertex& v2 = polyline.at(j);
    const PAVertex& u2 = polyline.at(next_index(polyline, j));

    SegIntersect r = seg_intersect(v1, v2, v2, u2, eps);
    for_each_intersect_point(r, [&](const PAPoint& pt) {
      if (fuzzy_equal(pt, v2.pos(), eps) || (two_vertex_loop && fuzzy_equal(pt, v1.pos(), eps)))
        return;
      out.push_back(BasicIntersect{i, j, pt});
    });
  }
}

void find_global_self_intersects(std::vector<BasicIntersect>& out, const PolylineRef& polyline, const AABBIndex& index, double eps) {
  size_t seg_count = polyline.segment_count();
  if (seg_count < 3u)
    return;

  bool closed = polyline.is_closed();

  for (size_t i = 0; i < seg_count; i++) {
    const PAVertex& v1 = polyline.at(i);
    const PAVertex& v2 = polyline.at(next_index(polyline, i));

    index.visit(expand(seg_bounding_box(v1, v2), eps), [&](size_t j) {
      // Each pair once, adjacent segments (including the closing pair) are local intersects.
      if (j <= i + 1u || (closed && i == 0 && j == seg_count - 1u))
        return true;

      const PAVertex& u1 = polyline.at(j);
      const PAVertex& u2 = polyline.at(next_index(polyline, j));

      SegIntersect r = seg_intersect(v1, v2, u1, u2, eps);
      for_each_intersect_point(r, [&](const PAPoint& pt) {
        out.push_back(BasicIntersect{i, j, pt});
      });
      return true;
    });
  }
}

bool is_self_intersecting(const PolylineRef& polyline, double eps) {
  std::vector<BasicIntersect> intersects;

  find_local_self_intersects(intersects, polyline, eps);
  if (!intersects.empty())
    return true;

  if (polyline.segment_count() < 3u)
    return false;

  AABBIndex index;
  build_segment_index(index, polyline, eps);

  bool found = false;
  size_t seg_count = polyline.segment_count();
  bool closed = polyline.is_closed();

  for (size_t i = 0; i < seg_count && !found; i++) {
    const PAVertex& v1 = polyline.at(i);
    const PAVertex& v2 = polyline.at(next_index(polyline, i));

    index.visit(expand(seg_bounding_box(v1, v2), eps), [&](size_t j) {
      if (j <= i + 1u || (closed && i == 0 && j == seg_count - 1u))
        return true;

      const PAVertex& u1 = polyline.at(j);
      const PAVertex& u2 = polyline.at(next_index(polyline, j));

      found = seg_intersect(v1, v2, u1, u2, eps).has_intersection();
      return !found;
    });
  }

  return found;
}

// pa::Geometry - Intersects Between Polylines
// ===========================================

//! Tests whether `pt` is at the end of segment `index` that is also the start of the next segment.
static PA_INLINE bool is_at_shared_end(const PolylineRef& polyline, size_t index, const PAPoint& pt, double eps) noexcept {
  if (!polyline.is_closed() && index + 1u == polyline.segment_count())
    return false;
  return fuzzy_equal(pt, polyline.at(next_index(polyline, index)).pos(), eps);
}

void find_intersects(IntersectsResult& out, const PolylineRef& a, const PolylineRef& b, const AABBIndex& a_index, double eps) {
  size_t b_index = 0;

  for (PASegmentVertices seg : b.segments()) {
    const PAVertex& u1 = seg.v1;
    const PAVertex& u2 = seg.v2;

    a_index.visit(expand(seg_bounding_box(u1, u2), eps), [&](size_t a_seg) {
      const PAVertex& v1 = a.at(a_seg);
      const PAVertex& v2 = a.at(next_index(a, a_seg));

      SegIntersect r = seg_intersect(v1, v2, u1, u2, eps);
      if (!r.has_intersection())
        return true;

      if (r.is_overlap()) {
        out.overlapping.push_back(OverlappingIntersect{a_seg, b_index, r.p0, r.p1});
        return true;
      }

      for_each_intersect_point(r, [&](const PAPoint& pt) {
        if (is_at_shared_end(a, a_seg, pt, eps) || is_at_shared_end(b, b_index, pt, eps))
          return;
        out.basic.push_back(BasicIntersect{a_seg, b_index, pt});
      });
      return true;
    });

    b_index++;
  }
}

} // {pa::Geometry}
