// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_p.h>
#include <polyarc/core/polylinestitch_p.h>
#include <polyarc/geometry/polylineutils_p.h>
#include <polyarc/support/algorithm_p.h>

namespace pa::PolylineInternal {

// pa::PolylineInternal - Slice Points
// ===================================

void sort_slice_points(std::vector<SlicePoint>& points, double eps) noexcept {
  quick_sort(points.data(), points.size(), [](const SlicePoint& a, const SlicePoint& b) noexcept -> int {
    if (a.index != b.index)
      return a.index < b.index ? -1 : 1;
    return a.param < b.param ? -1 : a.param > b.param ? 1 : 0;
  });

  size_t count = points.size();
  size_t w = 0;

  for (size_t i = 0; i < count; i++) {
    if (w && points[w - 1u].index == points[i].index && Geometry::fuzzy_equal(points[w - 1u].point, points[i].point, eps))
      continue;
    points[w++] = points[i];
  }

  points.erase(points.begin() + ptrdiff_t(w), points.end());
}

// pa::PolylineInternal - Stitching
// ================================

//! Turning angles closer than this are considered equal.
static constexpr double kTurnAngleTieEpsilon = 1e-9;

static PA_INLINE PAPoint end_direction(const PAPolyline& polyline) noexcept {
  size_t n = polyline.size();
  const PAVertex& v1 = polyline.at(n - 2u);
  const PAVertex& v2 = polyline.at(n - 1u);
  return Geometry::seg_tangent(v1, v2, v2.pos());
}

static PA_INLINE PAPoint start_direction(const PAPolyline& polyline) noexcept {
  const PAVertex& v1 = polyline.at(0);
  const PAVertex& v2 = polyline.at(1);
  return Geometry::seg_tangent(v1, v2, v1.pos());
}

static PA_INLINE double turning_angle(const PAPoint& from, const PAPoint& to) noexcept {
  return Math::atan2(Geometry::cross(from, to), Geometry::dot(from, to));
}

static PA_INLINE size_t forward_index_distance(const StitchSlice& from, const StitchSlice& to) noexcept {
  if (from.source_id != to.source_id)
    return SIZE_MAX;

  if (to.start_index >= from.start_index)
    return to.start_index - from.start_index;
  return from.source_size - from.start_index + to.start_index;
}

//! Returns the slice that continues `chain` after `current`, or `SIZE_MAX` if there is none.
static size_t find_next_slice(const PAPolyline& chain, const std::vector<StitchSlice>& slices, const std::vector<uint8_t>& visited, size_t current, double join_eps) noexcept {
  PAPoint end_pt = chain.last().pos();
  PAPoint end_dir = end_direction(chain);

  size_t best_index = SIZE_MAX;
  double best_angle = 0.0;
  size_t best_distance = SIZE_MAX;

  for (size_t i = 0; i < slices.size(); i++) {
    if (visited[i] || !Geometry::fuzzy_equal(slices[i].start_point(), end_pt, join_eps))
      continue;

    double a = turning_angle(end_dir, start_direction(slices[i].polyline));
    size_t distance = forward_index_distance(slices[current], slices[i]);

    if (best_index != SIZE_MAX) {
      if (a > best_angle + kTurnAngleTieEpsilon)
        continue;

      if (a >= best_angle - kTurnAngleTieEpsilon && distance >= best_distance)
        continue;
    }

    best_index = i;
    best_angle = a;
    best_distance = distance;
  }

  return best_index;
}

//! Returns the position in `chain_slices` of a slice (other than the first one) whose start point is where the chain
//! ends now, or `SIZE_MAX` if the chain doesn't run into itself.
static size_t find_inner_cycle(const PAPolyline& chain, const std::vector<size_t>& chain_starts, double join_eps) noexcept {
  PAPoint end_pt = chain.last().pos();
  size_t last_vertex = chain.size() - 1u;

  for (size_t k = 1; k < chain_starts.size(); k++) {
    size_t pos = chain_starts[k];
    if (last_vertex - pos >= 2u && Geometry::fuzzy_equal(chain.at(pos).pos(), end_pt, join_eps))
      return k;
  }

  return SIZE_MAX;
}

static void add_closed_chain(PAPolylineArray& out, PAPolyline& chain, const Geometry::Tolerance& tol) {
  chain.set_closed(true);
  if (pa_abs(Geometry::area(chain)) >= tol.collapsed_area_eps)
    out.push_back(std::move(chain));
}

void stitch_slices(PAPolylineArray& out, const std::vector<StitchSlice>& slices, const Geometry::Tolerance& tol, StitchMode mode) {
  size_t count = slices.size();
  std::vector<uint8_t> visited(count, uint8_t(0));

  // Slices of the current chain and positions of their start vertices in the chain.
  std::vector<size_t> chain_slices;
  std::vector<size_t> chain_starts;

  for (size_t start = 0; start < count; start++) {
    if (visited[start])
      continue;
    visited[start] = 1;

    PAPolyline chain;
    Geometry::extend_remove_repeat(chain, slices[start].polyline, tol.pos_equal_eps);

    chain_slices.assign(1, start);
    chain_starts.assign(1, 0u);

    PAPoint initial = chain.at(0).pos();
    size_t current = start;
    bool closed = false;

    for (size_t step = 0; step <= count; step++) {
      if (chain.size() >= 3u && Geometry::fuzzy_equal(chain.last().pos(), initial, tol.slice_join_eps)) {
        chain.remove_last();
        closed = true;
        break;
      }

      if (chain.size() < 2u)
        break;

      size_t cycle = find_inner_cycle(chain, chain_starts, tol.slice_join_eps);
      if (cycle != SIZE_MAX) {
        // The chain ran into a loop that doesn't contain its start, the loop is kept and the leading part of the
        // chain is handled like a chain that didn't close.
        size_t cycle_start = chain_starts[cycle];

        PAPolyline loop(chain.vertex_data() + cycle_start, chain.size() - cycle_start - 1u, true);
        add_closed_chain(out, loop, tol);

        while (chain.size() > cycle_start + 1u)
          chain.remove_last();

        const PAVertex& end = chain.last();
        chain.set_at(chain.size() - 1u, PAVertex(end.x, end.y, 0.0));

        chain_slices.resize(cycle);
        chain_starts.resize(cycle);
        break;
      }

      size_t next = find_next_slice(chain, slices, visited, current, tol.slice_join_eps);
      if (next == SIZE_MAX)
        break;

      visited[next] = 1;
      current = next;

      // The next slice starts where the chain ends, its start vertex carries the bulge of the following segment.
      chain.remove_last();
      chain_slices.push_back(next);
      chain_starts.push_back(chain.size());
      Geometry::extend_remove_repeat(chain, slices[next].polyline, tol.pos_equal_eps);
    }

    if (closed) {
      add_closed_chain(out, chain, tol);
      continue;
    }

    if (mode == StitchMode::kClosedOnly) {
      // Slices of an open chain may still close with other slices.
      for (size_t i = 1; i < chain_slices.size(); i++)
        visited[chain_slices[i]] = 0;
      continue;
    }

    if (chain.size() >= 2u)
      out.push_back(std::move(chain));
  }
}

} // {pa::PolylineInternal}
