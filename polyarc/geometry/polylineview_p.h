// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_GEOMETRY_POLYLINEVIEW_P_H_INCLUDED
#define POLYARC_GEOMETRY_POLYLINEVIEW_P_H_INCLUDED

#include <polyarc/core/polyline.h>
#include <polyarc/geometry/segment_p.h>

//! \cond INTERNAL
//! \addtogroup polyarc_geometry
//! \{

namespace pa::Geometry {

//! \name Polyline Views
//!
//! Views are duck-typed contracts used by all polyline algorithms:
//!
//!   - Read view: `size()`, `at(index)`, `is_closed()`, `segment_count()`, `segments()`.
//!   - Read-write view: read view + `set_at(index, vertex)`.
//!   - Create view: `clear()`, `reserve(n)`, `add_vertex(v)`, `set_closed(closed)`, `remove_last()`, `last()`.
//!
//! `PAPolyline` implements all of them.
//!
//! \{

//! Read view of a contiguous array of vertices.
class PolylineRef {
public:
  PA_INLINE_NODEBUG PolylineRef(const PAVertex* data, size_t size, bool closed) noexcept
    : _data(data),
      _size(size),
      _closed(closed) {}

  PA_INLINE_NODEBUG PolylineRef(const PAPolyline& polyline) noexcept
    : _data(polyline.vertex_data()),
      _size(polyline.size()),
      _closed(polyline.is_closed()) {}

  [[nodiscard]]
  PA_INLINE_NODEBUG size_t size() const noexcept { return _size; }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool is_closed() const noexcept { return _closed; }

  [[nodiscard]]
  PA_INLINE_NODEBUG const PAVertex& at(size_t index) const noexcept { return _data[index]; }

  [[nodiscard]]
  PA_INLINE_NODEBUG const PAVertex* data() const noexcept { return _data; }

  [[nodiscard]]
  PA_INLINE size_t segment_count() const noexcept {
    if (_size < 2u)
      return 0u;
    return _closed ? _size : _size - 1u;
  }

  [[nodiscard]]
  PA_INLINE_NODEBUG PASegmentRange<PolylineRef> segments() const noexcept { return PASegmentRange<PolylineRef>(this); }

private:
  const PAVertex* _data;
  size_t _size;
  bool _closed;
};

//! Describes a part of a source polyline that starts and ends at arbitrary points on its segments.
struct SliceData {
  //! Index of the source segment that contains the start point.
  size_t start_index;
  //! Number of source vertices between the start and end segments (0 if both are the same segment).
  size_t end_index_offset;
  //! Start vertex at the start point, its bulge describes the rest of the start segment.
  PAVertex updated_start;
  //! Bulge of the last segment, it ends at `end_point`.
  double updated_end_bulge;
  //! End point of the slice.
  PAPoint end_point;

  //! Number of vertices of the slice.
  PA_INLINE_NODEBUG size_t vertex_count() const noexcept { return end_index_offset + 2u; }
};

//! Read view of a slice of a source view (no vertex data is copied), optionally in reverse direction.
//!
//! The view is always open. It's only valid as long as `source` is.
template<typename View>
class PolylineSubView {
public:
  PA_INLINE_NODEBUG PolylineSubView(const View& source, const SliceData& data, bool inverted = false) noexcept
    : _source(&source),
      _data(data),
      _inverted(inverted) {}

  [[nodiscard]]
  PA_INLINE_NODEBUG size_t size() const noexcept { return _data.vertex_count(); }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool is_closed() const noexcept { return false; }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool is_inverted() const noexcept { return _inverted; }

  [[nodiscard]]
  PA_INLINE_NODEBUG const SliceData& data() const noexcept { return _data; }

  [[nodiscard]]
  PA_INLINE_NODEBUG size_t segment_count() const noexcept { return size() - 1u; }

  [[nodiscard]]
  PA_INLINE PAVertex at(size_t index) const noexcept {
    if (!_inverted)
      return forward_at(index);

    // Reversed order, each vertex takes the negated bulge of the vertex that precedes it in forward order.
    size_t n = size();
    size_t j = n - 1u - index;
    PAPoint pos = forward_at(j).pos();
    if (j == 0)
      return PAVertex(pos, 0.0);
    return PAVertex(pos, -forward_at(j - 1u).bulge);
  }

  [[nodiscard]]
  PA_INLINE_NODEBUG PASegmentRange<PolylineSubView> segments() const noexcept { return PASegmentRange<PolylineSubView>(this); }

private:
  PA_INLINE PAVertex forward_at(size_t index) const noexcept {
    size_t n = size();
    if (index == n - 1u)
      return PAVertex(_data.end_point, 0.0);

    PAVertex v = index == 0 ? _data.updated_start : _source->at((_data.start_index + index) % _source->size());
    if (index == n - 2u)
      v.bulge = _data.updated_end_bulge;
    return v;
  }

  const View* _source;
  SliceData _data;
  bool _inverted;
};

//! \}

//! \name View Helpers
//! \{

template<typename View>
static PA_INLINE size_t next_index(const View& view, size_t index) noexcept {
  return index + 1u == view.size() ? 0u : index + 1u;
}

template<typename View>
static PA_INLINE size_t prev_index(const View& view, size_t index) noexcept {
  return index == 0 ? view.size() - 1u : index - 1u;
}

//! Returns the forward distance from `i` to `j`, wrapping around the end of the view.
template<typename View>
static PA_INLINE size_t forward_distance(const View& view, size_t i, size_t j) noexcept {
  return j >= i ? j - i : view.size() - i + j;
}

//! Returns the segment that starts at vertex `index`.
template<typename View>
static PA_INLINE Segment segment_at(const View& view, size_t index) noexcept {
  return make_segment(view.at(index), view.at(next_index(view, index)));
}

//! Creates slice data of `source` from `start_point` on segment `start_index` to `end_point` on segment
//! `start_index + end_index_offset` (wrapping).
//!
//! Returns false if the slice would be collapsed to a point.
template<typename View>
static bool make_slice(SliceData& out, const View& source, size_t start_index, const PAPoint& start_point, size_t end_index_offset, const PAPoint& end_point, double eps) noexcept {
  size_t n = source.size();

  // A start point at the end of its segment starts the next segment instead.
  if (end_index_offset > 0 && fuzzy_equal(start_point, source.at(next_index(source, start_index)).pos(), eps)) {
    start_index = next_index(source, start_index);
    end_index_offset--;
  }

  // An end point at the start of its segment ends the previous segment instead.
  if (end_index_offset > 0 && fuzzy_equal(end_point, source.at((start_index + end_index_offset) % n).pos(), eps))
    end_index_offset--;

  const PAVertex& v1 = source.at(start_index);
  const PAVertex& v2 = source.at(next_index(source, start_index));

  out.start_index = start_index;
  out.end_index_offset = end_index_offset;
  out.updated_start = seg_split_at_point(v1, v2, start_point, eps).split_vertex;
  out.end_point = end_point;

  if (end_index_offset == 0) {
    if (fuzzy_equal(start_point, end_point, eps))
      return false;
    out.updated_end_bulge = seg_split_at_point(out.updated_start, v2, end_point, eps).updated_start.bulge;
  }
  else {
    size_t end_index = (start_index + end_index_offset) % n;
    const PAVertex& e1 = source.at(end_index);
    const PAVertex& e2 = source.at(next_index(source, end_index));
    out.updated_end_bulge = seg_split_at_point(e1, e2, end_point, eps).updated_start.bulge;
  }

  return true;
}

//! \}

} // {pa::Geometry}

//! \}
//! \endcond

#endif // POLYARC_GEOMETRY_POLYLINEVIEW_P_H_INCLUDED
