// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_CORE_POLYLINE_H_INCLUDED
#define POLYARC_CORE_POLYLINE_H_INCLUDED

#include <polyarc/core/api.h>
#include <polyarc/core/geometry.h>

#include <initializer_list>
#include <utility>
#include <vector>

//! \addtogroup pa_polyline
//! \{

//! \name PAPolyline - Constants
//! \{

//! Defines boolean operators.
PA_DEFINE_ENUM(PABooleanOperator) {
  //! Creates the union of defined areas.
  PA_BOOLEAN_OPERATOR_UNION = 0,
  //! Creates the intersection of defined areas.
  PA_BOOLEAN_OPERATOR_INTERSECTION = 1,
  //! Creates the difference between defined areas (first minus second).
  PA_BOOLEAN_OPERATOR_DIFFERENCE = 2,
  //! Creates the symmetric difference of defined areas.
  PA_BOOLEAN_OPERATOR_XOR = 3,

  //! Maximum value for PABooleanOperator.
  PA_BOOLEAN_OPERATOR_MAX_VALUE = 3

  PA_FORCE_ENUM_UINT32(PA_BOOLEAN_OPERATOR)
};

//! Offset flags.
PA_DEFINE_ENUM(PAOffsetFlags) {
  //! No flags.
  PA_OFFSET_NO_FLAGS = 0u,
  //! Also intersects the raw offset with the raw offset of the opposite side, required to offset a closed
  //! polyline that intersects itself.
  PA_OFFSET_FLAG_HANDLE_SELF_INTERSECTS = 0x00000001u

  PA_FORCE_ENUM_UINT32(PA_OFFSET_FLAG)
};

//! \}

//! \name PAPolyline - Structs
//! \{

//! Options used by polyline offsetting.
//!
//! Use `pa_default_offset_options` to setup defaults and then alter values you want to change.
struct PAOffsetOptions {
  //! Position equality and intersection tolerance.
  double tolerance;
  //! Tolerance used to join end points of slices into output polylines.
  double join_tolerance;
  //! Distance tolerance used to discard slices that are closer to the input than the offset distance.
  double offset_tolerance;
  //! Offset flags, see \ref PAOffsetFlags.
  uint32_t flags;
};

//! Options used by polyline boolean operations.
//!
//! Use `pa_default_boolean_options` to setup defaults and then alter values you want to change.
struct PABooleanOptions {
  //! Position equality and intersection tolerance.
  double tolerance;
  //! Tolerance used to join end points of slices into output polylines.
  double join_tolerance;
};

//! Closest point query result, see `PAPolyline::closest_point()`.
struct PAClosestPoint {
  //! Index of the vertex that starts the closest segment.
  size_t segment_index;
  //! Closest point on the polyline.
  PAPoint point;
  //! Distance between the query point and `point`.
  double distance;
};

//! Pair of consecutive vertices that describe a single segment.
struct PASegmentVertices {
  PAVertex v1;
  PAVertex v2;
};

//! Lazy, restartable range of segments of any read view (`size()`, `at()`, `segment_count()`).
//!
//! Iterating yields `PASegmentVertices` front to back, the closing segment of a closed view comes last.
template<typename View>
class PASegmentRange {
public:
  class Iterator {
  public:
    PA_INLINE_NODEBUG Iterator(const View* view, size_t index) noexcept
      : _view(view),
        _index(index) {}

    PA_INLINE PASegmentVertices operator*() const noexcept {
      size_t n = _view->size();
      size_t next = _index + 1u == n ? 0u : _index + 1u;
      return PASegmentVertices{_view->at(_index), _view->at(next)};
    }

    PA_INLINE_NODEBUG Iterator& operator++() noexcept { _index++; return *this; }

    PA_INLINE_NODEBUG bool operator==(const Iterator& other) const noexcept { return _index == other._index; }
    PA_INLINE_NODEBUG bool operator!=(const Iterator& other) const noexcept { return _index != other._index; }

    //! Index of the vertex that starts the current segment.
    PA_INLINE_NODEBUG size_t index() const noexcept { return _index; }

  private:
    const View* _view;
    size_t _index;
  };

  PA_INLINE_NODEBUG explicit PASegmentRange(const View* view) noexcept
    : _view(view) {}

  PA_INLINE_NODEBUG Iterator begin() const noexcept { return Iterator(_view, 0); }
  PA_INLINE_NODEBUG Iterator end() const noexcept { return Iterator(_view, _view->segment_count()); }

  PA_INLINE_NODEBUG size_t size() const noexcept { return _view->segment_count(); }

private:
  const View* _view;
};

//! \}

//! \name PAPolyline - Globals
//! \{

class PAPolyline;

//! Array of polylines produced by offset and boolean operations.
typedef std::vector<PAPolyline> PAPolylineArray;

//! Array of points produced by intersection queries.
typedef std::vector<PAPoint> PAPointArray;

//! Default offset options used by polyarc.
extern PA_API const PAOffsetOptions pa_default_offset_options;

//! Default boolean options used by polyarc.
extern PA_API const PABooleanOptions pa_default_boolean_options;

//! Offsets `input` by `distance` and stores the resulting polylines in `out`.
//!
//! A positive distance offsets to the right of the path direction (outward for a counter-clockwise polyline),
//! a negative distance offsets to the left. An offset that collapses completely produces an empty `out`. If
//! `options` is null `pa_default_offset_options` is used.
PA_API PAResult pa_polyline_offset(PAPolylineArray* out, const PAPolyline& input, double distance, const PAOffsetOptions* options) noexcept;

//! Combines closed polylines `a` and `b` by a boolean operator `op` and stores the result in `out`.
//!
//! Holes are stored as additional closed polylines oriented opposite to their outer polyline. If `options` is
//! null `pa_default_boolean_options` is used.
PA_API PAResult pa_polyline_combine(PAPolylineArray* out, const PAPolyline& a, const PAPolyline& b, PABooleanOperator op, const PABooleanOptions* options) noexcept;

//! Stores all points where `a` and `b` intersect in `out` (both end points of every overlapping range included).
PA_API PAResult pa_polyline_find_intersects(PAPointArray* out, const PAPolyline& a, const PAPolyline& b, double tolerance) noexcept;

//! Tests whether `p` intersects itself and stores the result in `out`.
PA_API PAResult pa_polyline_is_self_intersecting(bool* out, const PAPolyline& p, double tolerance) noexcept;

//! Validates `p` as an input of offset and boolean operations.
PA_API PAResult pa_polyline_validate(const PAPolyline& p, double tolerance) noexcept;

//! \}

//! \name PAPolyline - C++ API
//! \{

//! Polyline of lines and circular arcs.
//!
//! Vertices are stored as a flat array of `PAVertex`. If the polyline is closed the last vertex connects back to
//! the first one by a segment described by the last vertex bulge. The polyline implements read, read-write and
//! create view contracts used by all algorithms.
class PAPolyline {
public:
  //! \name Construction & Destruction
  //! \{

  PA_INLINE_NODEBUG PAPolyline() noexcept
    : _closed(false) {}

  PA_INLINE_NODEBUG explicit PAPolyline(bool closed) noexcept
    : _closed(closed) {}

  //! Creates a polyline from `size` vertices, throws `std::bad_alloc` if the allocation fails.
  PA_INLINE PAPolyline(const PAVertex* data, size_t size, bool closed)
    : _vertices(data, data + size),
      _closed(closed) {}

  PA_INLINE PAPolyline(std::initializer_list<PAVertex> vertices, bool closed)
    : _vertices(vertices),
      _closed(closed) {}

  PA_INLINE_NODEBUG PAPolyline(const PAPolyline& other) = default;
  PA_INLINE_NODEBUG PAPolyline(PAPolyline&& other) noexcept = default;

  PA_INLINE_NODEBUG PAPolyline& operator=(const PAPolyline& other) = default;
  PA_INLINE_NODEBUG PAPolyline& operator=(PAPolyline&& other) noexcept = default;

  //! \}

  //! \name Overloaded Operators
  //! \{

  [[nodiscard]]
  PA_INLINE_NODEBUG const PAVertex& operator[](size_t index) const noexcept { return _vertices[index]; }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool operator==(const PAPolyline& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool operator!=(const PAPolyline& other) const noexcept { return !equals(other); }

  //! \}

  //! \name Common Functionality
  //! \{

  [[nodiscard]]
  PA_INLINE bool equals(const PAPolyline& other) const noexcept {
    return _closed == other._closed && _vertices == other._vertices;
  }

  PA_INLINE_NODEBUG void swap(PAPolyline& other) noexcept {
    _vertices.swap(other._vertices);
    std::swap(_closed, other._closed);
  }

  //! \}

  //! \name Read View
  //! \{

  [[nodiscard]]
  PA_INLINE_NODEBUG size_t size() const noexcept { return _vertices.size(); }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool empty() const noexcept { return _vertices.empty(); }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool is_closed() const noexcept { return _closed; }

  [[nodiscard]]
  PA_INLINE_NODEBUG const PAVertex& at(size_t index) const noexcept { return _vertices[index]; }

  [[nodiscard]]
  PA_INLINE_NODEBUG const PAVertex& last() const noexcept { return _vertices.back(); }

  //! Returns vertex data, exactly as added.
  [[nodiscard]]
  PA_INLINE_NODEBUG const PAVertex* vertex_data() const noexcept { return _vertices.data(); }

  //! Returns the number of segments, `size()` if closed, `size() - 1` if open, and zero if `size() < 2`.
  [[nodiscard]]
  PA_INLINE size_t segment_count() const noexcept {
    size_t n = _vertices.size();
    if (n < 2u)
      return 0u;
    return _closed ? n : n - 1u;
  }

  //! Returns the index of the vertex that follows `index`, wrapping for closed polylines.
  [[nodiscard]]
  PA_INLINE_NODEBUG size_t next_index(size_t index) const noexcept { return index + 1u == size() ? 0u : index + 1u; }

  [[nodiscard]]
  PA_INLINE_NODEBUG PASegmentRange<PAPolyline> segments() const noexcept { return PASegmentRange<PAPolyline>(this); }

  //! \}

  //! \name Read-Write View
  //! \{

  PA_INLINE_NODEBUG void set_at(size_t index, const PAVertex& v) noexcept { _vertices[index] = v; }

  //! Reverses the direction of the polyline in place (inverting twice restores the original data).
  PA_API void invert_direction() noexcept;

  //! \}

  //! \name Create View
  //! \{

  PA_INLINE_NODEBUG void clear() noexcept { _vertices.clear(); }
  PA_INLINE_NODEBUG void set_closed(bool closed) noexcept { _closed = closed; }

  //! Reserves capacity for `n` vertices, throws `std::bad_alloc` if the allocation fails.
  PA_INLINE void reserve(size_t n) { _vertices.reserve(n); }

  //! Adds a vertex, throws `std::bad_alloc` if the allocation fails.
  PA_INLINE void add_vertex(const PAVertex& v) { _vertices.push_back(v); }
  //! \overload
  PA_INLINE void add_vertex(double x, double y, double bulge = 0.0) { _vertices.push_back(PAVertex(x, y, bulge)); }

  PA_INLINE_NODEBUG void remove_last() noexcept { _vertices.pop_back(); }

  //! Replaces the content of the polyline by `size` vertices.
  PA_API PAResult assign_vertices(const PAVertex* data, size_t size, bool closed) noexcept;

  //! \}

  //! \name Queries
  //! \{

  //! Returns the signed area, positive if counter-clockwise (always zero for open polylines).
  [[nodiscard]]
  PA_API double area() const noexcept;

  //! Returns the total length of all segments.
  [[nodiscard]]
  PA_API double path_length() const noexcept;

  //! Returns the tight bounding box including arc extremes.
  [[nodiscard]]
  PA_API PABox bounding_box() const noexcept;

  [[nodiscard]]
  PA_API PAOrientation orientation() const noexcept;

  //! Returns the winding number of `pt` (zero for open polylines and points outside).
  [[nodiscard]]
  PA_API int winding_number(const PAPoint& pt) const noexcept;

  //! Finds the closest point to `pt`, returns `PA_ERROR_TOO_FEW_VERTICES` if the polyline is empty.
  PA_API PAResult closest_point(PAClosestPoint* out, const PAPoint& pt) const noexcept;

  //! Validates the polyline as an input of offset and boolean operations.
  PA_INLINE PAResult validate(double tolerance = 1e-5) const noexcept { return pa_polyline_validate(*this, tolerance); }

  //! \}

  //! \name Editing
  //! \{

  //! Removes consecutive vertices at the same position (within `eps`).
  PA_API PAResult remove_repeat_pos(double eps = 1e-5) noexcept;

  //! Removes repeated positions, merges collinear lines and co-circular arcs going in the same direction.
  PA_API PAResult remove_redundant(double eps = 1e-5) noexcept;

  //! Restarts a closed polyline at `pt`, which lies on the segment that starts at `segment_index`.
  PA_API PAResult rotate_start(size_t segment_index, const PAPoint& pt, double eps = 1e-5) noexcept;

  PA_API void scale(double factor) noexcept;
  PA_API void translate(double dx, double dy) noexcept;

  //! Stores a copy of the polyline with arcs replaced by line segments into `out`.
  //!
  //! Every arc is approximated by inscribed segments so no chord deviates from the arc by more than `error`.
  PA_API PAResult arcs_to_approx_lines(PAPolyline* out, double error) const noexcept;

  //! \}

  //! \name Algorithms
  //! \{

  PA_INLINE PAResult offset(PAPolylineArray* out, double distance, const PAOffsetOptions* options = nullptr) const noexcept {
    return pa_polyline_offset(out, *this, distance, options);
  }

  PA_INLINE PAResult combine(PAPolylineArray* out, const PAPolyline& other, PABooleanOperator op, const PABooleanOptions* options = nullptr) const noexcept {
    return pa_polyline_combine(out, *this, other, op, options);
  }

  //! \}

private:
  std::vector<PAVertex> _vertices;
  bool _closed;
};

//! \}

//! \}

#endif // POLYARC_CORE_POLYLINE_H_INCLUDED
