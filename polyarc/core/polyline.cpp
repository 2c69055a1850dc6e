// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_p.h>
#include <polyarc/core/polyline.h>
#include <polyarc/core/polylineboolean_p.h>
#include <polyarc/core/polylineoffset_p.h>
#include <polyarc/geometry/polylineintersect_p.h>
#include <polyarc/geometry/polylineutils_p.h>
#include <polyarc/support/math_p.h>

#include <new>

// PAPolyline - Globals
// ====================

const PAOffsetOptions pa_default_offset_options = {
  1e-5,                // tolerance
  1e-4,                // join_tolerance
  1e-4,                // offset_tolerance
  PA_OFFSET_NO_FLAGS   // flags
};

const PABooleanOptions pa_default_boolean_options = {
  1e-5,                // tolerance
  1e-4                 // join_tolerance
};

namespace pa {
namespace PolylineInternal {

// PAPolyline - Internals - Validation
// ===================================

static PA_INLINE bool is_valid_tolerance(double tolerance) noexcept {
  return Math::is_finite(tolerance) && tolerance > 0.0;
}

static PAResult check_offset_options(const PAOffsetOptions& options) noexcept {
  if (PA_UNLIKELY(!is_valid_tolerance(options.tolerance) ||
                  !is_valid_tolerance(options.join_tolerance) ||
                  !is_valid_tolerance(options.offset_tolerance)))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  if (PA_UNLIKELY((options.flags & ~uint32_t(PA_OFFSET_FLAG_HANDLE_SELF_INTERSECTS)) != 0u))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  return PA_SUCCESS;
}

static PAResult check_boolean_options(const PABooleanOptions& options) noexcept {
  if (PA_UNLIKELY(!is_valid_tolerance(options.tolerance) || !is_valid_tolerance(options.join_tolerance)))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  return PA_SUCCESS;
}

//! Checks that all values are finite and that no arc connects coincident vertices.
static PAResult check_vertices(const PAPolyline& p, double tolerance) noexcept {
  size_t n = p.size();
  for (size_t i = 0; i < n; i++) {
    if (PA_UNLIKELY(!Math::is_finite(p.at(i))))
      return pa_make_error(PA_ERROR_INVALID_GEOMETRY);
  }

  for (PASegmentVertices seg : p.segments()) {
    if (PA_UNLIKELY(Geometry::is_degenerate_arc(seg.v1, seg.v2, tolerance)))
      return pa_make_error(PA_ERROR_DEGENERATE_ARC);
  }

  return PA_SUCCESS;
}

//! Stores `p` without repeated positions to `out`, fails if less than 2 vertices remain.
static PAResult clean_input(PAPolyline& out, const PAPolyline& p, double tolerance) {
  Geometry::remove_repeat_pos(out, p, tolerance);
  if (PA_UNLIKELY(out.size() < 2u))
    return pa_make_error(PA_ERROR_TOO_FEW_VERTICES);
  return PA_SUCCESS;
}

//! Cleans a boolean input and checks it's a closed polyline with a non-zero area that doesn't intersect itself.
static PAResult prepare_boolean_input(PAPolyline& out, const PAPolyline& p, const Geometry::Tolerance& tol) {
  PA_PROPAGATE(clean_input(out, p, tol.pos_equal_eps));

  if (PA_UNLIKELY(!out.is_closed()))
    return pa_make_error(PA_ERROR_NOT_CLOSED);

  if (PA_UNLIKELY(pa_abs(Geometry::area(out)) < tol.collapsed_area_eps))
    return pa_make_error(PA_ERROR_INVALID_GEOMETRY);

  if (PA_UNLIKELY(Geometry::is_self_intersecting(out, tol.pos_equal_eps)))
    return pa_make_error(PA_ERROR_SELF_INTERSECTING);

  return PA_SUCCESS;
}

} // {PolylineInternal}
} // {pa}

// PAPolyline - API - Validation
// =============================

PA_API_IMPL PAResult pa_polyline_validate(const PAPolyline& p, double tolerance) noexcept {
  using namespace pa;

  if (PA_UNLIKELY(!PolylineInternal::is_valid_tolerance(tolerance)))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  if (PA_UNLIKELY(p.size() < 2u))
    return pa_make_error(PA_ERROR_TOO_FEW_VERTICES);

  return PolylineInternal::check_vertices(p, tolerance);
}

// PAPolyline - API - Offset
// =========================

PA_API_IMPL PAResult pa_polyline_offset(PAPolylineArray* out, const PAPolyline& input, double distance, const PAOffsetOptions* options) noexcept {
  using namespace pa;

  if (PA_UNLIKELY(!out))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  out->clear();

  if (!options)
    options = &pa_default_offset_options;

  PA_PROPAGATE(PolylineInternal::check_offset_options(*options));

  if (PA_UNLIKELY(!Math::is_finite(distance)))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  PA_PROPAGATE(pa_polyline_validate(input, options->tolerance));

  try {
    PAPolyline cleaned;
    PA_PROPAGATE(PolylineInternal::clean_input(cleaned, input, options->tolerance));

    if (distance == 0.0) {
      out->push_back(std::move(cleaned));
      return PA_SUCCESS;
    }

    // Offset engine is left-positive.
    Geometry::Tolerance tol = Geometry::make_tolerance(options->tolerance, options->join_tolerance, options->offset_tolerance);
    PolylineInternal::parallel_offset(*out, cleaned, -distance, tol, options->flags);
  }
  catch (const std::bad_alloc&) {
    out->clear();
    return pa_make_error(PA_ERROR_OUT_OF_MEMORY);
  }

  return PA_SUCCESS;
}

// PAPolyline - API - Boolean
// ==========================

PA_API_IMPL PAResult pa_polyline_combine(PAPolylineArray* out, const PAPolyline& a, const PAPolyline& b, PABooleanOperator op, const PABooleanOptions* options) noexcept {
  using namespace pa;

  if (PA_UNLIKELY(!out))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  out->clear();

  if (!options)
    options = &pa_default_boolean_options;

  PA_PROPAGATE(PolylineInternal::check_boolean_options(*options));

  if (PA_UNLIKELY(uint32_t(op) > uint32_t(PA_BOOLEAN_OPERATOR_MAX_VALUE)))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  PA_PROPAGATE(pa_polyline_validate(a, options->tolerance));
  PA_PROPAGATE(pa_polyline_validate(b, options->tolerance));

  Geometry::Tolerance tol = Geometry::make_tolerance(options->tolerance, options->join_tolerance, options->join_tolerance);

  try {
    PAPolyline cleaned_a;
    PAPolyline cleaned_b;

    PA_PROPAGATE(PolylineInternal::prepare_boolean_input(cleaned_a, a, tol));
    PA_PROPAGATE(PolylineInternal::prepare_boolean_input(cleaned_b, b, tol));

    PolylineInternal::boolean_combine(*out, cleaned_a, cleaned_b, op, tol);
  }
  catch (const std::bad_alloc&) {
    out->clear();
    return pa_make_error(PA_ERROR_OUT_OF_MEMORY);
  }

  return PA_SUCCESS;
}

// PAPolyline - API - Intersections
// ================================

PA_API_IMPL PAResult pa_polyline_find_intersects(PAPointArray* out, const PAPolyline& a, const PAPolyline& b, double tolerance) noexcept {
  using namespace pa;

  if (PA_UNLIKELY(!out))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  out->clear();

  if (PA_UNLIKELY(!PolylineInternal::is_valid_tolerance(tolerance)))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  PA_PROPAGATE(PolylineInternal::check_vertices(a, tolerance));
  PA_PROPAGATE(PolylineInternal::check_vertices(b, tolerance));

  try {
    Geometry::AABBIndex a_index;
    Geometry::build_segment_index(a_index, a, tolerance);

    Geometry::IntersectsResult intersects;
    Geometry::find_intersects(intersects, a, b, a_index, tolerance);

    out->reserve(intersects.basic.size() + intersects.overlapping.size() * 2u);
    for (const Geometry::BasicIntersect& intersect : intersects.basic)
      out->push_back(intersect.point);

    for (const Geometry::OverlappingIntersect& intersect : intersects.overlapping) {
      out->push_back(intersect.point1);
      out->push_back(intersect.point2);
    }
  }
  catch (const std::bad_alloc&) {
    out->clear();
    return pa_make_error(PA_ERROR_OUT_OF_MEMORY);
  }

  return PA_SUCCESS;
}

PA_API_IMPL PAResult pa_polyline_is_self_intersecting(bool* out, const PAPolyline& p, double tolerance) noexcept {
  using namespace pa;

  if (PA_UNLIKELY(!out))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  *out = false;

  if (PA_UNLIKELY(!PolylineInternal::is_valid_tolerance(tolerance)))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  PA_PROPAGATE(PolylineInternal::check_vertices(p, tolerance));

  try {
    PAPolyline cleaned;
    Geometry::remove_repeat_pos(cleaned, p, tolerance);
    *out = Geometry::is_self_intersecting(cleaned, tolerance);
  }
  catch (const std::bad_alloc&) {
    return pa_make_error(PA_ERROR_OUT_OF_MEMORY);
  }

  return PA_SUCCESS;
}

// PAPolyline - Read-Write View
// ============================

void PAPolyline::invert_direction() noexcept {
  pa::Geometry::invert_direction(*this);
}

// PAPolyline - Create View
// ========================

PAResult PAPolyline::assign_vertices(const PAVertex* data, size_t size, bool closed) noexcept {
  if (PA_UNLIKELY(size && !data))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  try {
    // `data` may point to our own vertices.
    std::vector<PAVertex> vertices(data, data + size);
    _vertices.swap(vertices);
  }
  catch (const std::bad_alloc&) {
    return pa_make_error(PA_ERROR_OUT_OF_MEMORY);
  }

  _closed = closed;
  return PA_SUCCESS;
}

// PAPolyline - Queries
// ====================

double PAPolyline::area() const noexcept {
  return pa::Geometry::area(*this);
}

double PAPolyline::path_length() const noexcept {
  return pa::Geometry::path_length(*this);
}

PABox PAPolyline::bounding_box() const noexcept {
  return pa::Geometry::bounding_box(*this);
}

PAOrientation PAPolyline::orientation() const noexcept {
  return pa::Geometry::orientation(*this);
}

int PAPolyline::winding_number(const PAPoint& pt) const noexcept {
  return pa::Geometry::winding_number(*this, pt);
}

PAResult PAPolyline::closest_point(PAClosestPoint* out, const PAPoint& pt) const noexcept {
  if (PA_UNLIKELY(!out))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  if (PA_UNLIKELY(empty()))
    return pa_make_error(PA_ERROR_TOO_FEW_VERTICES);

  *out = pa::Geometry::closest_point(*this, pt, pa_default_offset_options.tolerance);
  return PA_SUCCESS;
}

// PAPolyline - Editing
// ====================

PAResult PAPolyline::remove_repeat_pos(double eps) noexcept {
  if (PA_UNLIKELY(!pa::Math::is_finite(eps) || eps < 0.0))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  try {
    PAPolyline tmp;
    pa::Geometry::remove_repeat_pos(tmp, *this, eps);
    swap(tmp);
  }
  catch (const std::bad_alloc&) {
    return pa_make_error(PA_ERROR_OUT_OF_MEMORY);
  }

  return PA_SUCCESS;
}

PAResult PAPolyline::remove_redundant(double eps) noexcept {
  if (PA_UNLIKELY(!pa::Math::is_finite(eps) || eps < 0.0))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  try {
    PAPolyline tmp;
    pa::Geometry::remove_redundant(tmp, *this, eps);
    swap(tmp);
  }
  catch (const std::bad_alloc&) {
    return pa_make_error(PA_ERROR_OUT_OF_MEMORY);
  }

  return PA_SUCCESS;
}

PAResult PAPolyline::rotate_start(size_t segment_index, const PAPoint& pt, double eps) noexcept {
  if (PA_UNLIKELY(!_closed || segment_index >= size() || !pa::Math::is_finite(pt)))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  if (PA_UNLIKELY(size() < 2u))
    return pa_make_error(PA_ERROR_TOO_FEW_VERTICES);

  try {
    PAPolyline tmp;
    pa::Geometry::rotate_start(tmp, *this, segment_index, pt, eps);
    swap(tmp);
  }
  catch (const std::bad_alloc&) {
    return pa_make_error(PA_ERROR_OUT_OF_MEMORY);
  }

  return PA_SUCCESS;
}

void PAPolyline::scale(double factor) noexcept {
  pa::Geometry::scale(*this, factor);
}

void PAPolyline::translate(double dx, double dy) noexcept {
  pa::Geometry::translate(*this, dx, dy);
}

PAResult PAPolyline::arcs_to_approx_lines(PAPolyline* out, double error) const noexcept {
  if (PA_UNLIKELY(!out || !pa::Math::is_finite(error) || error <= 0.0))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  try {
    PAPolyline tmp;
    pa::Geometry::arcs_to_approx_lines(tmp, *this, error);
    out->swap(tmp);
  }
  catch (const std::bad_alloc&) {
    return pa_make_error(PA_ERROR_OUT_OF_MEMORY);
  }

  return PA_SUCCESS;
}
