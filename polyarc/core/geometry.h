// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_CORE_GEOMETRY_H_INCLUDED
#define POLYARC_CORE_GEOMETRY_H_INCLUDED

#include <polyarc/core/api.h>

//! \addtogroup pa_geometry
//! \{

//! Orientation (winding direction) of a polyline.
PA_DEFINE_ENUM(PAOrientation) {
  //! The polyline is open and has no orientation.
  PA_ORIENTATION_OPEN = 0,
  //! Clockwise orientation (negative signed area).
  PA_ORIENTATION_CLOCKWISE = 1,
  //! Counter-clockwise orientation (positive signed area).
  PA_ORIENTATION_COUNTER_CLOCKWISE = 2,

  //! Maximum value of `PAOrientation`.
  PA_ORIENTATION_MAX_VALUE = 2

  PA_FORCE_ENUM_UINT32(PA_ORIENTATION)
};

//! Point specified as [x, y] using `double` as a storage type.
struct PAPoint {
  double x;
  double y;

  PA_INLINE_NODEBUG PAPoint() noexcept = default;
  PA_INLINE_CONSTEXPR PAPoint(const PAPoint&) noexcept = default;

  PA_INLINE_CONSTEXPR PAPoint(double x, double y) noexcept
    : x(x),
      y(y) {}

  PA_INLINE_NODEBUG PAPoint& operator=(const PAPoint& other) noexcept = default;

  [[nodiscard]]
  PA_INLINE_NODEBUG bool operator==(const PAPoint& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool operator!=(const PAPoint& other) const noexcept { return !equals(other); }

  PA_INLINE_NODEBUG void reset() noexcept { reset(0, 0); }
  PA_INLINE_NODEBUG void reset(const PAPoint& other) noexcept { reset(other.x, other.y); }
  PA_INLINE_NODEBUG void reset(double x_value, double y_value) noexcept {
    x = x_value;
    y = y_value;
  }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool equals(const PAPoint& other) const noexcept {
    return PAInternal::bool_and(x == other.x, y == other.y);
  }
};

//! Box specified as [x0, y0, x1, y1] using `double` as a storage type.
struct PABox {
  double x0;
  double y0;
  double x1;
  double y1;

  PA_INLINE_NODEBUG PABox() noexcept = default;
  PA_INLINE_CONSTEXPR PABox(const PABox&) noexcept = default;

  PA_INLINE_CONSTEXPR PABox(double x0, double y0, double x1, double y1) noexcept
    : x0(x0),
      y0(y0),
      x1(x1),
      y1(y1) {}

  PA_INLINE_NODEBUG PABox& operator=(const PABox& other) noexcept = default;

  [[nodiscard]]
  PA_INLINE_NODEBUG bool operator==(const PABox& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool operator!=(const PABox& other) const noexcept { return !equals(other); }

  PA_INLINE_NODEBUG void reset() noexcept { reset(0.0, 0.0, 0.0, 0.0); }
  PA_INLINE_NODEBUG void reset(const PABox& other) noexcept { reset(other.x0, other.y0, other.x1, other.y1); }
  PA_INLINE_NODEBUG void reset(double x0_value, double y0_value, double x1_value, double y1_value) noexcept {
    x0 = x0_value;
    y0 = y0_value;
    x1 = x1_value;
    y1 = y1_value;
  }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool equals(const PABox& other) const noexcept {
    return PAInternal::bool_and(x0 == other.x0, y0 == other.y0, x1 == other.x1, y1 == other.y1);
  }

  [[nodiscard]]
  PA_INLINE_NODEBUG double width() const noexcept { return x1 - x0; }

  [[nodiscard]]
  PA_INLINE_NODEBUG double height() const noexcept { return y1 - y0; }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool contains(double x, double y) const noexcept {
    return PAInternal::bool_and(x >= x0, y >= y0, x <= x1, y <= y1);
  }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool contains(const PAPoint& pt) const noexcept { return contains(pt.x, pt.y); }
};

//! Polyline vertex specified as [x, y, bulge] using `double` as a storage type.
//!
//! The bulge describes the segment that starts at this vertex and ends at the next one. Zero bulge is a straight
//! line, otherwise the segment is a circular arc with an included angle of `4 * atan(|bulge|)`. A positive bulge
//! winds counter-clockwise, a negative bulge winds clockwise.
struct PAVertex {
  double x;
  double y;
  double bulge;

  PA_INLINE_NODEBUG PAVertex() noexcept = default;
  PA_INLINE_CONSTEXPR PAVertex(const PAVertex&) noexcept = default;

  PA_INLINE_CONSTEXPR PAVertex(double x, double y, double bulge = 0.0) noexcept
    : x(x),
      y(y),
      bulge(bulge) {}

  PA_INLINE_CONSTEXPR PAVertex(const PAPoint& pos, double bulge = 0.0) noexcept
    : x(pos.x),
      y(pos.y),
      bulge(bulge) {}

  PA_INLINE_NODEBUG PAVertex& operator=(const PAVertex& other) noexcept = default;

  [[nodiscard]]
  PA_INLINE_NODEBUG bool operator==(const PAVertex& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool operator!=(const PAVertex& other) const noexcept { return !equals(other); }

  PA_INLINE_NODEBUG void reset(double x_value, double y_value, double bulge_value) noexcept {
    x = x_value;
    y = y_value;
    bulge = bulge_value;
  }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool equals(const PAVertex& other) const noexcept {
    return PAInternal::bool_and(x == other.x, y == other.y, bulge == other.bulge);
  }

  //! Returns the vertex position.
  [[nodiscard]]
  PA_INLINE_CONSTEXPR PAPoint pos() const noexcept { return PAPoint(x, y); }

  [[nodiscard]]
  PA_INLINE_CONSTEXPR bool is_line() const noexcept { return bulge == 0.0; }

  [[nodiscard]]
  PA_INLINE_CONSTEXPR bool is_arc() const noexcept { return bulge != 0.0; }

  [[nodiscard]]
  PA_INLINE_CONSTEXPR bool is_ccw() const noexcept { return bulge > 0.0; }

  [[nodiscard]]
  PA_INLINE_CONSTEXPR PAVertex with_bulge(double bulge_value) const noexcept { return PAVertex(x, y, bulge_value); }
};

//! \}

//! \cond INTERNAL
//! \name Point Operators
//! \{

static PA_INLINE_CONSTEXPR PAPoint operator-(const PAPoint& a) noexcept { return PAPoint(-a.x, -a.y); }

static PA_INLINE_CONSTEXPR PAPoint operator*(const PAPoint& a, double b) noexcept { return PAPoint(a.x * b, a.y * b); }
static PA_INLINE_CONSTEXPR PAPoint operator/(const PAPoint& a, double b) noexcept { return PAPoint(a.x / b, a.y / b); }
static PA_INLINE_CONSTEXPR PAPoint operator*(double a, const PAPoint& b) noexcept { return PAPoint(a * b.x, a * b.y); }

static PA_INLINE_CONSTEXPR PAPoint operator+(const PAPoint& a, const PAPoint& b) noexcept { return PAPoint(a.x + b.x, a.y + b.y); }
static PA_INLINE_CONSTEXPR PAPoint operator-(const PAPoint& a, const PAPoint& b) noexcept { return PAPoint(a.x - b.x, a.y - b.y); }

static PA_INLINE_NODEBUG PAPoint& operator*=(PAPoint& a, double b) noexcept { a.reset(a.x * b, a.y * b); return a; }
static PA_INLINE_NODEBUG PAPoint& operator/=(PAPoint& a, double b) noexcept { a.reset(a.x / b, a.y / b); return a; }

static PA_INLINE_NODEBUG PAPoint& operator+=(PAPoint& a, const PAPoint& b) noexcept { a.reset(a.x + b.x, a.y + b.y); return a; }
static PA_INLINE_NODEBUG PAPoint& operator-=(PAPoint& a, const PAPoint& b) noexcept { a.reset(a.x - b.x, a.y - b.y); return a; }

//! \}
//! \endcond

#endif // POLYARC_CORE_GEOMETRY_H_INCLUDED
