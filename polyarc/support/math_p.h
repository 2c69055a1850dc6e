// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_SUPPORT_MATH_P_H_INCLUDED
#define POLYARC_SUPPORT_MATH_P_H_INCLUDED

#include <polyarc/core/api-internal_p.h>
#include <polyarc/core/geometry.h>
#include <polyarc/support/mathconst_p.h>

#include <utility>

//! \cond INTERNAL
//! \addtogroup polyarc_support
//! \{

namespace pa {
namespace Math {
namespace {

//! \name Floating Point Constants
//! \{

//! Returns infinity of `T` type.
//!
//! \note `T` should be floating point.
template<typename T>
[[nodiscard]]
static PA_INLINE_CONSTEXPR T inf() noexcept { return std::numeric_limits<T>::infinity(); }

//! \}

//! \name Floating Point Testing
//! \{

static PA_INLINE_NODEBUG bool is_finite(const double& x) noexcept { return std::isfinite(x); }

static PA_INLINE_NODEBUG bool is_finite(const PAPoint& p) noexcept;
static PA_INLINE_NODEBUG bool is_finite(const PAVertex& v) noexcept;

template<typename T, typename... Args>
static PA_INLINE_NODEBUG bool is_finite(T first, Args&&... args) noexcept {
  return PAInternal::bool_and(is_finite(first), (is_finite(std::forward<Args>(args)))...);
}

static PA_INLINE_NODEBUG bool is_finite(const PAPoint& p) noexcept { return is_finite(p.x, p.y); }
static PA_INLINE_NODEBUG bool is_finite(const PAVertex& v) noexcept { return is_finite(v.x, v.y, v.bulge); }

//! \}

//! \name Miscellaneous Functions
//! \{

static PA_INLINE_NODEBUG double copy_sign(double x, double y) noexcept { return std::copysign(x, y); }

static PA_INLINE_NODEBUG double floor(double x) noexcept { return ::floor(x); }
static PA_INLINE_NODEBUG double ceil(double x) noexcept { return ::ceil(x); }

//! Returns `x` wrapped into `[0, y)` range.
template<typename T>
static PA_INLINE_NODEBUG T repeat(const T& x, const T& y) noexcept {
  T a = x;
  if (a >= y || a <= -y)
    a = std::fmod(a, y);
  if (a < T(0))
    a += y;
  return a;
}

//! \}

//! \name Power Functions
//! \{

static PA_INLINE_NODEBUG double sqrt(double x) noexcept { return ::sqrt(x); }

//! \}

//! \name Trigonometric Functions
//! \{

static PA_INLINE_NODEBUG double sin(double x) noexcept { return ::sin(x); }
static PA_INLINE_NODEBUG double cos(double x) noexcept { return ::cos(x); }
static PA_INLINE_NODEBUG double tan(double x) noexcept { return ::tan(x); }
static PA_INLINE_NODEBUG double acos(double x) noexcept { return ::acos(x); }
static PA_INLINE_NODEBUG double atan(double x) noexcept { return ::atan(x); }
static PA_INLINE_NODEBUG double atan2(double y, double x) noexcept { return ::atan2(y, x); }

//! \}

//! \name Linear Interpolation
//! \{

//! Linear interpolation of `a` and `b` at `t`.
//!
//! Returns `(a - t * a) + t * b`.
template<typename V, typename T = double>
static PA_INLINE_NODEBUG V lerp(const V& a, const V& b, const T& t) noexcept {
  return (a - t * a) + t * b;
}

//! Linear interpolation of `a` and `b` at `t=0.5`.
template<typename T>
static PA_INLINE_NODEBUG T lerp(const T& a, const T& b) noexcept {
  return 0.5 * a + 0.5 * b;
}

//! \}

//! \name Quadratic Roots
//! \{

//! Solves `a*t^2 + b*t + c = 0` and stores roots within [t_min, t_max] into `dst`, sorted.
//!
//! Negative discriminant is clamped to zero, so a near miss is reported as a double root. Callers that need to
//! distinguish a miss must check the discriminant themselves.
static PA_INLINE size_t quad_roots(double dst[2], double a, double b, double c, double t_min, double t_max) noexcept {
  double d = pa_max(b * b - 4.0 * a * c, 0.0);
  double s = sqrt(d);
  double q = -0.5 * (b + copy_sign(s, b));

  double t0 = q / a;
  double t1 = c / q;

  double x0 = pa_min(t0, t1);
  double x1 = pa_max(t1, t0);

  dst[0] = x0;
  size_t n = size_t((x0 >= t_min) & (x0 <= t_max));

  dst[n] = x1;
  n += size_t((x1 > x0) & (x1 >= t_min) & (x1 <= t_max));

  return n;
}

//! \}

} // {anonymous}
} // {Math}
} // {pa}

//! \}
//! \endcond

#endif // POLYARC_SUPPORT_MATH_P_H_INCLUDED
