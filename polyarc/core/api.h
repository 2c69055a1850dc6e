// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_CORE_API_H_INCLUDED
#define POLYARC_CORE_API_H_INCLUDED

// C Headers
// =========

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>

//! \addtogroup pa_globals
//! \{

// Version
// =======

//! Makes a version number representing a `MAJOR.MINOR.PATCH` combination.
#define PA_MAKE_VERSION(MAJOR, MINOR, PATCH) (((MAJOR) << 16) | ((MINOR) << 8) | (PATCH))

//! polyarc library version.
#define PA_VERSION PA_MAKE_VERSION(0, 3, 0)

// Build Type
// ==========

//! \cond INTERNAL
#if !defined(PA_BUILD_DEBUG) && !defined(PA_BUILD_RELEASE)
  #if !defined(NDEBUG)
    #define PA_BUILD_DEBUG
  #else
    #define PA_BUILD_RELEASE
  #endif
#endif
//! \endcond

// Public Macros
// =============

//! \def PA_API
//!
//! A base API decorator that marks functions and variables exported by polyarc.
#if !defined(PA_STATIC)
  #if defined(_WIN32) && (defined(_MSC_VER) || defined(__MINGW32__))
    #if defined(PA_BUILD_EXPORT)
      #define PA_API __declspec(dllexport)
    #else
      #define PA_API __declspec(dllimport)
    #endif
  #elif defined(_WIN32) && defined(__GNUC__)
    #if defined(PA_BUILD_EXPORT)
      #define PA_API __attribute__((__dllexport__))
    #else
      #define PA_API __attribute__((__dllimport__))
    #endif
  #elif defined(__GNUC__)
    #define PA_API __attribute__((__visibility__("default")))
  #endif
#endif

#if !defined(PA_API)
  #define PA_API
#endif

//! \def PA_INLINE
//!
//! Marks functions that should always be inlined.
#if defined(__GNUC__) && !defined(PA_BUILD_DEBUG)
  #define PA_INLINE inline __attribute__((__always_inline__))
#elif defined(_MSC_VER) && !defined(PA_BUILD_DEBUG)
  #define PA_INLINE __forceinline
#else
  #define PA_INLINE inline
#endif

//! \def PA_INLINE_NODEBUG
//!
//! The same as `PA_INLINE`, but the function is also excluded from debug information where supported.
#if defined(__clang__)
  #define PA_INLINE_NODEBUG inline __attribute__((__always_inline__, __nodebug__))
#elif defined(__GNUC__)
  #define PA_INLINE_NODEBUG inline __attribute__((__always_inline__, __artificial__))
#else
  #define PA_INLINE_NODEBUG inline
#endif

//! \def PA_INLINE_CONSTEXPR
//!
//! Like `PA_INLINE_NODEBUG`, but also `constexpr`.
#define PA_INLINE_CONSTEXPR constexpr PA_INLINE_NODEBUG

//! \def PA_NORETURN
//!
//! Function attribute used to mark functions that never return.
#if defined(__GNUC__)
  #define PA_NORETURN __attribute__((__noreturn__))
#elif defined(_MSC_VER)
  #define PA_NORETURN __declspec(noreturn)
#else
  #define PA_NORETURN
#endif

//! \def PA_LIKELY(EXP)
//!
//! Hints the compiler that the expression `EXP` is likely to be true.
//!
//! \def PA_UNLIKELY(EXP)
//!
//! Hints the compiler that the expression `EXP` is unlikely to be true.
#if defined(__GNUC__)
  #define PA_LIKELY(...) __builtin_expect(!!(__VA_ARGS__), 1)
  #define PA_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)
#else
  #define PA_LIKELY(...) (__VA_ARGS__)
  #define PA_UNLIKELY(...) (__VA_ARGS__)
#endif

//! \def PA_DEFINE_ENUM(NAME)
//!
//! Defines an enumeration used by polyarc that is `uint32_t`.
#define PA_DEFINE_ENUM(NAME) enum NAME : uint32_t

//! \cond INTERNAL
#define PA_FORCE_ENUM_UINT32(ENUM_VALUE_PREFIX) \
  ,ENUM_VALUE_PREFIX##_FORCE_UINT = 0xFFFFFFFFu
//! \endcond

//! \def PA_ASSERT(EXP)
//!
//! Run-time assertion executed in debug builds.
#if defined(PA_BUILD_DEBUG)
  #define PA_ASSERT(EXP)                                                      \
    do {                                                                      \
      if (PA_UNLIKELY(!(EXP))) {                                              \
        pa_runtime_assertion_failure(__FILE__, __LINE__, #EXP);               \
      }                                                                       \
    } while (0)
#else
  #define PA_ASSERT(EXP) ((void)0)
#endif

//! \def PA_PROPAGATE(...)
//!
//! Executes the code within the macro and returns if it returned any value other than `PA_SUCCESS`.
#define PA_PROPAGATE(...)                                                     \
  do {                                                                        \
    PAResult result_to_propagate = (__VA_ARGS__);                             \
    if (PA_UNLIKELY(result_to_propagate != PA_SUCCESS)) {                     \
      return result_to_propagate;                                             \
    }                                                                         \
  } while (0)

//! \}

// Result Codes
// ============

//! \addtogroup pa_globals
//! \{

//! Result code used by most polyarc functions (32-bit unsigned integer).
//!
//! The `PAResultCode` enumeration contains polyarc result codes. A zero value means success, anything else is
//! an error that describes why the operation was not attempted or did not finish.
typedef uint32_t PAResult;

//! Result code.
PA_DEFINE_ENUM(PAResultCode) {
  //! Successful result code.
  PA_SUCCESS = 0,

  //! First error code, used to distinguish polyarc errors from other errors.
  PA_ERROR_START_INDEX = 0x00010000u,

  //! Out of memory.
  PA_ERROR_OUT_OF_MEMORY = 0x00010000u,
  //! Invalid value or argument (non-finite distance, invalid option, null output, unknown operator).
  PA_ERROR_INVALID_VALUE,
  //! Invalid polyline geometry (a non-finite coordinate or bulge, or a boolean input that encloses no area).
  PA_ERROR_INVALID_GEOMETRY,
  //! The operation requires a closed polyline.
  PA_ERROR_NOT_CLOSED,
  //! The polyline has fewer vertices than the operation requires.
  PA_ERROR_TOO_FEW_VERTICES,
  //! An arc connects two coincident vertices and has no radius.
  PA_ERROR_DEGENERATE_ARC,
  //! The polyline intersects itself where a simple polyline is required.
  PA_ERROR_SELF_INTERSECTING,

  //! Maximum value of `PAResultCode`.
  PA_RESULT_CODE_MAX_VALUE = PA_ERROR_SELF_INTERSECTING

  PA_FORCE_ENUM_UINT32(PA_RESULT_CODE)
};

//! \}

// Public API - Runtime Assertions
// ===============================

//! \addtogroup pa_runtime
//! \{

//! Called by `PA_ASSERT()` when an internal invariant does not hold.
PA_API PA_NORETURN void pa_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept;

//! \}

// Internal Utilities
// ==================

//! \cond INTERNAL

//! Returns the `result` passed.
//!
//! Provided for debugging purposes. Putting a breakpoint inside `pa_make_error()` shows the origin of any error
//! returned by polyarc.
static PA_INLINE_NODEBUG PAResult pa_make_error(PAResult result) noexcept { return result; }

//! Internal namespace that contains helpers shared by public headers.
namespace PAInternal {

template<typename T>
static PA_INLINE_CONSTEXPR bool bool_and(const T& v) noexcept { return bool(v); }

template<typename T, typename... Args>
static PA_INLINE_CONSTEXPR bool bool_and(const T& v, Args&&... args) noexcept { return bool(v) & bool_and(args...); }

} // {PAInternal}

//! Returns the minimum of `a` and `b`.
template<typename T>
static PA_INLINE_CONSTEXPR T pa_min(const T& a, const T& b) noexcept { return b < a ? b : a; }

//! Returns the maximum of `a` and `b`.
template<typename T>
static PA_INLINE_CONSTEXPR T pa_max(const T& a, const T& b) noexcept { return a < b ? b : a; }

//! Returns the minimum of all arguments.
template<typename T, typename... Args>
static PA_INLINE_CONSTEXPR T pa_min(const T& a, const T& b, Args&&... args) noexcept { return pa_min(pa_min(a, b), args...); }

//! Returns the maximum of all arguments.
template<typename T, typename... Args>
static PA_INLINE_CONSTEXPR T pa_max(const T& a, const T& b, Args&&... args) noexcept { return pa_max(pa_max(a, b), args...); }

//! Returns the absolute value of `a`.
template<typename T>
static PA_INLINE_CONSTEXPR T pa_abs(const T& a) noexcept { return a < T(0) ? -a : a; }

//! Clamps `value` to `[lo, hi]` range.
template<typename T>
static PA_INLINE_CONSTEXPR T pa_clamp(const T& value, const T& lo, const T& hi) noexcept { return pa_min(pa_max(value, lo), hi); }

//! \endcond

#endif // POLYARC_CORE_API_H_INCLUDED
