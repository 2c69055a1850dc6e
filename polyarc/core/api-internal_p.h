// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_CORE_API_INTERNAL_P_H_INCLUDED
#define POLYARC_CORE_API_INTERNAL_P_H_INCLUDED

#include <polyarc/core/api.h>

// C Headers
// =========

// NOTE: Some headers are already included by <api.h>. This should be useful for creating an overview of what
// polyarc really needs globally to be included.
#include <math.h>
#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

// C++ Headers
// ===========

// Math::is_finite() and friends rely on <cmath> overloads. Containers used by the engines are only included by
// the translation units that need them.
#include <cmath>
#include <limits>
#include <new>

//! \cond INTERNAL
//! \addtogroup pa_globals
//! \{

// Internal Macros
// ===============

//! \def PA_HIDDEN
//!
//! Decorates a function that is used across more than one source file, but should never be exported. Expands to
//! a compiler-specific code that affects the visibility.
#if defined(__GNUC__) && !defined(__MINGW32__)
  #define PA_HIDDEN __attribute__((__visibility__("hidden")))
#else
  #define PA_HIDDEN
#endif

//! \def PA_API_IMPL
//!
//! Decorator used to mark all functions and variables that are exported. The public API takes C++ references so
//! it's not `extern "C"`.
#define PA_API_IMPL PA_API

#define PA_STRINGIFY_WRAP(N) #N
#define PA_STRINGIFY(N) PA_STRINGIFY_WRAP(N)

//! \def PA_NONCOPYABLE
//!
//! Makes a class noncopyable by making its copy constructor and copy assignment operator deleted.
#define PA_NONCOPYABLE(...)                                                   \
  __VA_ARGS__(const __VA_ARGS__& other) = delete;                             \
  __VA_ARGS__& operator=(const __VA_ARGS__& other) = delete;

//! \def PA_NOT_REACHED()
//!
//! Run-time assertion used in code that should never be reached.
#ifdef PA_BUILD_DEBUG
  #define PA_NOT_REACHED() pa_runtime_assertion_failure(__FILE__, __LINE__, "PA_NOT_REACHED()")
#elif defined(__GNUC__)
  #define PA_NOT_REACHED() __builtin_unreachable()
#else
  #define PA_NOT_REACHED() ((void)0)
#endif

#define PA_ARRAY_SIZE(X) uint32_t(sizeof(X) / sizeof(X[0]))

//! \}
//! \endcond

#endif // POLYARC_CORE_API_INTERNAL_P_H_INCLUDED
