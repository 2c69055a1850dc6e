// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each polyarc source file. This means that any
// macros we might need to define to build 'polyarc' can be defined here instead of passing them to the compiler
// through command line.

#ifndef POLYARC_CORE_API_BUILD_P_H_INCLUDED
#define POLYARC_CORE_API_BUILD_P_H_INCLUDED

// Build - Export
// ==============

//! \cond INTERNAL

//! Export mode is on when `PA_BUILD_EXPORT` is defined - this MUST be defined before including any other header
//! as "api.h" uses `PA_BUILD_EXPORT` to define a proper `PA_API` decorator that is used by all exported functions
//! and variables.
#define PA_BUILD_EXPORT

//! \endcond

// Build - Configuration
// =====================

// #define PA_TRACE_ALL             // Trace everything below.
// #define PA_TRACE_OFFSET          // Trace offset engine (raw offset, slicing, stitching).
// #define PA_TRACE_BOOLEAN         // Trace boolean engine (intersects, slice classification, stitching).
//
// polyarc provides traces that can be enabled during development. Traces can help to understand how slices are
// created, pruned and joined and can be used to track bugs in degenerate inputs.

// Build - Compiler Diagnostics
// ============================

//! \cond NEVER

#if defined(__clang__)
  #pragma clang diagnostic warning "-Wattributes"
  #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
  #pragma GCC diagnostic warning "-Wattributes"
  #pragma GCC diagnostic ignored "-Wmaybe-uninitialized" // Unfortunately GCC emits lots of false positives.
  #pragma GCC diagnostic ignored "-Wunused-function"
#elif defined(_MSC_VER)
  #pragma warning(disable: 4127) // Conditional expression is constant.
  #pragma warning(disable: 4251) // Struct needs to have dll-interface.
  #pragma warning(disable: 4505) // Unreferenced local function has been removed.
  #pragma warning(disable: 4800) // Forcing value to bool true or false.
#endif

#ifdef _MSC_VER
  #if !defined(_CRT_SECURE_NO_WARNINGS)
    #define _CRT_SECURE_NO_WARNINGS
  #endif
#endif

//! \endcond

// Build - Globals
// ===============

#include <polyarc/core/api.h>
#include <polyarc/core/api-internal_p.h>

#endif // POLYARC_CORE_API_BUILD_P_H_INCLUDED
