// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each polyarc test file.

#ifndef POLYARC_CORE_API_BUILD_TEST_P_H_INCLUDED
#define POLYARC_CORE_API_BUILD_TEST_P_H_INCLUDED

#include <polyarc/core/api-build_p.h>

// pa::Build - Tests
// =================

//! \cond NEVER
// Make sure '#ifdef'ed unit tests are not disabled by IDE.
#if !defined(PA_TEST) && defined(__INTELLISENSE__)
  #define PA_TEST
#endif
//! \endcond

// Include a unit testing package if this is a `pa_test_runner` build.
#if defined(PA_TEST)

#include <gtest/gtest.h>
#include <stdarg.h>
#include <stdio.h>

//! \cond INTERNAL
#define EXPECT_SUCCESS(...) EXPECT_EQ(PAResult(__VA_ARGS__), PAResult(PA_SUCCESS))

//! Defines a unit test `NAME` that belongs to the test group `GROUP`.
#define UNIT(NAME, GROUP) TEST(GROUP, NAME)

//! Prints an informative message that describes the part of a unit test being executed.
#define INFO(...) ::pa::Tests::info(__VA_ARGS__)

//! polyarc test groups.
#define PA_TEST_GROUP_SUPPORT_UTILITIES PolyarcSupportUtilities
#define PA_TEST_GROUP_CORE_UTILITIES PolyarcCoreUtilities
#define PA_TEST_GROUP_GEOMETRY_UTILITIES PolyarcGeometryUtilities
#define PA_TEST_GROUP_GEOMETRY_INTERSECTION PolyarcGeometryIntersection
#define PA_TEST_GROUP_GEOMETRY_CONTAINERS PolyarcGeometryContainers
#define PA_TEST_GROUP_GEOMETRY_OFFSET PolyarcGeometryOffset
#define PA_TEST_GROUP_GEOMETRY_BOOLEAN PolyarcGeometryBoolean

namespace pa {
namespace Tests {

static inline void info(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  fputs("  ", stdout);
  vfprintf(stdout, fmt, ap);
  fputc('\n', stdout);
  va_end(ap);
}

} // {Tests}
} // {pa}
//! \endcond

#endif // PA_TEST

#endif // POLYARC_CORE_API_BUILD_TEST_P_H_INCLUDED
