// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_test_p.h>
#if defined(PA_TEST)

#include <polyarc/core/runtime.h>

#include <string.h>

// PARuntime - Tests
// =================

namespace pa {
namespace Tests {

UNIT(runtime_build_info, PA_TEST_GROUP_CORE_UTILITIES) {
  PARuntimeBuildInfo info;
  info.reset();

  EXPECT_SUCCESS(pa_runtime_query_build_info(&info));
  EXPECT_EQ(info.major_version, uint32_t(PA_VERSION >> 16));
  EXPECT_EQ(info.minor_version, uint32_t((PA_VERSION >> 8) & 0xFF));
  EXPECT_EQ(info.patch_version, uint32_t(PA_VERSION & 0xFF));
  EXPECT_NE(strlen(info.compiler_info), 0u);

  EXPECT_EQ(pa_runtime_query_build_info(nullptr), PAResult(PA_ERROR_INVALID_VALUE));
}

UNIT(runtime_message, PA_TEST_GROUP_CORE_UTILITIES) {
  EXPECT_SUCCESS(pa_runtime_message_fmt("[polyarc] runtime message %u\n", 1u));
}

} // {Tests}
} // {pa}

#endif // PA_TEST
