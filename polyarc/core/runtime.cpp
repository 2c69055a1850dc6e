// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_p.h>
#include <polyarc/core/runtime.h>

#include <stdio.h>

#if defined(_WIN32)
  #include <windows.h>
#endif

// PARuntime - Build Information
// =============================

static const PARuntimeBuildInfo pa_runtime_build_info = {
  // polyarc major version.
  (PA_VERSION >> 16),
  // polyarc minor version.
  (PA_VERSION >> 8) & 0xFF,
  // polyarc patch version.
  (PA_VERSION >> 0) & 0xFF,

  // Build Type.
#ifdef PA_BUILD_DEBUG
  PA_RUNTIME_BUILD_TYPE_DEBUG,
#else
  PA_RUNTIME_BUILD_TYPE_RELEASE,
#endif

  // Compiler Info.
#if defined(__clang_minor__)
  "Clang " PA_STRINGIFY(__clang_major__) "." PA_STRINGIFY(__clang_minor__)
#elif defined(__GNUC_MINOR__)
  "GCC "  PA_STRINGIFY(__GNUC__) "." PA_STRINGIFY(__GNUC_MINOR__)
#elif defined(_MSC_VER)
  "MSC"
#else
  "Unknown"
#endif
};

// PARuntime - API - Query Info
// ============================

PA_API_IMPL PAResult pa_runtime_query_build_info(PARuntimeBuildInfo* info_out) noexcept {
  if (PA_UNLIKELY(!info_out))
    return pa_make_error(PA_ERROR_INVALID_VALUE);

  memcpy(info_out, &pa_runtime_build_info, sizeof(PARuntimeBuildInfo));
  return PA_SUCCESS;
}

// PARuntime - API - Message
// =========================

PA_API_IMPL PAResult pa_runtime_message_out(const char* msg) noexcept {
#if defined(_WIN32)
  // Support both Console and GUI applications on Windows.
  OutputDebugStringA(msg);
#endif

  fputs(msg, stderr);
  return PA_SUCCESS;
}

PA_API_IMPL PAResult pa_runtime_message_fmt(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  PAResult result = pa_runtime_message_vfmt(fmt, ap);
  va_end(ap);

  return result;
}

PA_API_IMPL PAResult pa_runtime_message_vfmt(const char* fmt, va_list ap) noexcept {
  char buf[1024];
  vsnprintf(buf, PA_ARRAY_SIZE(buf), fmt, ap);
  return pa_runtime_message_out(buf);
}

// PARuntime - API - Failure
// =========================

PA_API_IMPL void pa_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept {
  pa_runtime_message_fmt("[polyarc] ASSERTION FAILURE: '%s' at '%s' [line %d]\n", msg, file, line);
  abort();
}
