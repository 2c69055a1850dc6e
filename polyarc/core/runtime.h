// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_CORE_RUNTIME_H_INCLUDED
#define POLYARC_CORE_RUNTIME_H_INCLUDED

#include <polyarc/core/api.h>

//! \addtogroup pa_runtime
//! \{

//! polyarc runtime build type.
PA_DEFINE_ENUM(PARuntimeBuildType) {
  //! Describes a polyarc debug build.
  PA_RUNTIME_BUILD_TYPE_DEBUG = 0,
  //! Describes a polyarc release build.
  PA_RUNTIME_BUILD_TYPE_RELEASE = 1

  PA_FORCE_ENUM_UINT32(PA_RUNTIME_BUILD_TYPE)
};

//! polyarc build information.
struct PARuntimeBuildInfo {
  //! Major version number.
  uint32_t major_version;
  //! Minor version number.
  uint32_t minor_version;
  //! Patch version number.
  uint32_t patch_version;

  //! polyarc build type, see `PARuntimeBuildType`.
  uint32_t build_type;

  //! Identification of the C++ compiler used to build polyarc.
  char compiler_info[32];

  PA_INLINE_NODEBUG void reset() noexcept { *this = PARuntimeBuildInfo{}; }
};

//! Queries build information of the polyarc library.
PA_API PAResult pa_runtime_query_build_info(PARuntimeBuildInfo* info_out) noexcept;

//! Writes `msg` to the runtime output (`stderr`).
PA_API PAResult pa_runtime_message_out(const char* msg) noexcept;

//! Formats a message and writes it to the runtime output.
PA_API PAResult pa_runtime_message_fmt(const char* fmt, ...) noexcept;

//! Formats a message (`va_list` version) and writes it to the runtime output.
PA_API PAResult pa_runtime_message_vfmt(const char* fmt, va_list ap) noexcept;

//! Interface to access polyarc runtime.
namespace PARuntime {

static PA_INLINE_NODEBUG PAResult query_build_info(PARuntimeBuildInfo* out) noexcept { return pa_runtime_query_build_info(out); }

template<typename... Args>
static PA_INLINE_NODEBUG PAResult message(const char* fmt, Args&&... args) noexcept { return pa_runtime_message_fmt(fmt, args...); }

} // {PARuntime}

//! \}

#endif // POLYARC_CORE_RUNTIME_H_INCLUDED
