// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_CORE_TRACE_P_H_INCLUDED
#define POLYARC_CORE_TRACE_P_H_INCLUDED

#include <polyarc/core/api-internal_p.h>

#include <utility>

//! \cond INTERNAL
//! \addtogroup pa_internal
//! \{

namespace pa {

// pa::DummyTrace
// ==============

//! Dummy trace - no tracing, no runtime overhead.
class DummyTrace {
public:
  PA_INLINE bool enabled() const noexcept { return false; }
  PA_INLINE void indent() noexcept {}
  PA_INLINE void deindent() noexcept {}

  template<typename... Args>
  PA_INLINE void out(Args&&...) noexcept {}

  template<typename... Args>
  PA_INLINE void info(Args&&...) noexcept {}

  template<typename... Args>
  PA_INLINE bool warn(Args&&...) noexcept { return false; }

  template<typename... Args>
  PA_INLINE bool fail(Args&&...) noexcept { return false; }
};

// pa::DebugTrace
// ==============

//! Debug trace - active / enabled trace that can be useful during debugging.
class DebugTrace {
public:
  PA_INLINE DebugTrace() noexcept
    : indentation(0) {}
  PA_INLINE DebugTrace(const DebugTrace& other) noexcept
    : indentation(other.indentation) {}

  PA_INLINE bool enabled() const noexcept { return true; }
  PA_INLINE void indent() noexcept { indentation++; }
  PA_INLINE void deindent() noexcept { indentation--; }

  template<typename... Args>
  PA_INLINE void out(Args&&... args) noexcept { log(0, 0xFFFFFFFFu, std::forward<Args>(args)...); }

  template<typename... Args>
  PA_INLINE void info(Args&&... args) noexcept { log(0, indentation, std::forward<Args>(args)...); }

  template<typename... Args>
  PA_INLINE bool warn(Args&&... args) noexcept { log(1, indentation, std::forward<Args>(args)...); return false; }

  template<typename... Args>
  PA_INLINE bool fail(Args&&... args) noexcept { log(2, indentation, std::forward<Args>(args)...); return false; }

  PA_HIDDEN static void log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept;

  uint32_t indentation;
};

} // {pa}

//! \}
//! \endcond

#endif // POLYARC_CORE_TRACE_P_H_INCLUDED
