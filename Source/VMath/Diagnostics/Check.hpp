#pragma once
//
// VMath - Diagnostics/Check.hpp
// Centralized lightweight diagnostics macros (no heavy deps).
//
// Provided:
//   - VMATH_CHECK(cond): soft check (no-op in Release). In Debug, optional breakpoint.
//   - VMATH_VERIFY(cond): always evaluates cond; in Debug can optionally break.
//
// Not provided here (to avoid clashes with Logger.hpp):
//   - VMATH_ASSERT(...) -> lives in Logger.hpp (rich formatting).
//
// Optional toggles (define before including this header):
//   - VMATH_CHECK_BREAK   : if defined, VMATH_CHECK will break in Debug when cond fails
//   - VMATH_VERIFY_BREAK  : if defined, VMATH_VERIFY will break in Debug when cond fails
//

// ----------------------------------------------------------------------------
// Debug detection (respects user-defined VMATH_DEBUG; falls back to !NDEBUG)
// ----------------------------------------------------------------------------
#ifndef VMATH_DEBUG
#  ifndef NDEBUG
#    define VMATH_DEBUG 1
#  else
#    define VMATH_DEBUG 0
#  endif
#endif

// ----------------------------------------------------------------------------
// Internal cross-compiler debug break helper (Debug only)
// ----------------------------------------------------------------------------
#if VMATH_DEBUG
#  if defined(_MSC_VER)
#    define VMATH_INTERNAL_DEBUG_BREAK() __debugbreak()
#  elif defined(__clang__) || defined(__GNUC__)
#    define VMATH_INTERNAL_DEBUG_BREAK() __builtin_trap()
#  else
#    include <cstdlib>
#    define VMATH_INTERNAL_DEBUG_BREAK() std::abort()
#  endif
#else
#  define VMATH_INTERNAL_DEBUG_BREAK() ((void)0)
#endif

// ----------------------------------------------------------------------------
// VMATH_CHECK: soft check
//  - Release: no-op
//  - Debug:   by default no break (non-intrusive); define VMATH_CHECK_BREAK to break
// ----------------------------------------------------------------------------
#ifndef VMATH_CHECK
#  if VMATH_DEBUG
#    ifdef VMATH_CHECK_BREAK
#      define VMATH_CHECK(cond) do { if(!(cond)) { VMATH_INTERNAL_DEBUG_BREAK(); } } while(0)
#    else
#      define VMATH_CHECK(cond) do { if(!(cond)) { /* optional breakpoint in debug */ } } while(0)
#    endif
#  else
#    define VMATH_CHECK(cond) ((void)0)
#  endif
#endif

// ----------------------------------------------------------------------------
// VMATH_VERIFY: like assert but always evaluates `cond`
//  - Release: evaluates cond for side effects, no break
//  - Debug:   define VMATH_VERIFY_BREAK to break on failure
// ----------------------------------------------------------------------------
#ifndef VMATH_VERIFY
#  if VMATH_DEBUG
#    ifdef VMATH_VERIFY_BREAK
#      define VMATH_VERIFY(cond) do { if(!(cond)) { VMATH_INTERNAL_DEBUG_BREAK(); } } while(0)
#    else
#      define VMATH_VERIFY(cond) ((void)(cond))
#    endif
#  else
#    define VMATH_VERIFY(cond) ((void)(cond))
#  endif
#endif
