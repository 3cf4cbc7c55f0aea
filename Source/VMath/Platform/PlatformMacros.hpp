// =============================
// PlatformMacros.hpp
// =============================
#pragma once

// General-purpose lightweight macros safe across platforms.
// Includes: UNUSED, branch prediction.

// -----------------------------
// UNUSED(x)
// -----------------------------
#ifndef VMATH_UNUSED
#define VMATH_UNUSED(x) (void)(x)
#endif

// -----------------------------
// Branch prediction hints
// -----------------------------
#if defined(__GNUC__) || defined(__clang__)
#ifndef VMATH_LIKELY
#define VMATH_LIKELY(x)   __builtin_expect(!!(x), 1)
#endif
#ifndef VMATH_UNLIKELY
#define VMATH_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif
#else
  // Safe fallbacks
#ifndef VMATH_LIKELY
#define VMATH_LIKELY(x)   (!!(x))
#endif
#ifndef VMATH_UNLIKELY
#define VMATH_UNLIKELY(x) (!!(x))
#endif
#endif

// Keep this header minimal; prefer standard attributes (e.g. [[nodiscard]]) over macro aliases.
