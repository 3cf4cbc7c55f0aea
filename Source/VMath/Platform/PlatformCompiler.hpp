// =============================
// PlatformCompiler.hpp
// =============================
#pragma once

// Compiler/attributes helpers.
// Keep simple. Prefer standard C++ attributes where possible.

// -----------------------------
// Compiler detection
// -----------------------------
#if defined(_MSC_VER)
#define VMATH_COMPILER_MSVC 1
#else
#define VMATH_COMPILER_MSVC 0
#endif

#if defined(__clang__)
#define VMATH_COMPILER_CLANG 1
#else
#define VMATH_COMPILER_CLANG 0
#endif

#if defined(__GNUC__) && !VMATH_COMPILER_CLANG
#define VMATH_COMPILER_GCC 1
#else
#define VMATH_COMPILER_GCC 0
#endif

// -----------------------------
// printf-style format checking for logger entry points
// -----------------------------
#if VMATH_COMPILER_GCC || VMATH_COMPILER_CLANG
#define VMATH_PRINTF_FORMAT(fmtIndex, firstArg) __attribute__((format(printf, fmtIndex, firstArg)))
#else
#define VMATH_PRINTF_FORMAT(fmtIndex, firstArg)
#endif
