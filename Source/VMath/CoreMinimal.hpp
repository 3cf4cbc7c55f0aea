// =============================
// CoreMinimal.hpp
// =============================
#pragma once

// This header is the minimal set of includes that any file in the library can include safely.
// Only headers with ZERO dependencies and stable purpose should be included here.
//
// Intent: Cross-platform, lightweight, no side effects, no runtime logic.

#include "VMath/Platform/PlatformCompiler.hpp"  // Detects compiler and defines FORCEINLINE etc.
#include "VMath/Platform/PlatformMacros.hpp"    // Likely, Unlikely, unused/array-count macros
#include "VMath/Types.hpp"                      // Core typedefs (int32, float32, etc.)
#include "VMath/Diagnostics/Check.hpp"          // VMATH_DEBUG, VMATH_CHECK, VMATH_VERIFY
#include "VMath/Logger.hpp"                     // Basic logging system and VMATH_ASSERT

// Other includes should be added only if they are minimal and always needed
