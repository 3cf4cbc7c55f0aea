#pragma once

#include <cstdint>  // int32_t, uint32_t...
#include <cstddef>  // size_t, ptrdiff_t

// =============================
// Types.hpp
// =============================
// This header defines fixed-size and platform-consistent types
// used across the library. Vector/matrix scalars are always one
// of int32, float32 or float64.
// =============================

namespace vmath
{
// ---- Integer types ----
using int8 = std::int8_t;
using int16 = std::int16_t;
using int32 = std::int32_t;
using int64 = std::int64_t;

using uint8 = std::uint8_t;
using uint16 = std::uint16_t;
using uint32 = std::uint32_t;
using uint64 = std::uint64_t;

// ---- Floating point ----
using float32 = float;
using float64 = double;

// ---- Size and pointer-related ----
using usize = std::size_t;
using isize = std::ptrdiff_t;
} // namespace vmath

static_assert(sizeof(vmath::int32) == 4, "int32 must be 4 bytes");
static_assert(sizeof(vmath::uint32) == 4, "uint32 must be 4 bytes");
static_assert(sizeof(vmath::float32) == 4, "float32 must be IEEE-754 single precision");
static_assert(sizeof(vmath::float64) == 8, "float64 must be IEEE-754 double precision");
