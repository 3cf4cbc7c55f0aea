// Compile-only self containment check for Matrix.hpp
#include "VMath/Math/Matrix.hpp"

static_assert(sizeof(::vmath::Mat4f) == 16u * sizeof(::vmath::float32), "Mat4f layout must stay 4x4 floats");
static_assert(sizeof(::vmath::Mat2d) == 4u * sizeof(::vmath::float64), "Mat2d layout must stay 2x2 doubles");
