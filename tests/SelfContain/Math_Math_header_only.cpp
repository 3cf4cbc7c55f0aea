// Compile-only self containment check for Math.hpp
#include "VMath/Math/Math.hpp"

static_assert(::vmath::Pi > 0.0f, "Math.hpp must expose Pi constant");
