// Compile-only self containment check for Transform.hpp
#include "VMath/Math/Transform.hpp"

static_assert(::vmath::TransformVector(::vmath::Mat4f::Identity(), ::vmath::Vec3f(1.0f)) == ::vmath::Vec3f(1.0f),
              "Transform.hpp must expose constexpr TransformVector");
