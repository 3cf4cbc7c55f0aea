// Compile-only self containment check for Vector.hpp
#include "VMath/Math/Vector.hpp"

static_assert(sizeof(::vmath::Vec3f) == 3u * sizeof(::vmath::float32), "Vec3f layout must stay POD");
static_assert(sizeof(::vmath::Vec4i) == 4u * sizeof(::vmath::int32), "Vec4i layout must stay POD");
