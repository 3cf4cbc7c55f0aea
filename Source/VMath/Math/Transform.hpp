#pragma once
// ============================================================================
// VMath - Source/VMath/Math/Transform.hpp
// ----------------------------------------------------------------------------
// Purpose : Builders for rotation, view and projection matrices plus helpers to
//           apply affine transforms to points and directions.
// Contract: Right-handed, column-vector convention; projections map depth to [0,1].
//           Builders are real-only and explicitly instantiated for float32/float64
//           in Math.cpp.
// Notes   : Translation/Scale builders live on Mat2/Mat3/Mat4 themselves.
// ============================================================================

#include "VMath/Math/Matrix.hpp"

namespace vmath
{
    // ------------------------------------------------------------------------
    // Point / vector application
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Transform a 3D point by a homogeneous matrix.
    // Contract: Assumes w = 1 on input; divides by the resulting w when it is neither 1 nor ~0.
    // Notes   : Skips the divide for affine matrices so that the common path stays exact.
    // ---
    template <RealScalar T>
    [[nodiscard]] constexpr Vec3<T> TransformPoint(const Mat4<T>& m, const Vec3<T>& p) noexcept
    {
        const T x = m.m[0][0] * p.x + m.m[1][0] * p.y + m.m[2][0] * p.z + m.m[3][0];
        const T y = m.m[0][1] * p.x + m.m[1][1] * p.y + m.m[2][1] * p.z + m.m[3][1];
        const T z = m.m[0][2] * p.x + m.m[1][2] * p.y + m.m[2][2] * p.z + m.m[3][2];
        const T w = m.m[0][3] * p.x + m.m[1][3] * p.y + m.m[2][3] * p.z + m.m[3][3];

        if (Abs(w - T(1)) > EpsilonV<T> && Abs(w) > EpsilonV<T>)
        {
            const T invW = T(1) / w;
            return Vec3<T>(x * invW, y * invW, z * invW);
        }
        return Vec3<T>(x, y, z);
    }

    // Direction transform (w = 0): translation is ignored.
    template <RealScalar T>
    [[nodiscard]] constexpr Vec3<T> TransformVector(const Mat4<T>& m, const Vec3<T>& v) noexcept
    {
        return Vec3<T>(
            m.m[0][0] * v.x + m.m[1][0] * v.y + m.m[2][0] * v.z,
            m.m[0][1] * v.x + m.m[1][1] * v.y + m.m[2][1] * v.z,
            m.m[0][2] * v.x + m.m[1][2] * v.y + m.m[2][2] * v.z
        );
    }

    // 2D affine counterparts (Mat3 with translation in column 2).
    template <RealScalar T>
    [[nodiscard]] constexpr Vec2<T> TransformPoint(const Mat3<T>& m, const Vec2<T>& p) noexcept
    {
        const Vec3<T> h = m * Vec3<T>(p, T(1));
        if (Abs(h.z - T(1)) > EpsilonV<T> && Abs(h.z) > EpsilonV<T>)
            return h.XY() * (T(1) / h.z);
        return h.XY();
    }

    template <RealScalar T>
    [[nodiscard]] constexpr Vec2<T> TransformVector(const Mat3<T>& m, const Vec2<T>& v) noexcept
    {
        return (m * Vec3<T>(v, T(0))).XY();
    }

    // ------------------------------------------------------------------------
    // Rotation builders (Implemented in Math.cpp)
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Counter-clockwise rotations for the right-handed convention.
    // Contract: Angles in radians; RotationAxis normalizes `axis` and returns Identity
    //           (with a VMATH_MATH_ASSERT report) when the axis is near zero.
    // Notes   : Embed into a homogeneous transform with Mat4<T>::FromLinear.
    // ---
    template <RealScalar T>
    [[nodiscard]] Mat2<T> Rotation2(T radians) noexcept;

    template <RealScalar T>
    [[nodiscard]] Mat3<T> RotationX(T radians) noexcept;

    template <RealScalar T>
    [[nodiscard]] Mat3<T> RotationY(T radians) noexcept;

    template <RealScalar T>
    [[nodiscard]] Mat3<T> RotationZ(T radians) noexcept;

    template <RealScalar T>
    [[nodiscard]] Mat3<T> RotationAxis(const Vec3<T>& axis, T radians) noexcept;

    // ------------------------------------------------------------------------
    // Camera builders (Implemented in Math.cpp)
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Build a right-handed view matrix looking from `eye` to `target`.
    // Contract: `up` must not be parallel to (target - eye); eye != target.
    //           Violations are reported and yield Identity.
    // ---
    template <RealScalar T>
    [[nodiscard]] Mat4<T> LookAt(const Vec3<T>& eye, const Vec3<T>& target, const Vec3<T>& up) noexcept;

    // ---
    // Purpose : Right-handed perspective projection with depth mapped to [0,1].
    // Contract: 0 < fovY < Pi, aspect > 0, 0 < zNear < zFar. Violations are reported and yield Identity.
    // ---
    template <RealScalar T>
    [[nodiscard]] Mat4<T> Perspective(T fovY, T aspect, T zNear, T zFar) noexcept;

    // Right-handed orthographic projection, depth in [0,1]; degenerate volumes yield Identity.
    template <RealScalar T>
    [[nodiscard]] Mat4<T> Orthographic(T left, T right, T bottom, T top, T zNear, T zFar) noexcept;

} // namespace vmath
