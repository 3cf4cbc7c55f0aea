// ============================================================================
// VMath - tests/Smoke/Math/Transform_smoke.cpp
// ----------------------------------------------------------------------------
// Purpose : Validate the documented transform conventions at runtime:
//           - Matrices store elements column-major (`m[column][row]`).
//           - Vectors are column vectors (v' = M * v), as LookAt/Perspective expect.
//           - Right-handed rotations: positive angles rotate X toward Y around +Z,
//             and toward -Z around +Y.
// Contract: Returns 0 on success, a distinct non-zero code per failed check.
// ============================================================================

#include "VMath/Math/Transform.hpp"
#include "SmokeSupport.hpp"

using namespace vmath;

namespace
{
    constexpr float32 kEpsilon = 1e-5f;

    [[nodiscard]] bool NearlyEqualVec3(const Vec3f& a, const Vec3f& b) noexcept
    {
        return IsNearlyEqual(a, b, kEpsilon);
    }
} // namespace

int RunTransformSmoke()
{
    // ------------------------------------------------------------------------
    // 1. Point / vector application
    // ------------------------------------------------------------------------
    {
        const Vec3f v(1.0f, 2.0f, 3.0f);
        if (TransformPoint(Mat4f::Identity(), v) != v)
        {
            return 1;
        }

        if (TransformPoint(Mat4f::Scale(Vec3f(2.0f)), v) != Vec3f(2.0f, 4.0f, 6.0f))
        {
            return 2;
        }

        const Mat4f move = Mat4f::Translation(Vec3f(10.0f, 0.0f, -1.0f));
        if (TransformPoint(move, v) != Vec3f(11.0f, 2.0f, 2.0f) || TransformVector(move, v) != v)
        {
            return 3;
        }

        const Mat3d move2 = Mat3d::Translation(Vec2d(2.0, 3.0));
        if (TransformPoint(move2, Vec2d(1.0, 1.0)) != Vec2d(3.0, 4.0) || TransformVector(move2, Vec2d(1.0, 1.0)) != Vec2d(1.0, 1.0))
        {
            return 4;
        }
    }

    // ------------------------------------------------------------------------
    // 2. Inverse round trip (T * S composed with column vectors)
    // ------------------------------------------------------------------------
    {
        const Mat4f composed = Mat4f::Translation(Vec3f(3.0f, -1.0f, 5.0f)) * Mat4f::Scale(Vec3f(2.0f));
        const Mat4f inverse = Inverse(composed);

        const Vec3f localPoint(1.0f, -2.0f, 0.25f);
        const Vec3f worldSpace = TransformPoint(composed, localPoint);
        if (!NearlyEqualVec3(worldSpace, Vec3f(5.0f, -5.0f, 5.5f)) || !NearlyEqualVec3(TransformPoint(inverse, worldSpace), localPoint))
        {
            return 10;
        }
    }

    // ------------------------------------------------------------------------
    // 3. Right-handed rotations
    // ------------------------------------------------------------------------
    {
        if (!NearlyEqualVec3(RotationZ(HalfPi) * Vec3f::Right(), Vec3f::Up()))
        {
            return 20;
        }

        if (!NearlyEqualVec3(RotationY(HalfPi) * Vec3f::Right(), Vec3f::Backwards()))
        {
            return 21;
        }

        if (!NearlyEqualVec3(RotationX(HalfPi) * Vec3f::Up(), Vec3f::Forward()))
        {
            return 22;
        }

        if (!IsNearlyEqual(RotationAxis(Vec3f(0.0f, 0.0f, 2.0f), 0.3f), RotationZ(0.3f), kEpsilon))
        {
            return 23;
        }

        const Mat3d twist = RotationAxis(Vec3d(1.0, 1.0, 1.0), 1.1);
        if (!IsNearlyEqual(twist * Transpose(twist), Mat3d::Identity(), 1e-12) || !IsNearlyEqual(Determinant(twist), 1.0, 1e-12))
        {
            return 24;
        }

        // The negative power of an orthonormal matrix is its inverse.
        if (!IsNearlyEqual(Power(twist, -3), Inverse(Power(twist, 3)), 1e-12))
        {
            return 25;
        }

        if (!IsNearlyEqual(Rotation2(HalfPi) * Vec2f::Right(), Vec2f::Up(), kEpsilon))
        {
            return 26;
        }

        const Mat4f rigid = Mat4f::Translation(Vec3f(0.0f, 0.0f, 4.0f)) * Mat4f::FromLinear(RotationZ(HalfPi));
        if (!NearlyEqualVec3(TransformPoint(rigid, Vec3f::Right()), Vec3f(0.0f, 1.0f, 4.0f)) ||
            !NearlyEqualVec3(TransformVector(rigid, Vec3f::Right()), Vec3f::Up()))
        {
            return 27;
        }

        tests::ExpectedAssertScope quiet;
        if (RotationAxis(Vec3f::Zero(), 1.0f) != Mat3f::Identity())
        {
            return 28;
        }
    }

    // ------------------------------------------------------------------------
    // 4. Camera builders
    // ------------------------------------------------------------------------
    {
        const Mat4f view = LookAt(Vec3f(0.0f, 0.0f, 5.0f), Vec3f::Zero(), Vec3f::Up());
        if (!NearlyEqualVec3(TransformPoint(view, Vec3f::Zero()), Vec3f(0.0f, 0.0f, -5.0f)) ||
            !NearlyEqualVec3(TransformPoint(view, Vec3f(1.0f, 0.0f, 5.0f)), Vec3f::Right()))
        {
            return 30;
        }

        // Depth maps zNear -> 0 and zFar -> 1.
        const Mat4f proj = Perspective(Radians(60.0f), 16.0f / 9.0f, 0.5f, 10.0f);
        if (!IsNearlyEqual(TransformPoint(proj, Vec3f(0.0f, 0.0f, -0.5f)).z, 0.0f, kEpsilon) ||
            !IsNearlyEqual(TransformPoint(proj, Vec3f(0.0f, 0.0f, -10.0f)).z, 1.0f, kEpsilon))
        {
            return 31;
        }

        const Mat4d ortho = Orthographic(-2.0, 2.0, -1.0, 1.0, 0.1, 10.0);
        if (!IsNearlyEqual(TransformPoint(ortho, Vec3d(2.0, 1.0, -0.1)), Vec3d(1.0, 1.0, 0.0), 1e-12) ||
            !IsNearlyEqual(TransformPoint(ortho, Vec3d(-2.0, -1.0, -10.0)), Vec3d(-1.0, -1.0, 1.0), 1e-12))
        {
            return 32;
        }

        tests::ExpectedAssertScope quiet;
        if (Perspective(0.0f, 1.0f, 0.1f, 100.0f) != Mat4f::Identity() ||
            LookAt(Vec3f::One(), Vec3f::One(), Vec3f::Up()) != Mat4f::Identity() ||
            LookAt(Vec3f::Zero(), Vec3f::Up(), Vec3f::Up()) != Mat4f::Identity() ||
            Orthographic(1.0f, 1.0f, 0.0f, 1.0f, 0.0f, 1.0f) != Mat4f::Identity())
        {
            return 33;
        }
    }

    return 0;
}
