// ============================================================================
// VMath - tests/Smoke/Math/Vector_smoke.cpp
// ----------------------------------------------------------------------------
// Purpose : Runtime checks for Vec2/Vec3/Vec4 across the int/float/double domains.
// Contract: Returns 0 on success, a distinct non-zero code per failed check.
// ============================================================================

#include "VMath/Math/Vector.hpp"
#include "SmokeSupport.hpp"

#include <type_traits>

using namespace vmath;

int RunVectorSmoke()
{
    // ------------------------------------------------------------------------
    // 1. Construction and named constants
    // ------------------------------------------------------------------------
    {
        if (Vec3i() != Vec3i::Zero() || Vec4d(1.0) != Vec4d::One())
        {
            return 1;
        }

        if (Vec3i::Forward() != Vec3i(0, 0, 1) || Vec3f::Backwards() != Vec3f(0.0f, 0.0f, -1.0f))
        {
            return 2;
        }

        if (Vec2i::Left() != -Vec2i::Right() || Vec4f::Down() != Vec4f(0.0f, -1.0f, 0.0f, 0.0f))
        {
            return 3;
        }

        const Vec4f widened(Vec3f(1.0f, 2.0f, 3.0f), 4.0f);
        if (widened.XYZ() != Vec3f(1.0f, 2.0f, 3.0f) || widened.XY() != Vec2f(1.0f, 2.0f) || widened.w != 4.0f)
        {
            return 4;
        }

        if (Vec3d(Vec2d(5.0, 6.0), 7.0) != Vec3d(5.0, 6.0, 7.0))
        {
            return 5;
        }
    }

    // ------------------------------------------------------------------------
    // 2. Indexed access
    // ------------------------------------------------------------------------
    {
        Vec3i v(4, 5, 6);
        if (v[0] != 4 || v[1] != 5 || v[2] != 6)
        {
            return 10;
        }

        v[1] = 9;
        if (v.y != 9)
        {
            return 11;
        }

        tests::ExpectedAssertScope quiet;
        if (v[7] != 6)
        {
            return 12;
        }
    }

    // ------------------------------------------------------------------------
    // 3. Arithmetic (same domain)
    // ------------------------------------------------------------------------
    {
        if (Vec2i(1, 2) + Vec2i(3, 4) != Vec2i(4, 6) || Vec2i(1, 2) - Vec2i(3, 4) != Vec2i(-2, -2))
        {
            return 20;
        }

        if (Vec3i(6, 8, 10) / 2 != Vec3i(3, 4, 5) || 2 * Vec3i(1, 2, 3) != Vec3i(2, 4, 6))
        {
            return 21;
        }

        if (Vec4f(1.0f, 2.0f, 3.0f, 4.0f) * Vec4f(2.0f) != Vec4f(2.0f, 4.0f, 6.0f, 8.0f))
        {
            return 22;
        }

        if (Vec2d(3.0, 9.0) / Vec2d(3.0, 3.0) != Vec2d(1.0, 3.0))
        {
            return 23;
        }

        // Operators return new values.
        const Vec3f a(1.0f, 2.0f, 3.0f);
        const Vec3f b = a * 2.0f;
        if (a != Vec3f(1.0f, 2.0f, 3.0f) || b != Vec3f(2.0f, 4.0f, 6.0f))
        {
            return 24;
        }

        tests::ExpectedAssertScope quiet;
        if (Vec3i(1, 2, 3) / Vec3i(0, 1, 1) != Vec3i(0, 2, 3))
        {
            return 25;
        }
    }

    // ------------------------------------------------------------------------
    // 4. Mixed scalar domains promote
    // ------------------------------------------------------------------------
    {
        const auto sum = Vec2i(1, 2) + Vec2f(0.5f, 0.5f);
        static_assert(std::is_same_v<std::remove_cv_t<decltype(sum)>, Vec2f>, "int + float must promote to float");
        if (sum != Vec2f(1.5f, 2.5f))
        {
            return 30;
        }

        const auto scaled = Vec3i(1, 2, 3) * 0.5;
        static_assert(std::is_same_v<std::remove_cv_t<decltype(scaled)>, Vec3d>, "int * double must promote to double");
        if (scaled != Vec3d(0.5, 1.0, 1.5))
        {
            return 31;
        }

        const auto wide = Vec4f(1.0f) - Vec4d(0.5);
        static_assert(std::is_same_v<std::remove_cv_t<decltype(wide)>, Vec4d>, "float - double must promote to double");
        if (wide != Vec4d(0.5))
        {
            return 32;
        }
    }

    // ------------------------------------------------------------------------
    // 5. Dot / Cross / lengths
    // ------------------------------------------------------------------------
    {
        if (Dot(Vec3f(1.0f, 2.0f, 3.0f), Vec3f(4.0f, 5.0f, 6.0f)) != 32.0f)
        {
            return 40;
        }

        if (Cross(Vec3d(1.0, 0.0, 0.0), Vec3d(0.0, 1.0, 0.0)) != Vec3d(0.0, 0.0, 1.0))
        {
            return 41;
        }

        if (Cross(Vec2i(1, 0), Vec2i(0, 1)) != 1 || Cross(Vec2i(0, 1), Vec2i(1, 0)) != -1)
        {
            return 42;
        }

        if (LengthSquared(Vec3i(1, 2, 2)) != 9 || Length(Vec2i(3, 4)) != 5.0)
        {
            return 43;
        }

        static_assert(std::is_same_v<decltype(Length(Vec2i())), float64>, "integer lengths are float64");
        static_assert(std::is_same_v<decltype(Length(Vec2f())), float32>, "float lengths stay float32");

        if (DistanceSquared(Vec2i(1, 1), Vec2i(4, 5)) != 25 || Distance(Vec3f(1.0f, 1.0f, 1.0f), Vec3f(4.0f, 5.0f, 1.0f)) != 5.0f)
        {
            return 44;
        }

        if (!IsNearlyEqual(AngleBetween(Vec2f(1.0f, 0.0f), Vec2f(0.0f, 3.0f)), HalfPi, 1e-6f))
        {
            return 45;
        }

        if (!IsNearlyEqual(AngleBetween(Vec3i(1, 0, 0), Vec3i(-2, 0, 0)), PiV<float64>, 1e-12))
        {
            return 46;
        }

        // Short but non-zero operands are valid.
        if (!IsNearlyEqual(AngleBetween(Vec2f(1e-4f, 0.0f), Vec2f(0.0f, 1e-4f)), HalfPi, 1e-6f) ||
            !IsNearlyEqual(AngleBetween(Vec3d(1e-9, 0.0, 0.0), Vec3d(0.0, 1e-9, 0.0)), PiV<float64> * 0.5, 1e-12))
        {
            return 48;
        }

        tests::ExpectedAssertScope quiet;
        if (AngleBetween(Vec3f::Zero(), Vec3f::Up()) != 0.0f)
        {
            return 47;
        }
    }

    // ------------------------------------------------------------------------
    // 6. Component-wise helpers
    // ------------------------------------------------------------------------
    {
        if (Abs(Vec3i(-1, 2, -3)) != Vec3i(1, 2, 3))
        {
            return 50;
        }

        if (Min(Vec2f(1.0f, 5.0f), Vec2f(3.0f, 2.0f)) != Vec2f(1.0f, 2.0f) ||
            Max(Vec2f(1.0f, 5.0f), Vec2f(3.0f, 2.0f)) != Vec2f(3.0f, 5.0f))
        {
            return 51;
        }

        if (Clamp(Vec4i(-5, 0, 5, 10), Vec4i(0), Vec4i(6)) != Vec4i(0, 0, 5, 6))
        {
            return 52;
        }

        if (Sum(Vec4i(1, 2, 3, 4)) != 10 || Sum(Vec2d(0.5, 0.25)) != 0.75)
        {
            return 53;
        }
    }

    // ------------------------------------------------------------------------
    // 7. Real-only geometry
    // ------------------------------------------------------------------------
    {
        const Vec3f n = Normalize(Vec3f(0.0f, 3.0f, 4.0f));
        if (!IsNearlyEqual(n, Vec3f(0.0f, 0.6f, 0.8f), 1e-6f) || !IsNormalized(n))
        {
            return 60;
        }

        if (Normalize(Vec2d::Zero()) != Vec2d::Zero() || IsNormalized(Vec2d::Zero()))
        {
            return 61;
        }

        if (Reflect(Vec2f(1.0f, -1.0f), Vec2f::Up()) != Vec2f(1.0f, 1.0f) ||
            Bounce(Vec2f(1.0f, -1.0f), Vec2f::Up()) != Vec2f(-1.0f, -1.0f))
        {
            return 62;
        }

        if (Slide(Vec3f(1.0f, -1.0f, 0.0f), Vec3f::Up()) != Vec3f(1.0f, 0.0f, 0.0f))
        {
            return 63;
        }

        if (Project(Vec3d(2.0, 3.0, 4.0), Vec3d(2.0, 0.0, 0.0)) != Vec3d(2.0, 0.0, 0.0))
        {
            return 64;
        }

        if (!IsNearlyEqual(DirectionTo(Vec3f(1.0f), Vec3f(1.0f, 1.0f, 5.0f)), Vec3f::Forward(), 1e-6f))
        {
            return 65;
        }

        if (Lerp(Vec3f::Zero(), Vec3f(10.0f, 20.0f, 30.0f), 0.5f) != Vec3f(5.0f, 10.0f, 15.0f))
        {
            return 66;
        }

        tests::ExpectedAssertScope quiet;
        if (Project(Vec3f::One(), Vec3f::Zero()) != Vec3f::Zero())
        {
            return 67;
        }
    }

    // ------------------------------------------------------------------------
    // 8. Vec2 extras
    // ------------------------------------------------------------------------
    {
        if (Perpendicular(Vec2i(1, 2)) != Vec2i(-2, 1))
        {
            return 70;
        }

        if (!IsNearlyEqual(Aspect(Vec2i(16, 9)), 16.0 / 9.0, 1e-12))
        {
            return 71;
        }

        if (!IsNearlyEqual(Angle(Vec2d(0.0, 2.0)), PiV<float64> * 0.5, 1e-12))
        {
            return 72;
        }

        if (!IsNearlyEqual(Rotated(Vec2f(1.0f, 0.0f), HalfPi), Vec2f(0.0f, 1.0f), 1e-6f))
        {
            return 73;
        }
    }

    // ------------------------------------------------------------------------
    // 9. Scalar-domain conversions
    // ------------------------------------------------------------------------
    {
        if (ToInt(Vec3f(1.9f, -1.9f, 0.5f)) != Vec3i(1, -1, 0))
        {
            return 80;
        }

        if (ToDouble(Vec2i(1, 2)) != Vec2d(1.0, 2.0) || ToFloat(Vec4d(0.25)) != Vec4f(0.25f))
        {
            return 81;
        }

        if (VecCast<int32>(Vec2d(-2.7, 3.2)) != Vec2i(-2, 3))
        {
            return 82;
        }
    }

    return 0;
}
