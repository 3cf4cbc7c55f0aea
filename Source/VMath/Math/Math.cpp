// ============================================================================
// VMath - Source/VMath/Math/Math.cpp
// ----------------------------------------------------------------------------
// Purpose : Implementation of heavy math operations (inverses, rotation and
//           camera builders), explicitly instantiated for float32 and float64.
// ============================================================================

#include "VMath/Math/Math.hpp"
#include "VMath/Math/Vector.hpp"
#include "VMath/Math/Matrix.hpp"
#include "VMath/Math/Transform.hpp"
#include <cmath>

namespace vmath
{
    namespace
    {
        template <RealScalar T>
        bool AllFinite(const Vec3<T>& v) noexcept
        {
            return IsFinite(v.x) && IsFinite(v.y) && IsFinite(v.z);
        }

        template <MatrixType M>
        bool AllFinite(const M& m) noexcept
        {
            for (usize c = 0; c < M::kDimension; ++c)
                for (usize r = 0; r < M::kDimension; ++r)
                    if (!IsFinite(m.m[c][r]))
                        return false;
            return true;
        }

        // Debug: verify that the input matrix does not contain NaN or Inf.
        template <MatrixType M>
        void ValidateFinite(const M& m) noexcept
        {
#if VMATH_MATH_VALIDATE
            VMATH_MATH_ASSERT(AllFinite(m), "Inverse called with non-finite element.");
#else
            VMATH_UNUSED(m);
#endif
        }

        // Singular when |det| is negligible against the product of the column lengths
        // (Hadamard bound), so the test does not depend on the matrix scale.
        template <MatrixType M>
        bool IsSingular(const M& m, typename M::ScalarType det) noexcept
        {
            using T = typename M::ScalarType;
            float64 bound = 1.0;
            for (usize c = 0; c < M::kDimension; ++c)
            {
                float64 columnLengthSq = 0.0;
                for (usize r = 0; r < M::kDimension; ++r)
                {
                    const float64 e = static_cast<float64>(m.m[c][r]);
                    columnLengthSq += e * e;
                }
                bound *= Sqrt(columnLengthSq);
            }

            if (!(static_cast<float64>(Abs(det)) > static_cast<float64>(EpsilonV<T>) * bound))
                return true;
            return !IsFinite(T(1) / det);
        }
    } // namespace

    // ------------------------------------------------------------------------
    // Matrix Operations
    // ------------------------------------------------------------------------

    template <RealScalar T>
    Mat2<T> Inverse(const Mat2<T>& m) noexcept
    {
        ValidateFinite(m);

        const T det = Determinant(m);
        const bool singular = IsSingular(m, det);
        if (singular)
        {
            VMATH_MATH_ASSERT(!singular, "Mat2 Inverse called with a singular matrix. Returning identity.");
            return Mat2<T>::Identity();
        }

        const T invDet = T(1) / det;
        return Mat2<T>( m(1, 1) * invDet, -m(0, 1) * invDet,
                       -m(1, 0) * invDet,  m(0, 0) * invDet);
    }

    template <RealScalar T>
    Mat3<T> Inverse(const Mat3<T>& m) noexcept
    {
        ValidateFinite(m);

        // Cofactors named after the row-major element they belong to.
        const T a = m(0, 0), b = m(0, 1), c = m(0, 2);
        const T d = m(1, 0), e = m(1, 1), f = m(1, 2);
        const T g = m(2, 0), h = m(2, 1), i = m(2, 2);

        const T A =  (e * i - f * h);
        const T B = -(d * i - f * g);
        const T C =  (d * h - e * g);

        const T det = a * A + b * B + c * C;
        const bool singular = IsSingular(m, det);
        if (singular)
        {
            VMATH_MATH_ASSERT(!singular, "Mat3 Inverse called with a singular matrix. Returning identity.");
            return Mat3<T>::Identity();
        }

        const T D = -(b * i - c * h);
        const T E =  (a * i - c * g);
        const T F = -(a * h - b * g);
        const T G =  (b * f - c * e);
        const T H = -(a * f - c * d);
        const T I =  (a * e - b * d);

        // Adjugate is the transposed cofactor matrix.
        const T invDet = T(1) / det;
        return Mat3<T>(A * invDet, D * invDet, G * invDet,
                       B * invDet, E * invDet, H * invDet,
                       C * invDet, F * invDet, I * invDet);
    }

    template <RealScalar T>
    Mat4<T> Inverse(const Mat4<T>& m) noexcept
    {
        ValidateFinite(m);

        // Standard 4x4 inversion using cofactors
        const T coef00 = m.m[2][2] * m.m[3][3] - m.m[3][2] * m.m[2][3];
        const T coef02 = m.m[1][2] * m.m[3][3] - m.m[3][2] * m.m[1][3];
        const T coef03 = m.m[1][2] * m.m[2][3] - m.m[2][2] * m.m[1][3];

        const T coef04 = m.m[2][1] * m.m[3][3] - m.m[3][1] * m.m[2][3];
        const T coef06 = m.m[1][1] * m.m[3][3] - m.m[3][1] * m.m[1][3];
        const T coef07 = m.m[1][1] * m.m[2][3] - m.m[2][1] * m.m[1][3];

        const T coef08 = m.m[2][1] * m.m[3][2] - m.m[3][1] * m.m[2][2];
        const T coef10 = m.m[1][1] * m.m[3][2] - m.m[3][1] * m.m[1][2];
        const T coef11 = m.m[1][1] * m.m[2][2] - m.m[2][1] * m.m[1][2];

        const T coef12 = m.m[2][0] * m.m[3][3] - m.m[3][0] * m.m[2][3];
        const T coef14 = m.m[1][0] * m.m[3][3] - m.m[3][0] * m.m[1][3];
        const T coef15 = m.m[1][0] * m.m[2][3] - m.m[2][0] * m.m[1][3];

        const T coef16 = m.m[2][0] * m.m[3][2] - m.m[3][0] * m.m[2][2];
        const T coef18 = m.m[1][0] * m.m[3][2] - m.m[3][0] * m.m[1][2];
        const T coef19 = m.m[1][0] * m.m[2][2] - m.m[2][0] * m.m[1][2];

        const T coef20 = m.m[2][0] * m.m[3][1] - m.m[3][0] * m.m[2][1];
        const T coef22 = m.m[1][0] * m.m[3][1] - m.m[3][0] * m.m[1][1];
        const T coef23 = m.m[1][0] * m.m[2][1] - m.m[2][0] * m.m[1][1];

        const Vec4<T> fac0(coef00, coef00, coef02, coef03);
        const Vec4<T> fac1(coef04, coef04, coef06, coef07);
        const Vec4<T> fac2(coef08, coef08, coef10, coef11);
        const Vec4<T> fac3(coef12, coef12, coef14, coef15);
        const Vec4<T> fac4(coef16, coef16, coef18, coef19);
        const Vec4<T> fac5(coef20, coef20, coef22, coef23);

        const Vec4<T> vec0(m.m[1][0], m.m[0][0], m.m[0][0], m.m[0][0]);
        const Vec4<T> vec1(m.m[1][1], m.m[0][1], m.m[0][1], m.m[0][1]);
        const Vec4<T> vec2(m.m[1][2], m.m[0][2], m.m[0][2], m.m[0][2]);
        const Vec4<T> vec3(m.m[1][3], m.m[0][3], m.m[0][3], m.m[0][3]);

        const Vec4<T> inv0(vec1 * fac0 - vec2 * fac1 + vec3 * fac2);
        const Vec4<T> inv1(vec0 * fac0 - vec2 * fac3 + vec3 * fac4);
        const Vec4<T> inv2(vec0 * fac1 - vec1 * fac3 + vec3 * fac5);
        const Vec4<T> inv3(vec0 * fac2 - vec1 * fac4 + vec2 * fac5);

        const Vec4<T> signA(T(1), T(-1), T(1), T(-1));
        const Vec4<T> signB(T(-1), T(1), T(-1), T(1));

        // Columns
        Mat4<T> inv = Mat4<T>::FromColumns(inv0 * signA, inv1 * signB, inv2 * signA, inv3 * signB);

        const Vec4<T> row0 = inv.Row(0);
        const T det = Dot(m.Column(0), row0);

        const bool singular = IsSingular(m, det);
        if (singular)
        {
            VMATH_MATH_ASSERT(!singular, "Mat4 Inverse called with a singular matrix. Returning identity.");
            return Mat4<T>::Identity();
        }

        inv *= T(1) / det;
        return inv;
    }

    // ------------------------------------------------------------------------
    // Rotation builders
    // ------------------------------------------------------------------------

    template <RealScalar T>
    Mat2<T> Rotation2(T radians) noexcept
    {
        AssertFinite(radians);
        const T c = Cos(radians);
        const T s = Sin(radians);
        return Mat2<T>(c, -s,
                       s,  c);
    }

    template <RealScalar T>
    Mat3<T> RotationX(T radians) noexcept
    {
        AssertFinite(radians);
        const T c = Cos(radians);
        const T s = Sin(radians);
        return Mat3<T>(T(1), T(0), T(0),
                       T(0),    c,   -s,
                       T(0),    s,    c);
    }

    template <RealScalar T>
    Mat3<T> RotationY(T radians) noexcept
    {
        AssertFinite(radians);
        const T c = Cos(radians);
        const T s = Sin(radians);
        return Mat3<T>(   c, T(0),    s,
                       T(0), T(1), T(0),
                         -s, T(0),    c);
    }

    template <RealScalar T>
    Mat3<T> RotationZ(T radians) noexcept
    {
        AssertFinite(radians);
        const T c = Cos(radians);
        const T s = Sin(radians);
        return Mat3<T>(   c,   -s, T(0),
                          s,    c, T(0),
                       T(0), T(0), T(1));
    }

    template <RealScalar T>
    Mat3<T> RotationAxis(const Vec3<T>& axis, T radians) noexcept
    {
#if VMATH_MATH_VALIDATE
        VMATH_MATH_ASSERT(AllFinite(axis) && IsFinite(radians), "RotationAxis called with non-finite input.");
#endif
        const T axisLengthSq = LengthSquared(axis);
        if (axisLengthSq <= EpsilonV<T> * EpsilonV<T>)
        {
            VMATH_MATH_ASSERT(axisLengthSq > EpsilonV<T> * EpsilonV<T>, "RotationAxis called with near-zero axis. Returning identity.");
            return Mat3<T>::Identity();
        }

        // Rodrigues' rotation formula.
        const Vec3<T> n = axis * (T(1) / Sqrt(axisLengthSq));
        const T c = Cos(radians);
        const T s = Sin(radians);
        const T t = T(1) - c;

        return Mat3<T>(t * n.x * n.x + c,       t * n.x * n.y - s * n.z, t * n.x * n.z + s * n.y,
                       t * n.x * n.y + s * n.z, t * n.y * n.y + c,       t * n.y * n.z - s * n.x,
                       t * n.x * n.z - s * n.y, t * n.y * n.z + s * n.x, t * n.z * n.z + c);
    }

    // ------------------------------------------------------------------------
    // Camera builders
    // ------------------------------------------------------------------------

    template <RealScalar T>
    Mat4<T> LookAt(const Vec3<T>& eye, const Vec3<T>& target, const Vec3<T>& up) noexcept
    {
#if VMATH_MATH_VALIDATE
        // Basic finite checks
        VMATH_MATH_ASSERT(AllFinite(eye) && AllFinite(target) && AllFinite(up), "LookAt called with non-finite input.");
#endif
        // Ensure we have a valid forward direction and that "up" is not parallel to it.
        const Vec3<T> forward = target - eye;
        const T forwardLengthSq = LengthSquared(forward);
        const T crossLengthSq = LengthSquared(Cross(forward, up));
        if (forwardLengthSq <= EpsilonV<T> * EpsilonV<T> || crossLengthSq <= EpsilonV<T> * EpsilonV<T>)
        {
            VMATH_MATH_ASSERT(forwardLengthSq > EpsilonV<T> * EpsilonV<T>, "LookAt called with eye and target too close.");
            VMATH_MATH_ASSERT(crossLengthSq > EpsilonV<T> * EpsilonV<T>, "LookAt called with nearly parallel up and forward vectors.");
            return Mat4<T>::Identity();
        }

        // RH LookAt
        const Vec3<T> f = Normalize(forward);
        const Vec3<T> s = Normalize(Cross(f, up));
        const Vec3<T> u = Cross(s, f);

        Mat4<T> res = Mat4<T>::Identity();
        res.m[0][0] = s.x;
        res.m[1][0] = s.y;
        res.m[2][0] = s.z;
        res.m[0][1] = u.x;
        res.m[1][1] = u.y;
        res.m[2][1] = u.z;
        res.m[0][2] = -f.x;
        res.m[1][2] = -f.y;
        res.m[2][2] = -f.z;
        res.m[3][0] = -Dot(s, eye);
        res.m[3][1] = -Dot(u, eye);
        res.m[3][2] = Dot(f, eye);
        return res;
    }

    template <RealScalar T>
    Mat4<T> Perspective(T fovY, T aspect, T zNear, T zFar) noexcept
    {
#if VMATH_MATH_VALIDATE
        VMATH_MATH_ASSERT(IsFinite(fovY) && IsFinite(aspect) && IsFinite(zNear) && IsFinite(zFar),
                     "Perspective called with non-finite input.");
#endif
        const bool valid = fovY > T(0) && fovY < PiV<T> && aspect > T(0) && zNear > T(0) && zFar > zNear;
        if (!valid)
        {
            VMATH_MATH_ASSERT(valid, "Perspective requires 0 < fovY < Pi, aspect > 0 and 0 < zNear < zFar. Returning identity.");
            return Mat4<T>::Identity();
        }

        // RH, 0-1 Z range
        const T tanHalfFov = Tan(fovY * T(0.5));
        Mat4<T> res; // Zero initialization

        res.m[0][0] = T(1) / (aspect * tanHalfFov);
        res.m[1][1] = T(1) / tanHalfFov;
        res.m[2][2] = zFar / (zNear - zFar);
        res.m[2][3] = T(-1);
        res.m[3][2] = -(zFar * zNear) / (zFar - zNear);
        return res;
    }

    template <RealScalar T>
    Mat4<T> Orthographic(T left, T right, T bottom, T top, T zNear, T zFar) noexcept
    {
#if VMATH_MATH_VALIDATE
        VMATH_MATH_ASSERT(IsFinite(left) && IsFinite(right) &&
                     IsFinite(bottom) && IsFinite(top) &&
                     IsFinite(zNear) && IsFinite(zFar),
                     "Orthographic called with non-finite input.");
#endif
        const bool valid = left != right && bottom != top && zNear != zFar;
        if (!valid)
        {
            VMATH_MATH_ASSERT(valid, "Orthographic requires non-degenerate volume. Returning identity.");
            return Mat4<T>::Identity();
        }

        // RH, 0-1 Z range
        Mat4<T> res = Mat4<T>::Identity();
        res.m[0][0] = T(2) / (right - left);
        res.m[1][1] = T(2) / (top - bottom);
        res.m[2][2] = T(1) / (zNear - zFar);
        res.m[3][0] = -(right + left) / (right - left);
        res.m[3][1] = -(top + bottom) / (top - bottom);
        res.m[3][2] = zNear / (zNear - zFar);
        return res;
    }

    // ------------------------------------------------------------------------
    // Explicit instantiations
    // ------------------------------------------------------------------------
#define VMATH_INSTANTIATE_HEAVY_MATH(T)                                                     \
    template Mat2<T> Inverse<T>(const Mat2<T>&) noexcept;                                  \
    template Mat3<T> Inverse<T>(const Mat3<T>&) noexcept;                                  \
    template Mat4<T> Inverse<T>(const Mat4<T>&) noexcept;                                  \
    template Mat2<T> Rotation2<T>(T) noexcept;                                             \
    template Mat3<T> RotationX<T>(T) noexcept;                                             \
    template Mat3<T> RotationY<T>(T) noexcept;                                             \
    template Mat3<T> RotationZ<T>(T) noexcept;                                             \
    template Mat3<T> RotationAxis<T>(const Vec3<T>&, T) noexcept;                          \
    template Mat4<T> LookAt<T>(const Vec3<T>&, const Vec3<T>&, const Vec3<T>&) noexcept;   \
    template Mat4<T> Perspective<T>(T, T, T, T) noexcept;                                  \
    template Mat4<T> Orthographic<T>(T, T, T, T, T, T) noexcept;

    VMATH_INSTANTIATE_HEAVY_MATH(float32)
    VMATH_INSTANTIATE_HEAVY_MATH(float64)

#undef VMATH_INSTANTIATE_HEAVY_MATH

} // namespace vmath
