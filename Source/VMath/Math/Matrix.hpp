#pragma once
// ============================================================================
// VMath - Source/VMath/Math/Matrix.hpp
// ----------------------------------------------------------------------------
// Purpose : Square matrix templates (Mat2, Mat3, Mat4) over int32, float32 and
//           float64, and their shared algebra.
// Contract: Column-major storage addressed via m[column][row]; vectors are treated
//           as column vectors multiplied on the right (v' = M * v). Element-list
//           constructors take values in row-major reading order (mRC = row R, column C).
// Notes   : Heavy real-only ops (Inverse) are out-of-line in Math.cpp.
// ============================================================================

#include "VMath/Math/Vector.hpp"
#include <type_traits>

namespace vmath
{
    namespace detail
    {
        // Clamp an out-of-range row/column index to the last valid one.
        template <usize N>
        [[nodiscard]] constexpr usize ClampIndex(usize i) noexcept
        {
            return (i < N) ? i : N - 1;
        }
    } // namespace detail

    // ------------------------------------------------------------------------
    // Mat2 (2x2 Matrix)
    // ------------------------------------------------------------------------
    // ---
    // Purpose : 2x2 matrix for planar linear transforms (rotation, scale, shear).
    // Contract: Stored column-major via `m[col][row]`; trivially copyable; default ctor zero-inits.
    // ---
    template <Scalar T>
    struct Mat2
    {
        using ScalarType = T;
        using VecType = Vec2<T>;
        static constexpr usize kDimension = 2;

        T m[2][2]; // [col][row]

        constexpr Mat2() noexcept : m{} {}
        constexpr Mat2(T m00, T m01,
                       T m10, T m11) noexcept
            : m{ { m00, m10 }, { m01, m11 } } {}

        static constexpr Mat2 Zero() noexcept { return Mat2(); }
        static constexpr Mat2 Identity() noexcept { return Diagonal(T(1)); }
        static constexpr Mat2 Diagonal(T s) noexcept { return Diagonal(Vec2<T>(s)); }
        static constexpr Mat2 Diagonal(const Vec2<T>& d) noexcept
        {
            Mat2 res;
            res.m[0][0] = d.x; res.m[1][1] = d.y;
            return res;
        }
        static constexpr Mat2 Scale(const Vec2<T>& s) noexcept { return Diagonal(s); }

        static constexpr Mat2 FromColumns(const Vec2<T>& c0, const Vec2<T>& c1) noexcept
        {
            return Mat2(c0.x, c1.x,
                        c0.y, c1.y);
        }
        static constexpr Mat2 FromRows(const Vec2<T>& r0, const Vec2<T>& r1) noexcept
        {
            return Mat2(r0.x, r0.y,
                        r1.x, r1.y);
        }

        [[nodiscard]] constexpr T& operator()(usize row, usize col) noexcept
        {
            VMATH_MATH_ASSERT(row < kDimension && col < kDimension, "Mat2 element index out of range");
            return m[detail::ClampIndex<2>(col)][detail::ClampIndex<2>(row)];
        }
        [[nodiscard]] constexpr const T& operator()(usize row, usize col) const noexcept
        {
            VMATH_MATH_ASSERT(row < kDimension && col < kDimension, "Mat2 element index out of range");
            return m[detail::ClampIndex<2>(col)][detail::ClampIndex<2>(row)];
        }

        [[nodiscard]] constexpr Vec2<T> Row(usize i) const noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Mat2 row index out of range");
            const usize r = detail::ClampIndex<2>(i);
            return Vec2<T>(m[0][r], m[1][r]);
        }
        [[nodiscard]] constexpr Vec2<T> Column(usize i) const noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Mat2 column index out of range");
            const usize c = detail::ClampIndex<2>(i);
            return Vec2<T>(m[c][0], m[c][1]);
        }

        [[nodiscard]] constexpr Mat2 operator-() const noexcept
        {
            return Mat2(-m[0][0], -m[1][0],
                        -m[0][1], -m[1][1]);
        }

        constexpr Mat2& operator+=(const Mat2& rhs) noexcept
        {
            for (usize c = 0; c < 2; ++c)
                for (usize r = 0; r < 2; ++r)
                    m[c][r] += rhs.m[c][r];
            return *this;
        }
        constexpr Mat2& operator-=(const Mat2& rhs) noexcept
        {
            for (usize c = 0; c < 2; ++c)
                for (usize r = 0; r < 2; ++r)
                    m[c][r] -= rhs.m[c][r];
            return *this;
        }
        constexpr Mat2& operator*=(T s) noexcept
        {
            for (usize c = 0; c < 2; ++c)
                for (usize r = 0; r < 2; ++r)
                    m[c][r] *= s;
            return *this;
        }
        constexpr Mat2& operator/=(T s) noexcept
        {
            for (usize c = 0; c < 2; ++c)
                for (usize r = 0; r < 2; ++r)
                    m[c][r] = detail::DivideComponent(m[c][r], s);
            return *this;
        }
    };

    // ------------------------------------------------------------------------
    // Mat3 (3x3 Matrix)
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Compact 3x3 matrix for linear (non-homogeneous) 3D transforms and 2D affine transforms.
    // Contract: Stored column-major via `m[col][row]`; trivially copyable; default ctor zero-inits for safety.
    // Notes   : Use Mat4 for affine 3D transforms requiring translation.
    // ---
    template <Scalar T>
    struct Mat3
    {
        using ScalarType = T;
        using VecType = Vec3<T>;
        static constexpr usize kDimension = 3;

        T m[3][3]; // [col][row]

        constexpr Mat3() noexcept : m{} {}
        constexpr Mat3(T m00, T m01, T m02,
                       T m10, T m11, T m12,
                       T m20, T m21, T m22) noexcept
            : m{ { m00, m10, m20 }, { m01, m11, m21 }, { m02, m12, m22 } } {}

        static constexpr Mat3 Zero() noexcept { return Mat3(); }
        static constexpr Mat3 Identity() noexcept { return Diagonal(T(1)); }
        static constexpr Mat3 Diagonal(T s) noexcept { return Diagonal(Vec3<T>(s)); }
        static constexpr Mat3 Diagonal(const Vec3<T>& d) noexcept
        {
            Mat3 res;
            res.m[0][0] = d.x; res.m[1][1] = d.y; res.m[2][2] = d.z;
            return res;
        }

        // ---
        // Purpose : Build scale matrices inline, plus the 2D affine translation.
        // Contract: constexpr/noexcept; `Translation` writes into column 2 and expects points with z = 1.
        // ---
        static constexpr Mat3 Scale(T s) noexcept { return Diagonal(s); }
        static constexpr Mat3 Scale(const Vec3<T>& s) noexcept { return Diagonal(s); }
        static constexpr Mat3 Translation(const Vec2<T>& t) noexcept
        {
            Mat3 res = Identity();
            res.m[2][0] = t.x;
            res.m[2][1] = t.y;
            return res;
        }

        static constexpr Mat3 FromColumns(const Vec3<T>& c0, const Vec3<T>& c1, const Vec3<T>& c2) noexcept
        {
            return Mat3(c0.x, c1.x, c2.x,
                        c0.y, c1.y, c2.y,
                        c0.z, c1.z, c2.z);
        }
        static constexpr Mat3 FromRows(const Vec3<T>& r0, const Vec3<T>& r1, const Vec3<T>& r2) noexcept
        {
            return Mat3(r0.x, r0.y, r0.z,
                        r1.x, r1.y, r1.z,
                        r2.x, r2.y, r2.z);
        }

        [[nodiscard]] constexpr T& operator()(usize row, usize col) noexcept
        {
            VMATH_MATH_ASSERT(row < kDimension && col < kDimension, "Mat3 element index out of range");
            return m[detail::ClampIndex<3>(col)][detail::ClampIndex<3>(row)];
        }
        [[nodiscard]] constexpr const T& operator()(usize row, usize col) const noexcept
        {
            VMATH_MATH_ASSERT(row < kDimension && col < kDimension, "Mat3 element index out of range");
            return m[detail::ClampIndex<3>(col)][detail::ClampIndex<3>(row)];
        }

        [[nodiscard]] constexpr Vec3<T> Row(usize i) const noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Mat3 row index out of range");
            const usize r = detail::ClampIndex<3>(i);
            return Vec3<T>(m[0][r], m[1][r], m[2][r]);
        }
        [[nodiscard]] constexpr Vec3<T> Column(usize i) const noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Mat3 column index out of range");
            const usize c = detail::ClampIndex<3>(i);
            return Vec3<T>(m[c][0], m[c][1], m[c][2]);
        }

        [[nodiscard]] constexpr Mat3 operator-() const noexcept
        {
            Mat3 res = *this;
            res *= T(-1);
            return res;
        }

        constexpr Mat3& operator+=(const Mat3& rhs) noexcept
        {
            for (usize c = 0; c < 3; ++c)
                for (usize r = 0; r < 3; ++r)
                    m[c][r] += rhs.m[c][r];
            return *this;
        }
        constexpr Mat3& operator-=(const Mat3& rhs) noexcept
        {
            for (usize c = 0; c < 3; ++c)
                for (usize r = 0; r < 3; ++r)
                    m[c][r] -= rhs.m[c][r];
            return *this;
        }
        constexpr Mat3& operator*=(T s) noexcept
        {
            for (usize c = 0; c < 3; ++c)
                for (usize r = 0; r < 3; ++r)
                    m[c][r] *= s;
            return *this;
        }
        constexpr Mat3& operator/=(T s) noexcept
        {
            for (usize c = 0; c < 3; ++c)
                for (usize r = 0; r < 3; ++r)
                    m[c][r] = detail::DivideComponent(m[c][r], s);
            return *this;
        }
    };

    // ------------------------------------------------------------------------
    // Mat4 (4x4 Matrix)
    // ------------------------------------------------------------------------
    // ---
    // Purpose : 4x4 matrix for homogeneous transforms across geometry code.
    // Contract: Column-major storage accessed via `m[col][row]`; vectors are column vectors multiplied on the right (v' = M * v);
    //           trivially copyable; deterministic operations (no heap).
    // Notes   : Translation lives in column 3, matching TransformPoint/LookAt/Perspective.
    // ---
    template <Scalar T>
    struct Mat4
    {
        using ScalarType = T;
        using VecType = Vec4<T>;
        static constexpr usize kDimension = 4;

        T m[4][4]; // [col][row]

        constexpr Mat4() noexcept : m{} {}
        constexpr Mat4(T m00, T m01, T m02, T m03,
                       T m10, T m11, T m12, T m13,
                       T m20, T m21, T m22, T m23,
                       T m30, T m31, T m32, T m33) noexcept
            : m{ { m00, m10, m20, m30 }, { m01, m11, m21, m31 }, { m02, m12, m22, m32 }, { m03, m13, m23, m33 } } {}

        static constexpr Mat4 Zero() noexcept { return Mat4(); }
        static constexpr Mat4 Identity() noexcept { return Diagonal(T(1)); }
        static constexpr Mat4 Diagonal(T s) noexcept { return Diagonal(Vec4<T>(s)); }
        static constexpr Mat4 Diagonal(const Vec4<T>& d) noexcept
        {
            Mat4 res;
            res.m[0][0] = d.x; res.m[1][1] = d.y; res.m[2][2] = d.z; res.m[3][3] = d.w;
            return res;
        }

        // ---
        // Purpose : Inline constructors for canonical transforms (translation, scale, embedded linear part).
        // Contract: constexpr/noexcept; translation assumes column-vector * matrix ordering (translation stored in column 3).
        // Notes   : `FromLinear` places a Mat3 in the upper-left block with identity elsewhere.
        // ---
        static constexpr Mat4 Translation(const Vec3<T>& t) noexcept
        {
            Mat4 res = Identity();
            res.m[3][0] = t.x;
            res.m[3][1] = t.y;
            res.m[3][2] = t.z;
            return res;
        }

        static constexpr Mat4 Scale(const Vec3<T>& s) noexcept
        {
            return Diagonal(Vec4<T>(s, T(1)));
        }

        static constexpr Mat4 FromLinear(const Mat3<T>& l) noexcept
        {
            Mat4 res = Identity();
            for (usize c = 0; c < 3; ++c)
                for (usize r = 0; r < 3; ++r)
                    res.m[c][r] = l.m[c][r];
            return res;
        }

        static constexpr Mat4 FromColumns(const Vec4<T>& c0, const Vec4<T>& c1, const Vec4<T>& c2, const Vec4<T>& c3) noexcept
        {
            return Mat4(c0.x, c1.x, c2.x, c3.x,
                        c0.y, c1.y, c2.y, c3.y,
                        c0.z, c1.z, c2.z, c3.z,
                        c0.w, c1.w, c2.w, c3.w);
        }
        static constexpr Mat4 FromRows(const Vec4<T>& r0, const Vec4<T>& r1, const Vec4<T>& r2, const Vec4<T>& r3) noexcept
        {
            return Mat4(r0.x, r0.y, r0.z, r0.w,
                        r1.x, r1.y, r1.z, r1.w,
                        r2.x, r2.y, r2.z, r2.w,
                        r3.x, r3.y, r3.z, r3.w);
        }

        [[nodiscard]] constexpr T& operator()(usize row, usize col) noexcept
        {
            VMATH_MATH_ASSERT(row < kDimension && col < kDimension, "Mat4 element index out of range");
            return m[detail::ClampIndex<4>(col)][detail::ClampIndex<4>(row)];
        }
        [[nodiscard]] constexpr const T& operator()(usize row, usize col) const noexcept
        {
            VMATH_MATH_ASSERT(row < kDimension && col < kDimension, "Mat4 element index out of range");
            return m[detail::ClampIndex<4>(col)][detail::ClampIndex<4>(row)];
        }

        [[nodiscard]] constexpr Vec4<T> Row(usize i) const noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Mat4 row index out of range");
            const usize r = detail::ClampIndex<4>(i);
            return Vec4<T>(m[0][r], m[1][r], m[2][r], m[3][r]);
        }
        [[nodiscard]] constexpr Vec4<T> Column(usize i) const noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Mat4 column index out of range");
            const usize c = detail::ClampIndex<4>(i);
            return Vec4<T>(m[c][0], m[c][1], m[c][2], m[c][3]);
        }

        // Upper-left 3x3 block (rotation/scale part of an affine transform).
        [[nodiscard]] constexpr Mat3<T> Linear() const noexcept
        {
            Mat3<T> res;
            for (usize c = 0; c < 3; ++c)
                for (usize r = 0; r < 3; ++r)
                    res.m[c][r] = m[c][r];
            return res;
        }

        [[nodiscard]] constexpr Mat4 operator-() const noexcept
        {
            Mat4 res = *this;
            res *= T(-1);
            return res;
        }

        constexpr Mat4& operator+=(const Mat4& rhs) noexcept
        {
            for (usize c = 0; c < 4; ++c)
                for (usize r = 0; r < 4; ++r)
                    m[c][r] += rhs.m[c][r];
            return *this;
        }
        constexpr Mat4& operator-=(const Mat4& rhs) noexcept
        {
            for (usize c = 0; c < 4; ++c)
                for (usize r = 0; r < 4; ++r)
                    m[c][r] -= rhs.m[c][r];
            return *this;
        }
        constexpr Mat4& operator*=(T s) noexcept
        {
            for (usize c = 0; c < 4; ++c)
                for (usize r = 0; r < 4; ++r)
                    m[c][r] *= s;
            return *this;
        }
        constexpr Mat4& operator/=(T s) noexcept
        {
            for (usize c = 0; c < 4; ++c)
                for (usize r = 0; r < 4; ++r)
                    m[c][r] = detail::DivideComponent(m[c][r], s);
            return *this;
        }
    };

    using Mat2i = Mat2<int32>;
    using Mat2f = Mat2<float32>;
    using Mat2d = Mat2<float64>;
    using Mat3i = Mat3<int32>;
    using Mat3f = Mat3<float32>;
    using Mat3d = Mat3<float64>;
    using Mat4i = Mat4<int32>;
    using Mat4f = Mat4<float32>;
    using Mat4d = Mat4<float64>;

    // ------------------------------------------------------------------------
    // Matrix traits
    // ------------------------------------------------------------------------
    namespace detail
    {
        template <typename M>
        struct MatTraits
        {
            static constexpr bool kIsMatrix = false;
        };

        template <Scalar T>
        struct MatTraits<Mat2<T>>
        {
            static constexpr bool kIsMatrix = true;
            template <Scalar U> using Rebind = Mat2<U>;
        };

        template <Scalar T>
        struct MatTraits<Mat3<T>>
        {
            static constexpr bool kIsMatrix = true;
            template <Scalar U> using Rebind = Mat3<U>;
        };

        template <Scalar T>
        struct MatTraits<Mat4<T>>
        {
            static constexpr bool kIsMatrix = true;
            template <Scalar U> using Rebind = Mat4<U>;
        };
    } // namespace detail

    template <typename M>
    concept MatrixType = detail::MatTraits<M>::kIsMatrix;

    template <typename M>
    concept RealMatrixType = MatrixType<M> && RealScalar<typename M::ScalarType>;

    template <MatrixType M, Scalar U>
    using RebindMat = typename detail::MatTraits<M>::template Rebind<U>;

    // ------------------------------------------------------------------------
    // Scalar-domain conversions
    // ------------------------------------------------------------------------
    template <Scalar U, MatrixType M>
    [[nodiscard]] constexpr RebindMat<M, U> MatCast(const M& a) noexcept
    {
        RebindMat<M, U> res;
        for (usize c = 0; c < M::kDimension; ++c)
            for (usize r = 0; r < M::kDimension; ++r)
                res.m[c][r] = static_cast<U>(a.m[c][r]);
        return res;
    }

    template <MatrixType M>
    [[nodiscard]] constexpr RebindMat<M, int32> ToInt(const M& a) noexcept { return MatCast<int32>(a); }

    template <MatrixType M>
    [[nodiscard]] constexpr RebindMat<M, float32> ToFloat(const M& a) noexcept { return MatCast<float32>(a); }

    template <MatrixType M>
    [[nodiscard]] constexpr RebindMat<M, float64> ToDouble(const M& a) noexcept { return MatCast<float64>(a); }

    // ------------------------------------------------------------------------
    // Element-wise operators (any dimension, same scalar domain)
    // ------------------------------------------------------------------------
    template <MatrixType M> [[nodiscard]] constexpr M operator+(M lhs, const M& rhs) noexcept { return lhs += rhs; }
    template <MatrixType M> [[nodiscard]] constexpr M operator-(M lhs, const M& rhs) noexcept { return lhs -= rhs; }
    template <MatrixType M> [[nodiscard]] constexpr M operator*(M lhs, typename M::ScalarType s) noexcept { return lhs *= s; }
    template <MatrixType M> [[nodiscard]] constexpr M operator*(typename M::ScalarType s, M rhs) noexcept { return rhs *= s; }
    template <MatrixType M> [[nodiscard]] constexpr M operator/(M lhs, typename M::ScalarType s) noexcept { return lhs /= s; }

    template <MatrixType M>
    [[nodiscard]] constexpr bool operator==(const M& lhs, const M& rhs) noexcept
    {
        for (usize c = 0; c < M::kDimension; ++c)
            for (usize r = 0; r < M::kDimension; ++r)
                if (lhs.m[c][r] != rhs.m[c][r])
                    return false;
        return true;
    }

    template <MatrixType M>
    [[nodiscard]] constexpr bool operator!=(const M& lhs, const M& rhs) noexcept { return !(lhs == rhs); }

    // ------------------------------------------------------------------------
    // Matrix * Vector
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Apply a matrix to column vectors on the right.
    // Contract: Column-vector convention; no perspective divide.
    // Notes   : Written out per dimension to keep deterministic cost inline for hot loops.
    // ---
    template <Scalar T>
    [[nodiscard]] constexpr Vec2<T> operator*(const Mat2<T>& m, const Vec2<T>& v) noexcept
    {
        return Vec2<T>(
            m.m[0][0] * v.x + m.m[1][0] * v.y,
            m.m[0][1] * v.x + m.m[1][1] * v.y
        );
    }

    template <Scalar T>
    [[nodiscard]] constexpr Vec3<T> operator*(const Mat3<T>& m, const Vec3<T>& v) noexcept
    {
        return Vec3<T>(
            m.m[0][0] * v.x + m.m[1][0] * v.y + m.m[2][0] * v.z,
            m.m[0][1] * v.x + m.m[1][1] * v.y + m.m[2][1] * v.z,
            m.m[0][2] * v.x + m.m[1][2] * v.y + m.m[2][2] * v.z
        );
    }

    template <Scalar T>
    [[nodiscard]] constexpr Vec4<T> operator*(const Mat4<T>& m, const Vec4<T>& v) noexcept
    {
        return Vec4<T>(
            m.m[0][0] * v.x + m.m[1][0] * v.y + m.m[2][0] * v.z + m.m[3][0] * v.w,
            m.m[0][1] * v.x + m.m[1][1] * v.y + m.m[2][1] * v.z + m.m[3][1] * v.w,
            m.m[0][2] * v.x + m.m[1][2] * v.y + m.m[2][2] * v.z + m.m[3][2] * v.w,
            m.m[0][3] * v.x + m.m[1][3] * v.y + m.m[2][3] * v.z + m.m[3][3] * v.w
        );
    }

    // ------------------------------------------------------------------------
    // Matrix * Matrix
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Compose transforms using column-major semantics: (a * b) * v == a * (b * v).
    // Contract: Deterministic triple loop (no allocations); safe for constexpr use.
    // Notes   : Outer loop iterates over destination columns to improve cache friendliness.
    // ---
    template <MatrixType M>
    [[nodiscard]] constexpr M operator*(const M& a, const M& b) noexcept
    {
        constexpr usize N = M::kDimension;
        M res;
        for (usize c = 0; c < N; ++c)
        {
            for (usize r = 0; r < N; ++r)
            {
                typename M::ScalarType sum(0);
                for (usize k = 0; k < N; ++k)
                    sum += a.m[k][r] * b.m[c][k];
                res.m[c][r] = sum;
            }
        }
        return res;
    }

    // ------------------------------------------------------------------------
    // Mixed scalar domains
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Promote int/float/double matrix operands to their common scalar domain.
    // Contract: Same promotion rule as the vector operators (std::common_type of the scalars).
    // ---
    template <MatrixType M, MatrixType N>
        requires (M::kDimension == N::kDimension) && (!std::same_as<typename M::ScalarType, typename N::ScalarType>)
    [[nodiscard]] constexpr RebindMat<M, Promoted<typename M::ScalarType, typename N::ScalarType>> operator+(const M& a, const N& b) noexcept
    {
        using R = Promoted<typename M::ScalarType, typename N::ScalarType>;
        return MatCast<R>(a) + MatCast<R>(b);
    }

    template <MatrixType M, MatrixType N>
        requires (M::kDimension == N::kDimension) && (!std::same_as<typename M::ScalarType, typename N::ScalarType>)
    [[nodiscard]] constexpr RebindMat<M, Promoted<typename M::ScalarType, typename N::ScalarType>> operator-(const M& a, const N& b) noexcept
    {
        using R = Promoted<typename M::ScalarType, typename N::ScalarType>;
        return MatCast<R>(a) - MatCast<R>(b);
    }

    template <MatrixType M, MatrixType N>
        requires (M::kDimension == N::kDimension) && (!std::same_as<typename M::ScalarType, typename N::ScalarType>)
    [[nodiscard]] constexpr RebindMat<M, Promoted<typename M::ScalarType, typename N::ScalarType>> operator*(const M& a, const N& b) noexcept
    {
        using R = Promoted<typename M::ScalarType, typename N::ScalarType>;
        return MatCast<R>(a) * MatCast<R>(b);
    }

    template <MatrixType M, VectorType V>
        requires (M::kDimension == V::kDimension) && (!std::same_as<typename M::ScalarType, ScalarOf<V>>)
    [[nodiscard]] constexpr RebindVec<V, Promoted<typename M::ScalarType, ScalarOf<V>>> operator*(const M& a, const V& v) noexcept
    {
        using R = Promoted<typename M::ScalarType, ScalarOf<V>>;
        return MatCast<R>(a) * VecCast<R>(v);
    }

    template <MatrixType M, Scalar S>
        requires (!std::same_as<typename M::ScalarType, S>)
    [[nodiscard]] constexpr RebindMat<M, Promoted<typename M::ScalarType, S>> operator*(const M& a, S s) noexcept
    {
        using R = Promoted<typename M::ScalarType, S>;
        return MatCast<R>(a) * static_cast<R>(s);
    }

    template <MatrixType M, Scalar S>
        requires (!std::same_as<typename M::ScalarType, S>)
    [[nodiscard]] constexpr RebindMat<M, Promoted<typename M::ScalarType, S>> operator*(S s, const M& a) noexcept
    {
        return a * s;
    }

    // ------------------------------------------------------------------------
    // Shared algebra
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Transpose/Trace/Power for every dimension and scalar domain.
    // Contract: Power(m, 0) is identity; Power(m, n > 0) is m multiplied by itself n times (by repeated squaring);
    //           Power(m, n < 0) is Power(Transpose(m), -n), which equals the inverse power
    //           only when m is orthonormal (pure rotations/reflections).
    // Notes   : Use Inverse for general matrices.
    // ---
    template <MatrixType M>
    [[nodiscard]] constexpr M Transpose(const M& a) noexcept
    {
        M res;
        for (usize c = 0; c < M::kDimension; ++c)
            for (usize r = 0; r < M::kDimension; ++r)
                res.m[r][c] = a.m[c][r];
        return res;
    }

    template <MatrixType M>
    [[nodiscard]] constexpr typename M::ScalarType Trace(const M& a) noexcept
    {
        typename M::ScalarType sum(0);
        for (usize i = 0; i < M::kDimension; ++i)
            sum += a.m[i][i];
        return sum;
    }

    template <MatrixType M>
    [[nodiscard]] constexpr M Power(const M& a, int32 exponent) noexcept
    {
        M base = (exponent < 0) ? Transpose(a) : a;
        uint64 count = (exponent < 0) ? static_cast<uint64>(-static_cast<int64>(exponent)) : static_cast<uint64>(exponent);
        M res = M::Identity();
        // Square-and-multiply: O(log |exponent|) products.
        while (count != 0)
        {
            if (count & 1u)
                res = res * base;
            count >>= 1;
            if (count != 0)
                base = base * base;
        }
        return res;
    }

    template <RealMatrixType M>
    [[nodiscard]] inline bool IsNearlyEqual(const M& a, const M& b, typename M::ScalarType epsilon = EpsilonV<typename M::ScalarType>) noexcept
    {
        for (usize c = 0; c < M::kDimension; ++c)
            for (usize r = 0; r < M::kDimension; ++r)
                if (!IsNearlyEqual(a.m[c][r], b.m[c][r], epsilon))
                    return false;
        return true;
    }

    // ---
    // Purpose : Determinants by cofactor expansion, valid for all scalar domains.
    // Contract: Exact for int32 within range; no pivoting for reals.
    // ---
    template <Scalar T>
    [[nodiscard]] constexpr T Determinant(const Mat2<T>& a) noexcept
    {
        return a.m[0][0] * a.m[1][1] - a.m[1][0] * a.m[0][1];
    }

    template <Scalar T>
    [[nodiscard]] constexpr T Determinant(const Mat3<T>& a) noexcept
    {
        // Expansion along row 0; a(r, c) == a.m[c][r].
        return a.m[0][0] * (a.m[1][1] * a.m[2][2] - a.m[2][1] * a.m[1][2])
             - a.m[1][0] * (a.m[0][1] * a.m[2][2] - a.m[2][1] * a.m[0][2])
             + a.m[2][0] * (a.m[0][1] * a.m[1][2] - a.m[1][1] * a.m[0][2]);
    }

    template <Scalar T>
    [[nodiscard]] constexpr T Determinant(const Mat4<T>& a) noexcept
    {
        // 2x2 minors of rows 2 and 3.
        const T s0 = a.m[0][2] * a.m[1][3] - a.m[1][2] * a.m[0][3];
        const T s1 = a.m[0][2] * a.m[2][3] - a.m[2][2] * a.m[0][3];
        const T s2 = a.m[0][2] * a.m[3][3] - a.m[3][2] * a.m[0][3];
        const T s3 = a.m[1][2] * a.m[2][3] - a.m[2][2] * a.m[1][3];
        const T s4 = a.m[1][2] * a.m[3][3] - a.m[3][2] * a.m[1][3];
        const T s5 = a.m[2][2] * a.m[3][3] - a.m[3][2] * a.m[2][3];

        // Expansion along row 0 with row-1 cofactors built from the minors above.
        const T c0 = a.m[1][1] * s5 - a.m[2][1] * s4 + a.m[3][1] * s3;
        const T c1 = a.m[0][1] * s5 - a.m[2][1] * s2 + a.m[3][1] * s1;
        const T c2 = a.m[0][1] * s4 - a.m[1][1] * s2 + a.m[3][1] * s0;
        const T c3 = a.m[0][1] * s3 - a.m[1][1] * s1 + a.m[2][1] * s0;

        return a.m[0][0] * c0 - a.m[1][0] * c1 + a.m[2][0] * c2 - a.m[3][0] * c3;
    }

    // ------------------------------------------------------------------------
    // Heavy Operations (Implemented in Math.cpp)
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Compute the inverse of a real matrix via the adjugate.
    // Contract: Returns Identity when the matrix is singular (|det| <= epsilon * product of column lengths)
    //           and reports it through VMATH_MATH_ASSERT;
    //           noexcept; explicitly instantiated for float32 and float64.
    // Notes   : Suitable for affine transforms; no pivoting, so ill-conditioned inputs lose precision.
    // ---
    template <RealScalar T>
    [[nodiscard]] Mat2<T> Inverse(const Mat2<T>& m) noexcept;

    template <RealScalar T>
    [[nodiscard]] Mat3<T> Inverse(const Mat3<T>& m) noexcept;

    template <RealScalar T>
    [[nodiscard]] Mat4<T> Inverse(const Mat4<T>& m) noexcept;

} // namespace vmath

static_assert(std::is_trivially_copyable_v<vmath::Mat4f>, "Mat4f must stay POD");
static_assert(sizeof(vmath::Mat4f) == 16u * sizeof(vmath::float32), "Mat4f layout drifted from 16 floats");
static_assert(sizeof(vmath::Mat3d) == 9u * sizeof(vmath::float64), "Mat3d layout drifted from 9 doubles");
