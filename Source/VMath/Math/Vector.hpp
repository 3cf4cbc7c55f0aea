#pragma once
// ============================================================================
// VMath - Source/VMath/Math/Vector.hpp
// ----------------------------------------------------------------------------
// Purpose : Fixed-size vector templates (Vec2, Vec3, Vec4) over int32, float32
//           and float64, with the i/f/d aliases used across the library.
// Contract: POD types. Inline operators. Operators return new values; compound
//           assignment is only the building block of the binary operators.
// Notes   : Per-dimension primitives (Dot, Cross, component-wise ops) are written
//           out per type; formulas shared by every dimension (Length, Normalize,
//           Reflect, Project, ...) are written once against the VectorType concept.
// ============================================================================

#include "VMath/Math/Math.hpp"
#include <type_traits>

namespace vmath
{
    namespace detail
    {
        // Integer division by zero has no IEEE fallback: report and yield zero.
        template <Scalar T>
        [[nodiscard]] constexpr T DivideComponent(T a, T b) noexcept
        {
            if constexpr (std::is_integral_v<T>)
            {
                if (b == T(0))
                {
                    VMATH_MATH_ASSERT(b != T(0), "Integer vector division by zero; component forced to zero.");
                    return T(0);
                }
            }
            return a / b;
        }
    } // namespace detail

    // ------------------------------------------------------------------------
    // Vec2
    // ------------------------------------------------------------------------
    // ---
    // Purpose : POD 2D vector for screen-space, UV and planar geometry.
    // Contract: Layout {x,y}; trivially copyable; constructors constexpr/noexcept.
    // Notes   : Direction constants follow a Y-up convention (Up = +Y).
    // ---
    template <Scalar T>
    struct Vec2
    {
        using ScalarType = T;
        static constexpr usize kDimension = 2;

        T x, y;

        constexpr Vec2() noexcept : x(T(0)), y(T(0)) {}
        constexpr Vec2(T s) noexcept : x(s), y(s) {}
        constexpr Vec2(T _x, T _y) noexcept : x(_x), y(_y) {}

        static constexpr Vec2 Zero() noexcept { return Vec2(T(0)); }
        static constexpr Vec2 One() noexcept { return Vec2(T(1)); }
        static constexpr Vec2 Right() noexcept { return Vec2(T(1), T(0)); }
        static constexpr Vec2 Left() noexcept { return Vec2(T(-1), T(0)); }
        static constexpr Vec2 Up() noexcept { return Vec2(T(0), T(1)); }
        static constexpr Vec2 Down() noexcept { return Vec2(T(0), T(-1)); }

        // Out-of-range indices are reported and clamped to the last component.
        [[nodiscard]] constexpr T& operator[](usize i) noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Vec2 index out of range");
            return (i == 0) ? x : y;
        }
        [[nodiscard]] constexpr const T& operator[](usize i) const noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Vec2 index out of range");
            return (i == 0) ? x : y;
        }

        [[nodiscard]] constexpr Vec2 operator-() const noexcept { return Vec2(-x, -y); }

        constexpr Vec2& operator+=(const Vec2& rhs) noexcept { x += rhs.x; y += rhs.y; return *this; }
        constexpr Vec2& operator-=(const Vec2& rhs) noexcept { x -= rhs.x; y -= rhs.y; return *this; }
        constexpr Vec2& operator*=(const Vec2& rhs) noexcept { x *= rhs.x; y *= rhs.y; return *this; }
        constexpr Vec2& operator/=(const Vec2& rhs) noexcept
        {
            x = detail::DivideComponent(x, rhs.x);
            y = detail::DivideComponent(y, rhs.y);
            return *this;
        }
        constexpr Vec2& operator*=(T s) noexcept { x *= s; y *= s; return *this; }
        constexpr Vec2& operator/=(T s) noexcept
        {
            if constexpr (std::is_floating_point_v<T>)
            {
                T inv = T(1) / s; x *= inv; y *= inv;
                return *this;
            }
            else
            {
                return *this /= Vec2(s);
            }
        }
    };

    // ------------------------------------------------------------------------
    // Vec3
    // ------------------------------------------------------------------------
    // ---
    // Purpose : POD 3D vector used for positions, directions and normals.
    // Contract: Layout {x,y,z}; trivially copyable; constructors constexpr/noexcept.
    // Notes   : Forward is +Z, Backwards is -Z. Provides a Vec2-to-Vec3 bridge constructor.
    // ---
    template <Scalar T>
    struct Vec3
    {
        using ScalarType = T;
        static constexpr usize kDimension = 3;

        T x, y, z;

        constexpr Vec3() noexcept : x(T(0)), y(T(0)), z(T(0)) {}
        constexpr Vec3(T s) noexcept : x(s), y(s), z(s) {}
        constexpr Vec3(T _x, T _y, T _z) noexcept : x(_x), y(_y), z(_z) {}
        constexpr Vec3(const Vec2<T>& v, T _z) noexcept : x(v.x), y(v.y), z(_z) {}

        static constexpr Vec3 Zero() noexcept { return Vec3(T(0)); }
        static constexpr Vec3 One() noexcept { return Vec3(T(1)); }
        static constexpr Vec3 Right() noexcept { return Vec3(T(1), T(0), T(0)); }
        static constexpr Vec3 Left() noexcept { return Vec3(T(-1), T(0), T(0)); }
        static constexpr Vec3 Up() noexcept { return Vec3(T(0), T(1), T(0)); }
        static constexpr Vec3 Down() noexcept { return Vec3(T(0), T(-1), T(0)); }
        static constexpr Vec3 Forward() noexcept { return Vec3(T(0), T(0), T(1)); }
        static constexpr Vec3 Backwards() noexcept { return Vec3(T(0), T(0), T(-1)); }

        [[nodiscard]] constexpr Vec2<T> XY() const noexcept { return Vec2<T>(x, y); }

        [[nodiscard]] constexpr T& operator[](usize i) noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Vec3 index out of range");
            return (i == 0) ? x : (i == 1) ? y : z;
        }
        [[nodiscard]] constexpr const T& operator[](usize i) const noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Vec3 index out of range");
            return (i == 0) ? x : (i == 1) ? y : z;
        }

        [[nodiscard]] constexpr Vec3 operator-() const noexcept { return Vec3(-x, -y, -z); }

        constexpr Vec3& operator+=(const Vec3& rhs) noexcept { x += rhs.x; y += rhs.y; z += rhs.z; return *this; }
        constexpr Vec3& operator-=(const Vec3& rhs) noexcept { x -= rhs.x; y -= rhs.y; z -= rhs.z; return *this; }
        constexpr Vec3& operator*=(const Vec3& rhs) noexcept { x *= rhs.x; y *= rhs.y; z *= rhs.z; return *this; }
        constexpr Vec3& operator/=(const Vec3& rhs) noexcept
        {
            x = detail::DivideComponent(x, rhs.x);
            y = detail::DivideComponent(y, rhs.y);
            z = detail::DivideComponent(z, rhs.z);
            return *this;
        }
        constexpr Vec3& operator*=(T s) noexcept { x *= s; y *= s; z *= s; return *this; }
        constexpr Vec3& operator/=(T s) noexcept
        {
            if constexpr (std::is_floating_point_v<T>)
            {
                T inv = T(1) / s; x *= inv; y *= inv; z *= inv;
                return *this;
            }
            else
            {
                return *this /= Vec3(s);
            }
        }
    };

    // ------------------------------------------------------------------------
    // Vec4
    // ------------------------------------------------------------------------
    // ---
    // Purpose : POD 4D vector for homogeneous coordinates and RGBA payloads.
    // Contract: Layout {x,y,z,w}; trivially copyable; no implicit normalization.
    // Notes   : Supports Vec3 promotion with explicit w component.
    // ---
    template <Scalar T>
    struct Vec4
    {
        using ScalarType = T;
        static constexpr usize kDimension = 4;

        T x, y, z, w;

        constexpr Vec4() noexcept : x(T(0)), y(T(0)), z(T(0)), w(T(0)) {}
        constexpr Vec4(T s) noexcept : x(s), y(s), z(s), w(s) {}
        constexpr Vec4(T _x, T _y, T _z, T _w) noexcept : x(_x), y(_y), z(_z), w(_w) {}
        constexpr Vec4(const Vec3<T>& v, T _w) noexcept : x(v.x), y(v.y), z(v.z), w(_w) {}
        constexpr Vec4(const Vec2<T>& v, T _z, T _w) noexcept : x(v.x), y(v.y), z(_z), w(_w) {}

        static constexpr Vec4 Zero() noexcept { return Vec4(T(0)); }
        static constexpr Vec4 One() noexcept { return Vec4(T(1)); }
        static constexpr Vec4 Right() noexcept { return Vec4(T(1), T(0), T(0), T(0)); }
        static constexpr Vec4 Left() noexcept { return Vec4(T(-1), T(0), T(0), T(0)); }
        static constexpr Vec4 Up() noexcept { return Vec4(T(0), T(1), T(0), T(0)); }
        static constexpr Vec4 Down() noexcept { return Vec4(T(0), T(-1), T(0), T(0)); }

        [[nodiscard]] constexpr Vec2<T> XY() const noexcept { return Vec2<T>(x, y); }
        [[nodiscard]] constexpr Vec3<T> XYZ() const noexcept { return Vec3<T>(x, y, z); }

        [[nodiscard]] constexpr T& operator[](usize i) noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Vec4 index out of range");
            return (i == 0) ? x : (i == 1) ? y : (i == 2) ? z : w;
        }
        [[nodiscard]] constexpr const T& operator[](usize i) const noexcept
        {
            VMATH_MATH_ASSERT(i < kDimension, "Vec4 index out of range");
            return (i == 0) ? x : (i == 1) ? y : (i == 2) ? z : w;
        }

        [[nodiscard]] constexpr Vec4 operator-() const noexcept { return Vec4(-x, -y, -z, -w); }

        constexpr Vec4& operator+=(const Vec4& rhs) noexcept { x += rhs.x; y += rhs.y; z += rhs.z; w += rhs.w; return *this; }
        constexpr Vec4& operator-=(const Vec4& rhs) noexcept { x -= rhs.x; y -= rhs.y; z -= rhs.z; w -= rhs.w; return *this; }
        constexpr Vec4& operator*=(const Vec4& rhs) noexcept { x *= rhs.x; y *= rhs.y; z *= rhs.z; w *= rhs.w; return *this; }
        constexpr Vec4& operator/=(const Vec4& rhs) noexcept
        {
            x = detail::DivideComponent(x, rhs.x);
            y = detail::DivideComponent(y, rhs.y);
            z = detail::DivideComponent(z, rhs.z);
            w = detail::DivideComponent(w, rhs.w);
            return *this;
        }
        constexpr Vec4& operator*=(T s) noexcept { x *= s; y *= s; z *= s; w *= s; return *this; }
        constexpr Vec4& operator/=(T s) noexcept
        {
            if constexpr (std::is_floating_point_v<T>)
            {
                T inv = T(1) / s; x *= inv; y *= inv; z *= inv; w *= inv;
                return *this;
            }
            else
            {
                return *this /= Vec4(s);
            }
        }
    };

    using Vec2i = Vec2<int32>;
    using Vec2f = Vec2<float32>;
    using Vec2d = Vec2<float64>;
    using Vec3i = Vec3<int32>;
    using Vec3f = Vec3<float32>;
    using Vec3d = Vec3<float64>;
    using Vec4i = Vec4<int32>;
    using Vec4f = Vec4<float32>;
    using Vec4d = Vec4<float64>;

    // ------------------------------------------------------------------------
    // Vector traits
    // ------------------------------------------------------------------------
    namespace detail
    {
        template <typename V>
        struct VecTraits
        {
            static constexpr bool kIsVector = false;
        };

        template <Scalar T>
        struct VecTraits<Vec2<T>>
        {
            static constexpr bool kIsVector = true;
            using ScalarType = T;
            template <Scalar U> using Rebind = Vec2<U>;
        };

        template <Scalar T>
        struct VecTraits<Vec3<T>>
        {
            static constexpr bool kIsVector = true;
            using ScalarType = T;
            template <Scalar U> using Rebind = Vec3<U>;
        };

        template <Scalar T>
        struct VecTraits<Vec4<T>>
        {
            static constexpr bool kIsVector = true;
            using ScalarType = T;
            template <Scalar U> using Rebind = Vec4<U>;
        };
    } // namespace detail

    // ---
    // Purpose : Concepts naming "any library vector" and "any real-valued library vector".
    // Contract: Satisfied by Vec2/Vec3/Vec4 of a supported scalar only.
    // Notes   : Shared formulas below are constrained on these rather than repeated per dimension.
    // ---
    template <typename V>
    concept VectorType = detail::VecTraits<V>::kIsVector;

    template <typename V>
    concept RealVectorType = VectorType<V> && RealScalar<typename detail::VecTraits<V>::ScalarType>;

    template <VectorType V>
    using ScalarOf = typename detail::VecTraits<V>::ScalarType;

    template <VectorType V, Scalar U>
    using RebindVec = typename detail::VecTraits<V>::template Rebind<U>;

    // ------------------------------------------------------------------------
    // Scalar-domain conversions
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Convert a vector between scalar domains component by component.
    // Contract: Real -> int32 truncates toward zero (C cast semantics).
    // ---
    template <Scalar U, Scalar T>
    [[nodiscard]] constexpr Vec2<U> VecCast(const Vec2<T>& v) noexcept
    {
        return Vec2<U>(static_cast<U>(v.x), static_cast<U>(v.y));
    }

    template <Scalar U, Scalar T>
    [[nodiscard]] constexpr Vec3<U> VecCast(const Vec3<T>& v) noexcept
    {
        return Vec3<U>(static_cast<U>(v.x), static_cast<U>(v.y), static_cast<U>(v.z));
    }

    template <Scalar U, Scalar T>
    [[nodiscard]] constexpr Vec4<U> VecCast(const Vec4<T>& v) noexcept
    {
        return Vec4<U>(static_cast<U>(v.x), static_cast<U>(v.y), static_cast<U>(v.z), static_cast<U>(v.w));
    }

    template <VectorType V>
    [[nodiscard]] constexpr RebindVec<V, int32> ToInt(const V& v) noexcept { return VecCast<int32>(v); }

    template <VectorType V>
    [[nodiscard]] constexpr RebindVec<V, float32> ToFloat(const V& v) noexcept { return VecCast<float32>(v); }

    template <VectorType V>
    [[nodiscard]] constexpr RebindVec<V, float64> ToDouble(const V& v) noexcept { return VecCast<float64>(v); }

    // ------------------------------------------------------------------------
    // Operators (same scalar domain)
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Standard arithmetic helpers keep vector ergonomics inline.
    // Contract: Operators are component-wise, constexpr/noexcept, and avoid hidden temporaries beyond pass-by-value copies.
    // Notes   : `v * v` is the component-wise (Hadamard) product, mirroring GLSL.
    // ---
    template <Scalar T> [[nodiscard]] constexpr Vec2<T> operator+(Vec2<T> lhs, const Vec2<T>& rhs) noexcept { return lhs += rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec2<T> operator-(Vec2<T> lhs, const Vec2<T>& rhs) noexcept { return lhs -= rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec2<T> operator*(Vec2<T> lhs, const Vec2<T>& rhs) noexcept { return lhs *= rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec2<T> operator/(Vec2<T> lhs, const Vec2<T>& rhs) noexcept { return lhs /= rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec2<T> operator*(Vec2<T> lhs, T s) noexcept { return lhs *= s; }
    template <Scalar T> [[nodiscard]] constexpr Vec2<T> operator*(T s, Vec2<T> rhs) noexcept { return rhs *= s; }
    template <Scalar T> [[nodiscard]] constexpr Vec2<T> operator/(Vec2<T> lhs, T s) noexcept { return lhs /= s; }
    template <Scalar T> [[nodiscard]] constexpr bool operator==(const Vec2<T>& lhs, const Vec2<T>& rhs) noexcept { return lhs.x == rhs.x && lhs.y == rhs.y; }
    template <Scalar T> [[nodiscard]] constexpr bool operator!=(const Vec2<T>& lhs, const Vec2<T>& rhs) noexcept { return !(lhs == rhs); }

    template <Scalar T> [[nodiscard]] constexpr Vec3<T> operator+(Vec3<T> lhs, const Vec3<T>& rhs) noexcept { return lhs += rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec3<T> operator-(Vec3<T> lhs, const Vec3<T>& rhs) noexcept { return lhs -= rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec3<T> operator*(Vec3<T> lhs, const Vec3<T>& rhs) noexcept { return lhs *= rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec3<T> operator/(Vec3<T> lhs, const Vec3<T>& rhs) noexcept { return lhs /= rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec3<T> operator*(Vec3<T> lhs, T s) noexcept { return lhs *= s; }
    template <Scalar T> [[nodiscard]] constexpr Vec3<T> operator*(T s, Vec3<T> rhs) noexcept { return rhs *= s; }
    template <Scalar T> [[nodiscard]] constexpr Vec3<T> operator/(Vec3<T> lhs, T s) noexcept { return lhs /= s; }
    template <Scalar T> [[nodiscard]] constexpr bool operator==(const Vec3<T>& lhs, const Vec3<T>& rhs) noexcept { return lhs.x == rhs.x && lhs.y == rhs.y && lhs.z == rhs.z; }
    template <Scalar T> [[nodiscard]] constexpr bool operator!=(const Vec3<T>& lhs, const Vec3<T>& rhs) noexcept { return !(lhs == rhs); }

    template <Scalar T> [[nodiscard]] constexpr Vec4<T> operator+(Vec4<T> lhs, const Vec4<T>& rhs) noexcept { return lhs += rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec4<T> operator-(Vec4<T> lhs, const Vec4<T>& rhs) noexcept { return lhs -= rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec4<T> operator*(Vec4<T> lhs, const Vec4<T>& rhs) noexcept { return lhs *= rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec4<T> operator/(Vec4<T> lhs, const Vec4<T>& rhs) noexcept { return lhs /= rhs; }
    template <Scalar T> [[nodiscard]] constexpr Vec4<T> operator*(Vec4<T> lhs, T s) noexcept { return lhs *= s; }
    template <Scalar T> [[nodiscard]] constexpr Vec4<T> operator*(T s, Vec4<T> rhs) noexcept { return rhs *= s; }
    template <Scalar T> [[nodiscard]] constexpr Vec4<T> operator/(Vec4<T> lhs, T s) noexcept { return lhs /= s; }
    template <Scalar T> [[nodiscard]] constexpr bool operator==(const Vec4<T>& lhs, const Vec4<T>& rhs) noexcept { return lhs.x == rhs.x && lhs.y == rhs.y && lhs.z == rhs.z && lhs.w == rhs.w; }
    template <Scalar T> [[nodiscard]] constexpr bool operator!=(const Vec4<T>& lhs, const Vec4<T>& rhs) noexcept { return !(lhs == rhs); }

    // ------------------------------------------------------------------------
    // Operators (mixed scalar domains)
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Let int/float/double operands meet without spelling out casts.
    // Contract: Both operands are promoted to std::common_type of their scalars
    //           (int32+float32 -> float32, anything+float64 -> float64) before the
    //           same-domain operator runs.
    // Notes   : Only participates when the scalars differ, so same-domain calls never pay for it.
    // ---
    template <Scalar A, Scalar B>
    using Promoted = std::common_type_t<A, B>;

    template <VectorType V, VectorType W>
        requires (V::kDimension == W::kDimension) && (!std::same_as<ScalarOf<V>, ScalarOf<W>>)
    [[nodiscard]] constexpr RebindVec<V, Promoted<ScalarOf<V>, ScalarOf<W>>> operator+(const V& a, const W& b) noexcept
    {
        using R = Promoted<ScalarOf<V>, ScalarOf<W>>;
        return VecCast<R>(a) + VecCast<R>(b);
    }

    template <VectorType V, VectorType W>
        requires (V::kDimension == W::kDimension) && (!std::same_as<ScalarOf<V>, ScalarOf<W>>)
    [[nodiscard]] constexpr RebindVec<V, Promoted<ScalarOf<V>, ScalarOf<W>>> operator-(const V& a, const W& b) noexcept
    {
        using R = Promoted<ScalarOf<V>, ScalarOf<W>>;
        return VecCast<R>(a) - VecCast<R>(b);
    }

    template <VectorType V, VectorType W>
        requires (V::kDimension == W::kDimension) && (!std::same_as<ScalarOf<V>, ScalarOf<W>>)
    [[nodiscard]] constexpr RebindVec<V, Promoted<ScalarOf<V>, ScalarOf<W>>> operator*(const V& a, const W& b) noexcept
    {
        using R = Promoted<ScalarOf<V>, ScalarOf<W>>;
        return VecCast<R>(a) * VecCast<R>(b);
    }

    template <VectorType V, Scalar S>
        requires (!std::same_as<ScalarOf<V>, S>)
    [[nodiscard]] constexpr RebindVec<V, Promoted<ScalarOf<V>, S>> operator*(const V& v, S s) noexcept
    {
        using R = Promoted<ScalarOf<V>, S>;
        return VecCast<R>(v) * static_cast<R>(s);
    }

    template <VectorType V, Scalar S>
        requires (!std::same_as<ScalarOf<V>, S>)
    [[nodiscard]] constexpr RebindVec<V, Promoted<ScalarOf<V>, S>> operator*(S s, const V& v) noexcept
    {
        return v * s;
    }

    template <VectorType V, Scalar S>
        requires (!std::same_as<ScalarOf<V>, S>)
    [[nodiscard]] constexpr RebindVec<V, Promoted<ScalarOf<V>, S>> operator/(const V& v, S s) noexcept
    {
        using R = Promoted<ScalarOf<V>, S>;
        return VecCast<R>(v) / static_cast<R>(s);
    }

    // ------------------------------------------------------------------------
    // Per-dimension primitives
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Dot/Cross plus component-wise Abs/Min/Max/Clamp for each dimension.
    // Contract: Cross assumes a right-handed coordinate system; Cross of two Vec2 is the
    //           z component of the cross product of the embedded 3D vectors.
    // Notes   : Keep inline for hot loops; no hidden allocations.
    // ---
    template <Scalar T> [[nodiscard]] constexpr T Dot(const Vec2<T>& a, const Vec2<T>& b) noexcept { return a.x * b.x + a.y * b.y; }
    template <Scalar T> [[nodiscard]] constexpr T Dot(const Vec3<T>& a, const Vec3<T>& b) noexcept { return a.x * b.x + a.y * b.y + a.z * b.z; }
    template <Scalar T> [[nodiscard]] constexpr T Dot(const Vec4<T>& a, const Vec4<T>& b) noexcept { return a.x * b.x + a.y * b.y + a.z * b.z + a.w * b.w; }

    template <Scalar T>
    [[nodiscard]] constexpr Vec3<T> Cross(const Vec3<T>& a, const Vec3<T>& b) noexcept
    {
        return Vec3<T>(
            a.y * b.z - a.z * b.y,
            a.z * b.x - a.x * b.z,
            a.x * b.y - a.y * b.x
        );
    }

    template <Scalar T>
    [[nodiscard]] constexpr T Cross(const Vec2<T>& a, const Vec2<T>& b) noexcept
    {
        return a.x * b.y - a.y * b.x;
    }

    template <Scalar T> [[nodiscard]] constexpr Vec2<T> Abs(const Vec2<T>& v) noexcept { return Vec2<T>(Abs(v.x), Abs(v.y)); }
    template <Scalar T> [[nodiscard]] constexpr Vec3<T> Abs(const Vec3<T>& v) noexcept { return Vec3<T>(Abs(v.x), Abs(v.y), Abs(v.z)); }
    template <Scalar T> [[nodiscard]] constexpr Vec4<T> Abs(const Vec4<T>& v) noexcept { return Vec4<T>(Abs(v.x), Abs(v.y), Abs(v.z), Abs(v.w)); }

    template <Scalar T> [[nodiscard]] constexpr Vec2<T> Min(const Vec2<T>& a, const Vec2<T>& b) noexcept { return Vec2<T>(Min(a.x, b.x), Min(a.y, b.y)); }
    template <Scalar T> [[nodiscard]] constexpr Vec3<T> Min(const Vec3<T>& a, const Vec3<T>& b) noexcept { return Vec3<T>(Min(a.x, b.x), Min(a.y, b.y), Min(a.z, b.z)); }
    template <Scalar T> [[nodiscard]] constexpr Vec4<T> Min(const Vec4<T>& a, const Vec4<T>& b) noexcept { return Vec4<T>(Min(a.x, b.x), Min(a.y, b.y), Min(a.z, b.z), Min(a.w, b.w)); }

    template <Scalar T> [[nodiscard]] constexpr Vec2<T> Max(const Vec2<T>& a, const Vec2<T>& b) noexcept { return Vec2<T>(Max(a.x, b.x), Max(a.y, b.y)); }
    template <Scalar T> [[nodiscard]] constexpr Vec3<T> Max(const Vec3<T>& a, const Vec3<T>& b) noexcept { return Vec3<T>(Max(a.x, b.x), Max(a.y, b.y), Max(a.z, b.z)); }
    template <Scalar T> [[nodiscard]] constexpr Vec4<T> Max(const Vec4<T>& a, const Vec4<T>& b) noexcept { return Vec4<T>(Max(a.x, b.x), Max(a.y, b.y), Max(a.z, b.z), Max(a.w, b.w)); }

    template <Scalar T> [[nodiscard]] constexpr T Sum(const Vec2<T>& v) noexcept { return v.x + v.y; }
    template <Scalar T> [[nodiscard]] constexpr T Sum(const Vec3<T>& v) noexcept { return v.x + v.y + v.z; }
    template <Scalar T> [[nodiscard]] constexpr T Sum(const Vec4<T>& v) noexcept { return v.x + v.y + v.z + v.w; }

    template <Scalar T>
    [[nodiscard]] constexpr Vec2<T> Clamp(const Vec2<T>& v, const Vec2<T>& lo, const Vec2<T>& hi) noexcept
    {
        return Vec2<T>(Clamp(v.x, lo.x, hi.x), Clamp(v.y, lo.y, hi.y));
    }
    template <Scalar T>
    [[nodiscard]] constexpr Vec3<T> Clamp(const Vec3<T>& v, const Vec3<T>& lo, const Vec3<T>& hi) noexcept
    {
        return Vec3<T>(Clamp(v.x, lo.x, hi.x), Clamp(v.y, lo.y, hi.y), Clamp(v.z, lo.z, hi.z));
    }
    template <Scalar T>
    [[nodiscard]] constexpr Vec4<T> Clamp(const Vec4<T>& v, const Vec4<T>& lo, const Vec4<T>& hi) noexcept
    {
        return Vec4<T>(Clamp(v.x, lo.x, hi.x), Clamp(v.y, lo.y, hi.y), Clamp(v.z, lo.z, hi.z), Clamp(v.w, lo.w, hi.w));
    }

    // ------------------------------------------------------------------------
    // Shared formulas (every dimension, every scalar)
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Length/distance/angle helpers built on Dot.
    // Contract: LengthSquared stays in the vector's scalar domain; Length, Distance and
    //           AngleBetween are computed in RealOf<T> after widening the components.
    // Notes   : AngleBetween returns radians in [0, Pi]; a zero-length operand is a
    //           precondition violation reported via VMATH_MATH_ASSERT and yields 0.
    //           Any non-zero length is accepted, however short.
    // ---
    template <VectorType V>
    [[nodiscard]] constexpr ScalarOf<V> LengthSquared(const V& v) noexcept
    {
        return Dot(v, v);
    }

    template <VectorType V>
    [[nodiscard]] inline RealOf<ScalarOf<V>> Length(const V& v) noexcept
    {
        using R = RealOf<ScalarOf<V>>;
        return Sqrt(LengthSquared(VecCast<R>(v)));
    }

    template <VectorType V>
    [[nodiscard]] constexpr ScalarOf<V> DistanceSquared(const V& from, const V& to) noexcept
    {
        return LengthSquared(to - from);
    }

    template <VectorType V>
    [[nodiscard]] inline RealOf<ScalarOf<V>> Distance(const V& from, const V& to) noexcept
    {
        using R = RealOf<ScalarOf<V>>;
        return Length(VecCast<R>(to) - VecCast<R>(from));
    }

    template <VectorType V>
    [[nodiscard]] inline RealOf<ScalarOf<V>> AngleBetween(const V& a, const V& b) noexcept
    {
        using R = RealOf<ScalarOf<V>>;
        const auto ra = VecCast<R>(a);
        const auto rb = VecCast<R>(b);
        const R lengthA = Sqrt(LengthSquared(ra));
        const R lengthB = Sqrt(LengthSquared(rb));
        const bool degenerate = (lengthA == R(0)) || (lengthB == R(0));
        if (degenerate)
        {
            VMATH_MATH_ASSERT(!degenerate, "AngleBetween called with a zero-length vector; returning 0.");
            return R(0);
        }
        // Normalize each operand first; the product of two short lengths can underflow.
        return Acos(Clamp(Dot(ra / lengthA, rb / lengthB), R(-1), R(1)));
    }

    // ---
    // Purpose : Real-only geometric operations (normalize, reflect, project, ...).
    // Contract: Normalize returns the zero vector when the input is degenerate (|v|^2 <= epsilon).
    //           Reflect/Bounce/Slide expect `n` to be unit length; Project expects a non-zero `onto`.
    // Notes   : Reflect mirrors v across the plane orthogonal to n; Bounce is its opposite;
    //           Slide removes the component along n.
    // ---
    template <RealVectorType V>
    [[nodiscard]] inline V Normalize(const V& v) noexcept
    {
        using T = ScalarOf<V>;
        const T lenSq = LengthSquared(v);
        if (lenSq > EpsilonV<T>)
            return v * (T(1) / Sqrt(lenSq));
        return V(T(0));
    }

    template <RealVectorType V>
    [[nodiscard]] inline bool IsNormalized(const V& v, ScalarOf<V> tolerance = ScalarOf<V>(1e-3)) noexcept
    {
        return IsUnitLength(LengthSquared(v), tolerance);
    }

    template <RealVectorType V>
    [[nodiscard]] inline V DirectionTo(const V& from, const V& to) noexcept
    {
        return Normalize(to - from);
    }

    template <RealVectorType V>
    [[nodiscard]] constexpr V Reflect(const V& v, const V& n) noexcept
    {
        using T = ScalarOf<V>;
        return v - n * (T(2) * Dot(v, n));
    }

    template <RealVectorType V>
    [[nodiscard]] constexpr V Bounce(const V& v, const V& n) noexcept
    {
        return -Reflect(v, n);
    }

    template <RealVectorType V>
    [[nodiscard]] constexpr V Slide(const V& v, const V& n) noexcept
    {
        return v - n * Dot(v, n);
    }

    template <RealVectorType V>
    [[nodiscard]] inline V Project(const V& v, const V& onto) noexcept
    {
        using T = ScalarOf<V>;
        const T ontoLenSq = LengthSquared(onto);
        if (ontoLenSq <= EpsilonV<T>)
        {
            VMATH_MATH_ASSERT(ontoLenSq > EpsilonV<T>, "Project onto a zero-length vector; returning zero.");
            return V(T(0));
        }
        return onto * (Dot(v, onto) / ontoLenSq);
    }

    template <RealVectorType V>
    [[nodiscard]] inline bool IsNearlyEqual(const V& a, const V& b, ScalarOf<V> epsilon = EpsilonV<ScalarOf<V>>) noexcept
    {
        for (usize i = 0; i < V::kDimension; ++i)
        {
            if (!IsNearlyEqual(a[i], b[i], epsilon))
                return false;
        }
        return true;
    }

    // ------------------------------------------------------------------------
    // Vec2 extras
    // ------------------------------------------------------------------------
    // ---
    // Purpose : Planar helpers: perpendicular, aspect ratio, polar angle and rotation.
    // Contract: Perpendicular rotates +90 degrees (counter-clockwise); Aspect is x / y in RealOf<T>;
    //           Angle is atan2(y, x) in (-Pi, Pi]; Rotated turns counter-clockwise by `radians`.
    // ---
    template <Scalar T>
    [[nodiscard]] constexpr Vec2<T> Perpendicular(const Vec2<T>& v) noexcept
    {
        return Vec2<T>(-v.y, v.x);
    }

    template <Scalar T>
    [[nodiscard]] constexpr RealOf<T> Aspect(const Vec2<T>& v) noexcept
    {
        return static_cast<RealOf<T>>(v.x) / static_cast<RealOf<T>>(v.y);
    }

    template <RealScalar T>
    [[nodiscard]] inline T Angle(const Vec2<T>& v) noexcept
    {
        return Atan2(v.y, v.x);
    }

    template <RealScalar T>
    [[nodiscard]] inline Vec2<T> Rotated(const Vec2<T>& v, T radians) noexcept
    {
        const T c = Cos(radians);
        const T s = Sin(radians);
        return Vec2<T>(v.x * c - v.y * s, v.x * s + v.y * c);
    }

} // namespace vmath

static_assert(std::is_trivially_copyable_v<vmath::Vec3f>, "Vec3f must stay POD");
static_assert(sizeof(vmath::Vec4f) == 4u * sizeof(vmath::float32), "Vec4f layout drifted from 4 floats");
static_assert(sizeof(vmath::Vec3d) == 3u * sizeof(vmath::float64), "Vec3d layout drifted from 3 doubles");
