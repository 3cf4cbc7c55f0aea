#pragma once
// ============================================================================
// VMath - Source/VMath/Math/Math.hpp
// ----------------------------------------------------------------------------
// Purpose : Scalar math functions, constants, scalar-domain concepts and
//           common utilities shared by vectors, matrices and colors.
// Contract: All functions are `constexpr` and `noexcept` where possible.
//           Angles are in Radians by default.
// Notes   : The three scalar domains are int32, float32 and float64.
// ============================================================================

#include "VMath/CoreMinimal.hpp"
#include <cmath>
#include <concepts>
#include <limits>
#include <numbers>
#include <type_traits>

// Category used by every math-side log line and precondition report.
#ifndef VMATH_MATH_LOG_CATEGORY
#define VMATH_MATH_LOG_CATEGORY "Math"
#endif

// Non-aborting precondition report under VMATH_MATH_LOG_CATEGORY.
#define VMATH_MATH_ASSERT(Expr, Msg) VMATH_ASSERT_CAT(VMATH_MATH_LOG_CATEGORY, Expr, Msg)

// Finite-input validation in out-of-line builders (Inverse, LookAt, ...).
#ifndef VMATH_MATH_VALIDATE
#define VMATH_MATH_VALIDATE VMATH_DEBUG
#endif

namespace vmath
{
    // ------------------------------------------------------------------------
    // Scalar domains
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Restrict vector/matrix templates to the supported scalar domains.
    // Contract: `Scalar` accepts int32/float32/float64; `RealScalar` only the floating-point pair.
    // Notes   : Geometric operations (Normalize, Reflect, Inverse, ...) require RealScalar.
    // ---
    template <typename T>
    concept Scalar = std::same_as<T, int32> || std::same_as<T, float32> || std::same_as<T, float64>;

    template <typename T>
    concept RealScalar = std::same_as<T, float32> || std::same_as<T, float64>;

    // ---
    // Purpose : Map a scalar to the floating-point type its lengths and angles are expressed in.
    // Contract: float32 -> float32, float64 -> float64, int32 -> float64.
    // Notes   : int32 widens to float64 so that lengths of large integer vectors stay exact.
    // ---
    template <Scalar T>
    using RealOf = std::conditional_t<std::is_floating_point_v<T>, T, float64>;

    // ------------------------------------------------------------------------
    // Constants
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Canonical math constants per floating-point domain.
    // Contract: Values are constexpr, finite, and reflect IEEE-754 magnitudes of T.
    // Notes   : The float32 shortcuts below drive Color and the float-first call sites.
    // ---
    template <RealScalar T>
    inline constexpr T PiV = std::numbers::pi_v<T>;

    template <RealScalar T>
    inline constexpr T EpsilonV = std::numeric_limits<T>::epsilon();

    constexpr float32 Pi = PiV<float32>;
    constexpr float32 TwoPi = 2.0f * Pi;
    constexpr float32 HalfPi = 0.5f * Pi;
    constexpr float32 Epsilon = EpsilonV<float32>;

    // ------------------------------------------------------------------------
    // Scalar Helpers
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Convert angles between degree and radian domains.
    // Contract: Accepts any finite real; constexpr/noexcept.
    // ---
    template <RealScalar T>
    [[nodiscard]] constexpr T Radians(T degrees) noexcept
    {
        return degrees * (PiV<T> / T(180));
    }

    template <RealScalar T>
    [[nodiscard]] constexpr T Degrees(T radians) noexcept
    {
        return radians * (T(180) / PiV<T>);
    }

    template <typename T>
    // ---
    // Purpose : Clamp a scalar to a closed interval.
    // Contract: Works for arithmetic types implementing `<` and copy semantics; branch-only, constexpr.
    // Notes   : Prefers inclusive bounds `[min, max]`; call sites must supply ordered limits.
    // ---
    [[nodiscard]] constexpr T Clamp(T value, T min, T max) noexcept
    {
        return (value < min) ? min : (value > max) ? max : value;
    }

    namespace detail
    {
        // Default Lerp policy: works for scalar types and POD-like structs
        // that support +, -, and scalar multiplication by the interpolant type.
        template <typename T>
        struct LerpPolicy
        {
            static constexpr bool kHasCustomLerp = false;

            // ---
            // Purpose : Provide a fallback linear interpolation for POD-like types.
            // Contract: Requires +, -, and scalar multiply overloads; pure constexpr, no heap interaction.
            // Notes   : Specialize this struct for types needing custom interpolation (e.g., Color).
            // ---
            template <typename S>
            [[nodiscard]] static constexpr T Lerp(const T& a, const T& b, S t) noexcept
            {
                return a + (b - a) * t;
            }
        };
    } // namespace detail

    template <typename T, RealScalar S>
    // ---
    // Purpose : Linearly interpolate between values a and b.
    // Contract: Accepts POD-like types that satisfy addition/subtraction and scalar multiply; `t` expected in [0,1].
    // Notes   : Takes inputs by value so temporaries/literals are cheap; specializations hook via LerpPolicy.
    // ---
    [[nodiscard]] constexpr T Lerp(T a, T b, S t) noexcept
    {
        return detail::LerpPolicy<T>::Lerp(a, b, t);
    }

    template <typename T>
    [[nodiscard]] constexpr T Min(T a, T b) noexcept
    {
        return (a < b) ? a : b;
    }

    template <typename T>
    [[nodiscard]] constexpr T Max(T a, T b) noexcept
    {
        return (a > b) ? a : b;
    }

    template <typename T>
    // ---
    // Purpose : Absolute value helper for signed arithmetic types.
    // Contract: Requires unary minus; constexpr/noexcept; no overflow guard beyond caller responsibility.
    // Notes   : Mirrors std::abs but constexpr and header-only.
    // ---
    [[nodiscard]] constexpr T Abs(T a) noexcept
    {
        return (a < T(0)) ? -a : a;
    }

    template <typename T>
    // ---
    // Purpose : Return the sign of a scalar (-1, 0, +1).
    // ---
    [[nodiscard]] constexpr T Sign(T a) noexcept
    {
        return (a < T(0)) ? T(-1) : (a > T(0)) ? T(1) : T(0);
    }

    // ---
    // Purpose : Clamp floats into the normalized [0,1] interval.
    // Notes   : Preferred for color/alpha saturations.
    // ---
    [[nodiscard]] constexpr float32 Saturate(float32 value) noexcept
    {
        return Clamp(value, 0.0f, 1.0f);
    }

    // ---
    // Purpose : Compare two reals with a configurable absolute tolerance.
    // Contract: Default epsilon equals machine epsilon of T; noexcept; NaN never compares equal.
    // Notes   : Use for deterministic tests rather than relying on ==.
    // ---
    template <RealScalar T>
    [[nodiscard]] constexpr bool IsNearlyEqual(T a, T b, T epsilon = EpsilonV<T>) noexcept
    {
        return Abs(a - b) <= epsilon;
    }

    template <RealScalar T>
    [[nodiscard]] constexpr bool IsNearlyZero(T value, T epsilon = EpsilonV<T>) noexcept
    {
        return Abs(value) <= epsilon;
    }

    // ---
    // Purpose : Validate that a real is finite (not NaN/Inf).
    // Contract: Thin wrapper around std::isfinite; noexcept.
    // ---
    template <RealScalar T>
    [[nodiscard]] inline bool IsFinite(T value) noexcept
    {
        return std::isfinite(value);
    }

    // ---
    // Purpose : Inline sqrt/trig wrappers keeping STL exposure centralized.
    // Contract: Accepts finite reals; delegates to <cmath>; noexcept.
    // Notes   : Overloads resolve to the float or double libm entry point.
    // ---
    template <RealScalar T>
    [[nodiscard]] inline T Sqrt(T value) noexcept
    {
        return std::sqrt(value);
    }

    template <RealScalar T>
    [[nodiscard]] inline T Tan(T radians) noexcept
    {
        return std::tan(radians);
    }

    template <RealScalar T>
    [[nodiscard]] inline T Cos(T radians) noexcept
    {
        return std::cos(radians);
    }

    template <RealScalar T>
    [[nodiscard]] inline T Sin(T radians) noexcept
    {
        return std::sin(radians);
    }

    template <RealScalar T>
    [[nodiscard]] inline T Acos(T value) noexcept
    {
        return std::acos(value);
    }

    template <RealScalar T>
    [[nodiscard]] inline T Atan2(T y, T x) noexcept
    {
        return std::atan2(y, x);
    }

    // ---
    // Purpose : Convert between scalar domains the way a C cast does.
    // Contract: Real -> int32 truncates toward zero; out-of-range reals are a caller error.
    // ---
    template <Scalar To, Scalar From>
    [[nodiscard]] constexpr To ScalarCast(From value) noexcept
    {
        return static_cast<To>(value);
    }

    // ------------------------------------------------------------------------
    // Diagnostics helpers
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Check if a squared length is approximately one within tolerance.
    // Contract: Avoids extra sqrt by operating on squared magnitudes; tolerance defaults to 1e-3.
    // ---
    template <RealScalar T>
    [[nodiscard]] constexpr bool IsUnitLength(T lengthSquared, T tolerance = T(1e-3)) noexcept
    {
        return IsNearlyEqual(lengthSquared, T(1), tolerance);
    }

    // ---
    // Purpose : Debug-time guard ensuring a real stays finite before use.
    // Contract: Active only when VMATH_MATH_VALIDATE is non-zero; otherwise compiles to no-op.
    // ---
    template <RealScalar T>
    inline void AssertFinite(T value) noexcept
    {
#if VMATH_MATH_VALIDATE
        VMATH_MATH_ASSERT(IsFinite(value), "Non-finite scalar detected.");
#else
        VMATH_UNUSED(value);
#endif
    }

} // namespace vmath
