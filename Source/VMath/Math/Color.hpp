#pragma once
// ============================================================================
// VMath - Source/VMath/Math/Color.hpp
// ----------------------------------------------------------------------------
// Purpose : Linear RGBA color value layered on Vec4f.
// Contract: Components are float32, nominally in [0,1] but not clamped implicitly;
//           arithmetic is component-wise and routed through Vec4f.
// Notes   : 8-bit packing clamps to [0,1] then rounds to the nearest step.
//           Packing and blending live in Color.cpp.
// ============================================================================

#include "VMath/Math/Vector.hpp"
#include <type_traits>

namespace vmath
{
    // ---
    // Purpose : RGBA color used for shading inputs, vertex colors and UI tints.
    // Contract: Layout {r,g,b,a}; trivially copyable; default-constructs to opaque black.
    // Notes   : The three-component constructor and Vec3f conversion imply alpha = 1.
    // ---
    struct Color
    {
        float32 r, g, b, a;

        constexpr Color() noexcept : r(0.0f), g(0.0f), b(0.0f), a(1.0f) {}
        constexpr Color(float32 _r, float32 _g, float32 _b, float32 _a = 1.0f) noexcept : r(_r), g(_g), b(_b), a(_a) {}
        constexpr explicit Color(const Vec3f& rgb, float32 _a = 1.0f) noexcept : r(rgb.x), g(rgb.y), b(rgb.z), a(_a) {}
        constexpr explicit Color(const Vec4f& rgba) noexcept : r(rgba.x), g(rgba.y), b(rgba.z), a(rgba.w) {}

        static constexpr Color Black() noexcept { return Color(0.0f, 0.0f, 0.0f); }
        static constexpr Color White() noexcept { return Color(1.0f, 1.0f, 1.0f); }
        static constexpr Color Transparent() noexcept { return Color(0.0f, 0.0f, 0.0f, 0.0f); }
        static constexpr Color Red() noexcept { return Color(1.0f, 0.0f, 0.0f); }
        static constexpr Color Green() noexcept { return Color(0.0f, 1.0f, 0.0f); }
        static constexpr Color Blue() noexcept { return Color(0.0f, 0.0f, 1.0f); }
        static constexpr Color Yellow() noexcept { return Color(1.0f, 1.0f, 0.0f); }
        static constexpr Color Cyan() noexcept { return Color(0.0f, 1.0f, 1.0f); }
        static constexpr Color Magenta() noexcept { return Color(1.0f, 0.0f, 1.0f); }
        static constexpr Color Gray() noexcept { return Color(0.5f, 0.5f, 0.5f); }

        // ---
        // Purpose : Build colors from 8-bit channels and packed 32-bit hex codes.
        // Contract: FromRGBA8 expects channels in [0,255]; out-of-range values are reported and clamped.
        //           FromHexRGBA reads 0xRRGGBBAA, FromHexARGB reads 0xAARRGGBB.
        // ---
        [[nodiscard]] static Color FromRGBA8(int32 r8, int32 g8, int32 b8, int32 a8 = 255) noexcept;
        [[nodiscard]] static Color FromHexRGBA(uint32 rgba) noexcept;
        [[nodiscard]] static Color FromHexARGB(uint32 argb) noexcept;

        [[nodiscard]] constexpr Vec3f ToVec3() const noexcept { return Vec3f(r, g, b); }
        [[nodiscard]] constexpr Vec4f ToVec4() const noexcept { return Vec4f(r, g, b, a); }

        // Packed 8-bit forms: 0xRRGGBBAA and 0xAARRGGBB.
        [[nodiscard]] uint32 ToRGBA8() const noexcept;
        [[nodiscard]] uint32 ToARGB8() const noexcept;

        [[nodiscard]] uint8 Red8() const noexcept;
        [[nodiscard]] uint8 Green8() const noexcept;
        [[nodiscard]] uint8 Blue8() const noexcept;
        [[nodiscard]] uint8 Alpha8() const noexcept;

        constexpr Color& operator+=(const Color& rhs) noexcept { return *this = Color(ToVec4() + rhs.ToVec4()); }
        constexpr Color& operator-=(const Color& rhs) noexcept { return *this = Color(ToVec4() - rhs.ToVec4()); }
        constexpr Color& operator*=(const Color& rhs) noexcept { return *this = Color(ToVec4() * rhs.ToVec4()); }
        constexpr Color& operator*=(float32 s) noexcept { return *this = Color(ToVec4() * s); }
        constexpr Color& operator/=(float32 s) noexcept { return *this = Color(ToVec4() / s); }
    };

    [[nodiscard]] constexpr Color operator+(Color lhs, const Color& rhs) noexcept { return lhs += rhs; }
    [[nodiscard]] constexpr Color operator-(Color lhs, const Color& rhs) noexcept { return lhs -= rhs; }
    [[nodiscard]] constexpr Color operator*(Color lhs, const Color& rhs) noexcept { return lhs *= rhs; }
    [[nodiscard]] constexpr Color operator*(Color lhs, float32 s) noexcept { return lhs *= s; }
    [[nodiscard]] constexpr Color operator*(float32 s, Color rhs) noexcept { return rhs *= s; }
    [[nodiscard]] constexpr Color operator/(Color lhs, float32 s) noexcept { return lhs /= s; }

    [[nodiscard]] constexpr bool operator==(const Color& lhs, const Color& rhs) noexcept
    {
        return lhs.ToVec4() == rhs.ToVec4();
    }
    [[nodiscard]] constexpr bool operator!=(const Color& lhs, const Color& rhs) noexcept { return !(lhs == rhs); }

    [[nodiscard]] inline bool IsNearlyEqual(const Color& lhs, const Color& rhs, float32 epsilon = 1e-4f) noexcept
    {
        return IsNearlyEqual(lhs.ToVec4(), rhs.ToVec4(), epsilon);
    }

    // ------------------------------------------------------------------------
    // Color operations
    // ------------------------------------------------------------------------

    // rgb -> 1 - rgb; alpha is preserved.
    [[nodiscard]] constexpr Color Invert(const Color& c) noexcept
    {
        return Color(1.0f - c.r, 1.0f - c.g, 1.0f - c.b, c.a);
    }

    [[nodiscard]] constexpr Color Saturate(const Color& c) noexcept
    {
        return Color(Saturate(c.r), Saturate(c.g), Saturate(c.b), Saturate(c.a));
    }

    // ---
    // Purpose : Relative luminance with Rec. 709 weights on linear rgb.
    // Contract: Alpha ignored; result in [0,1] for in-gamut inputs.
    // ---
    [[nodiscard]] constexpr float32 Luminance(const Color& c) noexcept
    {
        return Dot(c.ToVec3(), Vec3f(0.2126f, 0.7152f, 0.0722f));
    }

    [[nodiscard]] constexpr Color Grayscale(const Color& c) noexcept
    {
        const float32 l = Luminance(c);
        return Color(l, l, l, c.a);
    }

    // ---
    // Purpose : Move rgb toward white (Lighten) or black (Darken) by `amount`.
    // Contract: `amount` is saturated to [0,1]; 0 leaves the color unchanged, 1 yields white/black; alpha preserved.
    // ---
    [[nodiscard]] constexpr Color Lighten(const Color& c, float32 amount) noexcept
    {
        const float32 t = Saturate(amount);
        return Color(c.ToVec3() + (Vec3f(1.0f) - c.ToVec3()) * t, c.a);
    }

    [[nodiscard]] constexpr Color Darken(const Color& c, float32 amount) noexcept
    {
        const float32 t = Saturate(amount);
        return Color(c.ToVec3() * (1.0f - t), c.a);
    }

    // ---
    // Purpose : Composite `over` on top of `base` using straight-alpha "over".
    // Contract: out.a = over.a + base.a * (1 - over.a); rgb is the alpha-weighted mix divided by out.a.
    //           A fully transparent result is Transparent() (no division by zero).
    // ---
    [[nodiscard]] Color Blend(const Color& base, const Color& over) noexcept;

    namespace detail
    {
        template <>
        struct LerpPolicy<Color>
        {
            static constexpr bool kHasCustomLerp = true;

            // ---
            // Purpose : Interpolate all four channels through Vec4f.
            // Contract: `t` is saturated to [0,1] so the result never leaves the segment between a and b.
            // ---
            template <typename S>
            [[nodiscard]] static constexpr Color Lerp(const Color& a, const Color& b, S t) noexcept
            {
                const float32 s = Saturate(static_cast<float32>(t));
                return Color(a.ToVec4() + (b.ToVec4() - a.ToVec4()) * s);
            }
        };
    } // namespace detail

} // namespace vmath

static_assert(std::is_trivially_copyable_v<vmath::Color>, "Color must stay POD");
static_assert(sizeof(vmath::Color) == sizeof(vmath::Vec4f), "Color layout must match Vec4f");
