// ============================================================================
// VMath - Source/VMath/Math/Color.cpp
// ----------------------------------------------------------------------------
// Purpose : 8-bit packing/unpacking and alpha compositing for Color.
// ============================================================================

#include "VMath/Math/Color.hpp"
#include <cmath>

namespace vmath
{
    namespace
    {
        // Clamp to [0,1], then round to the nearest 8-bit step.
        uint8 ToChannel8(float32 value) noexcept
        {
            return static_cast<uint8>(std::lround(Saturate(value) * 255.0f));
        }

        float32 FromChannel8(uint32 value) noexcept
        {
            return static_cast<float32>(value & 0xFFu) / 255.0f;
        }

        float32 FromChannel8Checked(int32 value) noexcept
        {
            VMATH_MATH_ASSERT(value >= 0 && value <= 255, "Color::FromRGBA8 channel outside [0,255]; clamping.");
            return static_cast<float32>(Clamp(value, 0, 255)) / 255.0f;
        }
    } // namespace

    Color Color::FromRGBA8(int32 r8, int32 g8, int32 b8, int32 a8) noexcept
    {
        return Color(FromChannel8Checked(r8), FromChannel8Checked(g8), FromChannel8Checked(b8), FromChannel8Checked(a8));
    }

    Color Color::FromHexRGBA(uint32 rgba) noexcept
    {
        return Color(FromChannel8(rgba >> 24), FromChannel8(rgba >> 16), FromChannel8(rgba >> 8), FromChannel8(rgba));
    }

    Color Color::FromHexARGB(uint32 argb) noexcept
    {
        return Color(FromChannel8(argb >> 16), FromChannel8(argb >> 8), FromChannel8(argb), FromChannel8(argb >> 24));
    }

    uint32 Color::ToRGBA8() const noexcept
    {
        return (uint32(Red8()) << 24) | (uint32(Green8()) << 16) | (uint32(Blue8()) << 8) | uint32(Alpha8());
    }

    uint32 Color::ToARGB8() const noexcept
    {
        return (uint32(Alpha8()) << 24) | (uint32(Red8()) << 16) | (uint32(Green8()) << 8) | uint32(Blue8());
    }

    uint8 Color::Red8() const noexcept { return ToChannel8(r); }
    uint8 Color::Green8() const noexcept { return ToChannel8(g); }
    uint8 Color::Blue8() const noexcept { return ToChannel8(b); }
    uint8 Color::Alpha8() const noexcept { return ToChannel8(a); }

    Color Blend(const Color& base, const Color& over) noexcept
    {
        const float32 keep = 1.0f - over.a;
        const float32 outA = over.a + base.a * keep;
        if (outA <= 0.0f)
        {
            return Color::Transparent();
        }

        const Vec3f rgb = (over.ToVec3() * over.a + base.ToVec3() * (base.a * keep)) / outA;
        return Color(rgb, outA);
    }

} // namespace vmath
