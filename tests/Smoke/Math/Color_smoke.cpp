// ============================================================================
// VMath - tests/Smoke/Math/Color_smoke.cpp
// ----------------------------------------------------------------------------
// Purpose : Runtime checks for Color construction, packing and operations.
// Contract: Returns 0 on success, a distinct non-zero code per failed check.
// ============================================================================

#include "VMath/Math/Color.hpp"
#include "SmokeSupport.hpp"

using namespace vmath;

int RunColorSmoke()
{
    // ------------------------------------------------------------------------
    // 1. Construction
    // ------------------------------------------------------------------------
    {
        if (Color() != Color::Black() || Color(1.0f, 0.0f, 0.0f).a != 1.0f)
        {
            return 1;
        }

        if (Color(Vec3f(0.1f, 0.2f, 0.3f)) != Color(0.1f, 0.2f, 0.3f, 1.0f) ||
            Color(Vec4f(0.1f, 0.2f, 0.3f, 0.4f)).ToVec4() != Vec4f(0.1f, 0.2f, 0.3f, 0.4f))
        {
            return 2;
        }

        if (Color::Magenta().ToVec3() != Vec3f(1.0f, 0.0f, 1.0f) || Color::Transparent().a != 0.0f)
        {
            return 3;
        }
    }

    // ------------------------------------------------------------------------
    // 2. 8-bit packing
    // ------------------------------------------------------------------------
    {
        const Color orange = Color::FromHexRGBA(0xFF8000FFu);
        if (orange.r != 1.0f || orange.b != 0.0f || orange.a != 1.0f || !IsNearlyEqual(orange.g, 128.0f / 255.0f, 1e-6f))
        {
            return 10;
        }

        if (orange.ToRGBA8() != 0xFF8000FFu || orange.ToARGB8() != 0xFFFF8000u)
        {
            return 11;
        }

        const Color halfRed = Color::FromHexARGB(0x80FF0000u);
        if (halfRed.r != 1.0f || halfRed.Alpha8() != 0x80u || halfRed.ToARGB8() != 0x80FF0000u)
        {
            return 12;
        }

        // Components clamp to [0,1] and round to the nearest step.
        if (Color(2.0f, -1.0f, 0.5f, 1.0f).ToRGBA8() != 0xFF0080FFu)
        {
            return 13;
        }

        if (Color::FromRGBA8(255, 0, 0) != Color::Red() || Color::FromRGBA8(0, 0, 255, 0).Blue8() != 255u)
        {
            return 14;
        }

        tests::ExpectedAssertScope quiet;
        if (Color::FromRGBA8(300, -4, 0, 255) != Color::Red())
        {
            return 15;
        }
    }

    // ------------------------------------------------------------------------
    // 3. Arithmetic
    // ------------------------------------------------------------------------
    {
        const Color gray(0.5f, 0.5f, 0.5f, 1.0f);
        if (gray * Color(1.0f, 0.0f, 0.5f, 1.0f) != Color(0.5f, 0.0f, 0.25f, 1.0f))
        {
            return 20;
        }

        if (gray + gray != Color(1.0f, 1.0f, 1.0f, 2.0f) || gray - gray != Color(0.0f, 0.0f, 0.0f, 0.0f))
        {
            return 21;
        }

        if (gray * 2.0f != 2.0f * gray || (gray * 2.0f) / 2.0f != gray)
        {
            return 22;
        }
    }

    // ------------------------------------------------------------------------
    // 4. Operations
    // ------------------------------------------------------------------------
    {
        if (Invert(Color(0.25f, 0.5f, 1.0f, 0.5f)) != Color(0.75f, 0.5f, 0.0f, 0.5f))
        {
            return 30;
        }

        if (Saturate(Color(2.0f, -1.0f, 0.5f, 3.0f)) != Color(1.0f, 0.0f, 0.5f, 1.0f))
        {
            return 31;
        }

        if (!IsNearlyEqual(Luminance(Color::White()), 1.0f, 1e-6f) || Luminance(Color::Black()) != 0.0f)
        {
            return 32;
        }

        const Color gray = Grayscale(Color(0.0f, 1.0f, 0.0f, 0.25f));
        if (!IsNearlyEqual(gray.r, 0.7152f, 1e-6f) || gray.r != gray.g || gray.g != gray.b || gray.a != 0.25f)
        {
            return 33;
        }

        if (Lighten(Color::Black(), 0.5f) != Color::Gray() || Darken(Color::White(), 0.5f) != Color::Gray() ||
            Lighten(Color::Blue(), 2.0f) != Color::White())
        {
            return 34;
        }
    }

    // ------------------------------------------------------------------------
    // 5. Blend / Lerp
    // ------------------------------------------------------------------------
    {
        if (Blend(Color::Red(), Color::Transparent()) != Color::Red() || Blend(Color::Red(), Color::Blue()) != Color::Blue())
        {
            return 40;
        }

        if (Blend(Color::Transparent(), Color::Transparent()) != Color::Transparent())
        {
            return 41;
        }

        const Color mixed = Blend(Color(1.0f, 0.0f, 0.0f, 0.5f), Color(0.0f, 0.0f, 1.0f, 0.5f));
        if (!IsNearlyEqual(mixed, Color(1.0f / 3.0f, 0.0f, 2.0f / 3.0f, 0.75f)))
        {
            return 42;
        }

        if (Lerp(Color::Black(), Color::White(), 0.25f) != Color(0.25f, 0.25f, 0.25f, 1.0f) ||
            Lerp(Color::Black(), Color::White(), 2.0f) != Color::White())
        {
            return 43;
        }
    }

    return 0;
}
