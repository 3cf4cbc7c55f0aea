// ============================================================================
// VMath - tests/AllSmokes/AllSmokes_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Aggregate executable that runs all smoke helpers.
// Contract: No exceptions/RTTI; deterministic ordering; returns 0 on success.
// Notes   : Assumes Run*Smoke helpers are linked from their respective TUs.
//           Each failing smoke prints its code so CTest logs point at the check.
// ============================================================================

#include <cstdio>

int RunLoggerSmoke();
int RunVectorSmoke();
int RunMatrixSmoke();
int RunTransformSmoke();
int RunColorSmoke();

namespace
{
    int Report(const char* name, int code)
    {
        if (code != 0)
        {
            std::fprintf(stderr, "%s failed with code %d\n", name, code);
            return 1;
        }
        std::printf("%s passed.\n", name);
        return 0;
    }
} // namespace

int main()
{
    int failures = 0;

    // Each smoke returns 0 on pass, non-zero on failure.
    failures += Report("Logger_smoke", RunLoggerSmoke());
    failures += Report("Vector_smoke", RunVectorSmoke());
    failures += Report("Matrix_smoke", RunMatrixSmoke());
    failures += Report("Transform_smoke", RunTransformSmoke());
    failures += Report("Color_smoke", RunColorSmoke());

    return (failures == 0) ? 0 : 1;
}
