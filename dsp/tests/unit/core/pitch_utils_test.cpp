// ==============================================================================
// Layer 0: Core Utility Tests - Pitch Utils
// ==============================================================================

#include <acordes/dsp/core/pitch_utils.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

using Catch::Approx;
using namespace Acordes::DSP;

TEST_CASE("octavesToRatio", "[core][pitch_utils]") {
    CHECK(octavesToRatio(0.0f) == 1.0f);
    CHECK(octavesToRatio(1.0f) == Approx(2.0f));
    CHECK(octavesToRatio(-1.0f) == Approx(0.5f));
    CHECK(octavesToRatio(2.0f) == Approx(4.0f));
    // A fifth above is seven semitones
    CHECK(octavesToRatio(7.0f / 12.0f) == Approx(1.4983f).margin(1e-4));
}
