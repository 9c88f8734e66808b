// ==============================================================================
// Layer 0: Core Utility Tests - Sigmoid
// ==============================================================================

#include <acordes/dsp/core/sigmoid.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>

using Catch::Approx;
using namespace Acordes::DSP;

TEST_CASE("Sigmoid::tanh tracks std::tanh in the musical range", "[core][sigmoid]") {
    for (float x = -3.0f; x <= 3.0f; x += 0.05f) {
        INFO("x = " << x);
        CHECK(Sigmoid::tanh(x) == Approx(std::tanh(x)).margin(2e-3));
    }
}

TEST_CASE("Sigmoid::tanh saturates and stays bounded", "[core][sigmoid]") {
    CHECK(Sigmoid::tanh(0.0f) == 0.0f);
    CHECK(Sigmoid::tanh(10.0f) == 1.0f);
    CHECK(Sigmoid::tanh(-10.0f) == -1.0f);
    CHECK(Sigmoid::tanh(std::numeric_limits<float>::infinity()) == 1.0f);

    SECTION("odd symmetry") {
        CHECK(Sigmoid::tanh(-0.7f) == Approx(-Sigmoid::tanh(0.7f)));
    }

    SECTION("monotonic") {
        float previous = Sigmoid::tanh(-4.0f);
        for (float x = -4.0f; x <= 4.0f; x += 0.01f) {
            const float y = Sigmoid::tanh(x);
            REQUIRE(y >= previous - 1e-6f);
            previous = y;
        }
    }
}

TEST_CASE("Sigmoid::hardClip clamps to threshold", "[core][sigmoid]") {
    CHECK(Sigmoid::hardClip(2.0f) == 1.0f);
    CHECK(Sigmoid::hardClip(-2.0f) == -1.0f);
    CHECK(Sigmoid::hardClip(0.3f) == 0.3f);
    CHECK(Sigmoid::hardClip(0.8f, 0.5f) == 0.5f);
}
