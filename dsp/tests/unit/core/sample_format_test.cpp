// ==============================================================================
// Layer 0: Core Utility Tests - Sample Format Conversion
// ==============================================================================

#include <acordes/dsp/core/sample_format.h>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <limits>

using namespace Acordes::DSP;

TEST_CASE("floatToInt16 scales and clips symmetrically", "[core][sample_format]") {
    CHECK(floatToInt16(0.0f) == 0);
    CHECK(floatToInt16(1.0f) == 32767);
    CHECK(floatToInt16(-1.0f) == -32767);
    CHECK(floatToInt16(2.0f) == 32767);
    CHECK(floatToInt16(-2.0f) == -32767);
    CHECK(floatToInt16(0.5f) == 16384);
}

TEST_CASE("floatToInt16 maps non-finite input to zero", "[core][sample_format]") {
    CHECK(floatToInt16(std::numeric_limits<float>::quiet_NaN()) == 0);
    CHECK(floatToInt16(std::numeric_limits<float>::infinity()) == 0);
}

TEST_CASE("interleaveToInt16 writes L/R frames", "[core][sample_format]") {
    const std::array<float, 3> left{0.0f, 1.0f, -1.0f};
    const std::array<float, 3> right{1.0f, 0.0f, 0.5f};
    std::array<int16_t, 6> out{};
    interleaveToInt16(left.data(), right.data(), out.data(), 3);

    CHECK(out[0] == 0);
    CHECK(out[1] == 32767);
    CHECK(out[2] == 32767);
    CHECK(out[3] == 0);
    CHECK(out[4] == -32767);
    CHECK(out[5] == 16384);
}
