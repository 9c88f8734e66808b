// ==============================================================================
// Layer 1: DSP Primitive Tests - Control-Rate LFO
// ==============================================================================

#include <acordes/dsp/primitives/lfo.h>
#include <acordes/dsp/core/math_constants.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <set>

using Catch::Approx;
using namespace Acordes::DSP;

TEST_CASE("LFO advances by one block per tick", "[primitives][lfo]") {
    LFO lfo;
    lfo.prepare(48000.0);
    lfo.setFrequency(1.0f);

    // 1 Hz, 1200-sample blocks: 40 ticks per cycle
    const double expected = kTwoPiD * 1200.0 / 48000.0;
    CHECK(lfo.phaseIncrement(1200) == Approx(expected));

    (void)lfo.tick(1200);
    CHECK(lfo.getPhase() == Approx(expected));
    CHECK(lfo.getValue() == Approx(std::sin(expected)));

    for (int i = 1; i < 40; ++i) {
        (void)lfo.tick(1200);
    }
    const double phase = lfo.getPhase();
    CHECK((phase < 1e-6 || phase > kTwoPiD - 1e-6));
}

TEST_CASE("LFO waveform shapes", "[primitives][lfo]") {
    LFO lfo;
    lfo.prepare(48000.0);
    lfo.setFrequency(1.0f);

    SECTION("triangle spans -1..1") {
        lfo.setWaveform(Waveform::Triangle);
        float lowest = 1.0f;
        float highest = -1.0f;
        for (int i = 0; i < 48; ++i) {
            const float v = lfo.tick(1000);
            lowest = std::min(lowest, v);
            highest = std::max(highest, v);
        }
        CHECK(highest == Approx(1.0f).margin(0.05));
        CHECK(lowest == Approx(-1.0f).margin(0.05));
    }

    SECTION("square is +1 in the first half cycle") {
        lfo.setWaveform(Waveform::Square);
        CHECK(lfo.tick(12000) == 1.0f);   // phase pi/2
        CHECK(lfo.tick(14000) == -1.0f);  // phase past pi
    }

    SECTION("sample and hold changes only on wrap") {
        lfo.setWaveform(Waveform::SampleHold);
        const float first = lfo.tick(12000);
        CHECK(lfo.tick(12000) == first);
        CHECK(lfo.tick(12000) == first);
        std::set<float> values{first};
        for (int i = 0; i < 40; ++i) {
            values.insert(lfo.tick(12000));
        }
        CHECK(values.size() > 5);
    }
}

TEST_CASE("LFO rate clamping", "[primitives][lfo]") {
    LFO lfo;
    lfo.prepare(48000.0);

    lfo.setFrequency(100.0f);
    CHECK(lfo.getFrequency() == kMaxLFORateHz);
    lfo.setFrequency(0.0f);
    CHECK(lfo.getFrequency() == kMinLFORateHz);
    lfo.setFrequency(std::numeric_limits<float>::quiet_NaN());
    CHECK(lfo.getFrequency() == kMinLFORateHz);

    SECTION("one tick never advances by pi or more") {
        lfo.setFrequency(kMaxLFORateHz);
        CHECK(lfo.phaseIncrement(4096) < kTwoPiD * 0.5);
    }
}
