// ==============================================================================
// Layer 1: DSP Primitive Tests - PolyBLEP Oscillator
// ==============================================================================

#include <acordes/dsp/primitives/polyblep_oscillator.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "test_helpers/signal_checks.h"

#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Acordes::DSP;

namespace {

std::vector<float> renderOsc(OscWaveform waveform, float frequency, size_t numSamples,
                             uint32_t seed = 1) {
    PolyBlepOscillator osc(seed);
    osc.prepare(48000.0);
    osc.setWaveform(waveform);
    osc.setFrequency(frequency);
    std::vector<float> out(numSamples);
    osc.processBlock(out.data(), out.size());
    return out;
}

} // namespace

TEST_CASE("PolyBlepOscillator sine matches std::sin", "[primitives][oscillator]") {
    const auto out = renderOsc(OscWaveform::Sine, 1000.0f, 96);
    for (size_t i = 0; i < out.size(); ++i) {
        const float expected = std::sin(2.0f * 3.14159265f * 1000.0f * static_cast<float>(i) / 48000.0f);
        REQUIRE(out[i] == Approx(expected).margin(1e-4));
    }
}

TEST_CASE("PolyBlepOscillator periodic waveforms have the right pitch", "[primitives][oscillator]") {
    const OscWaveform waveform = GENERATE(OscWaveform::Sine, OscWaveform::Square,
                                          OscWaveform::Sawtooth, OscWaveform::Triangle);
    auto out = renderOsc(waveform, 480.0f, 48000);
    // Remove the triangle's settling offset before counting crossings
    const float mean = [&] {
        double sum = 0.0;
        for (size_t i = 24000; i < out.size(); ++i) sum += out[i];
        return static_cast<float>(sum / 24000.0);
    }();
    for (auto& v : out) v -= mean;

    const size_t crossings = TestUtils::countZeroCrossings(out.data() + 24000, 24000);
    // 240 cycles in half a second, two crossings each
    CHECK(crossings >= 478);
    CHECK(crossings <= 482);
}

TEST_CASE("PolyBlepOscillator output stays bounded", "[primitives][oscillator]") {
    for (size_t w = 0; w < kOscWaveformCount; ++w) {
        const auto waveform = static_cast<OscWaveform>(w);
        const auto out = renderOsc(waveform, 3000.0f, 4800);
        INFO("waveform " << w);
        CHECK(TestUtils::allFinite(out));
        CHECK(TestUtils::findPeak(out) <= 2.0f);
        CHECK(TestUtils::findPeak(out) > 0.1f);
    }
}

TEST_CASE("PolyBlepOscillator noise is seeded per instance", "[primitives][oscillator]") {
    const auto a = renderOsc(OscWaveform::WhiteNoise, 440.0f, 256, 11);
    const auto b = renderOsc(OscWaveform::WhiteNoise, 440.0f, 256, 11);
    const auto c = renderOsc(OscWaveform::WhiteNoise, 440.0f, 256, 12);
    CHECK(a == b);
    CHECK(a != c);

    SECTION("noise ignores pitch") {
        const auto low = renderOsc(OscWaveform::WhiteNoise, 50.0f, 256, 11);
        CHECK(low == a);
    }

    SECTION("pink noise is darker than white") {
        const auto white = renderOsc(OscWaveform::WhiteNoise, 440.0f, 4800, 3);
        const auto pink = renderOsc(OscWaveform::PinkNoise, 440.0f, 4800, 3);
        CHECK(TestUtils::countZeroCrossings(pink.data(), pink.size()) <
              TestUtils::countZeroCrossings(white.data(), white.size()));
    }
}

TEST_CASE("PolyBlepOscillator phase persists across waveform changes", "[primitives][oscillator]") {
    PolyBlepOscillator osc;
    osc.prepare(48000.0);
    osc.setFrequency(100.0f);
    std::vector<float> block(120);
    osc.processBlock(block.data(), block.size());
    const double phase = osc.phase();
    CHECK(phase == Approx(0.25).margin(1e-6));

    osc.setWaveform(OscWaveform::Sawtooth);
    CHECK(osc.phase() == phase);

    osc.resetPhase(1.75);
    CHECK(osc.phase() == Approx(0.75));
}

TEST_CASE("PolyBlepOscillator frequency validation", "[primitives][oscillator]") {
    PolyBlepOscillator osc;
    osc.prepare(48000.0);

    osc.setFrequency(-10.0f);
    CHECK(osc.getFrequency() == 0.0f);
    osc.setFrequency(30000.0f);
    CHECK(osc.getFrequency() < 24000.0f);
    osc.setFrequency(std::numeric_limits<float>::quiet_NaN());
    CHECK(osc.getFrequency() == 0.0f);
}

TEST_CASE("waveformCompensationGain is positive for every waveform", "[primitives][oscillator]") {
    for (size_t w = 0; w < kOscWaveformCount; ++w) {
        CHECK(waveformCompensationGain(static_cast<OscWaveform>(w)) > 0.0f);
    }
    CHECK(waveformCompensationGain(OscWaveform::Square) < waveformCompensationGain(OscWaveform::Sawtooth));
}
