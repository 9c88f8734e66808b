// ==============================================================================
// Integration Test: AcordesEngine render driver
// ==============================================================================
// Commands in, audio out: ordering within a buffer, stealing, silence
// guarantees, backend conditions and output formats.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "engine/acordes_engine.h"
#include <acordes/dsp/core/math_constants.h>
#include "test_helpers/signal_checks.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

using Catch::Approx;
using namespace Acordes;
using namespace Acordes::DSP;

namespace {

constexpr double kSampleRate = 48000.0;
constexpr size_t kBlockSize = 256;

struct StereoOut {
    std::vector<float> left;
    std::vector<float> right;
};

/// Render numBlocks buffers and return them concatenated.
StereoOut render(AcordesEngine& engine, size_t numBlocks, size_t blockSize = kBlockSize) {
    StereoOut out;
    out.left.assign(numBlocks * blockSize, 0.0f);
    out.right.assign(numBlocks * blockSize, 0.0f);
    for (size_t b = 0; b < numBlocks; ++b) {
        engine.processBlock(out.left.data() + b * blockSize,
                            out.right.data() + b * blockSize, blockSize);
    }
    return out;
}

void prepareEngine(AcordesEngine& engine) {
    engine.prepare(kSampleRate, kBlockSize);
}

} // namespace

// =============================================================================
// Basic rendering
// =============================================================================

TEST_CASE("Engine renders silence before the first note", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    const auto out = render(engine, 8);
    CHECK(TestUtils::isAllZeros(out.left));
    CHECK(TestUtils::isAllZeros(out.right));
}

TEST_CASE("Engine outputs silence when not prepared", "[engine][integration]") {
    AcordesEngine engine;
    engine.noteOn(60, 100.0f);
    std::vector<float> left(kBlockSize, 1.0f);
    std::vector<float> right(kBlockSize, 1.0f);
    engine.processBlock(left.data(), right.data(), kBlockSize);
    CHECK(TestUtils::isAllZeros(left));
    CHECK(TestUtils::isAllZeros(right));
}

TEST_CASE("Engine plays a note", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.noteOn(60, 100.0f);
    const auto out = render(engine, 40);

    CHECK(engine.getActiveVoiceCount() == 1);
    CHECK(engine.getVoiceNote(0) == 60);
    CHECK(TestUtils::findPeak(out.left) > 0.05f);
    CHECK(TestUtils::findPeak(out.left) <= 1.0f);
    CHECK(TestUtils::allFinite(out.left));
    CHECK(TestUtils::allFinite(out.right));
    // Onset ramp: no jump out of silence
    CHECK(std::abs(out.left[0]) < 0.01f);
}

TEST_CASE("Engine renders buffers longer than the prepared block size",
          "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.noteOn(57, 100.0f);
    const auto out = render(engine, 2, kBlockSize * 3 + 17);
    CHECK(TestUtils::allFinite(out.left));
    CHECK(TestUtils::findPeak(out.left) > 0.05f);
}

// =============================================================================
// Command ordering
// =============================================================================

TEST_CASE("Parameters sent with a note in the same buffer apply to that note",
          "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);

    SECTION("parameter first") {
        engine.enqueue(makeParamUpdate({{"cutoff", 400.0}}));
        engine.noteOn(36, 100.0f);
    }
    SECTION("note first") {
        engine.noteOn(36, 100.0f);
        engine.enqueue(makeParamUpdate({{"cutoff", 400.0}}));
    }

    (void)render(engine, 1);
    REQUIRE(engine.getVoiceNote(0) == 36);
    CHECK(engine.getVoice(0).getFilterCutoff() == Approx(400.0f));
    CHECK(engine.getParameters().filter.cutoffHz == Approx(400.0f));
}

TEST_CASE("A ParamUpdate batch applies every known key", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.enqueue(makeParamUpdate({
        {"waveform", std::string("sawtooth")},
        {"cutoff", 50000.0},
        {"no_such_parameter", 1.0},
        {"resonance", std::string("loud")},
        {"release", 0.2},
    }));
    (void)render(engine, 1);

    const auto& p = engine.getParameters();
    CHECK(p.osc.waveform == OscWaveform::Sawtooth);
    CHECK(p.filter.cutoffHz == Approx(kMaxCutoffHz));
    CHECK(p.filter.resonance == Approx(0.3f));
    CHECK(p.ampEnv.release == Approx(0.2f));
    CHECK(engine.getVoice(0).getParams().waveform == OscWaveform::Sawtooth);
}

// =============================================================================
// Voice allocation through the engine
// =============================================================================

TEST_CASE("Ninth held note steals voice 0", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    for (int note = 60; note < 68; ++note) {
        engine.noteOn(note, 100.0f);
    }
    (void)render(engine, 4);
    REQUIRE(engine.getActiveVoiceCount() == 8);

    engine.noteOn(68, 100.0f);
    const auto out = render(engine, 4);

    CHECK(engine.getActiveVoiceCount() == 8);
    CHECK(engine.getVoiceNote(0) == 68);
    for (size_t i = 1; i < 8; ++i) {
        CHECK(engine.getVoiceNote(i) == 60 + static_cast<int>(i));
    }
    CHECK(TestUtils::allFinite(out.left));
    CHECK(TestUtils::findPeak(out.left) <= 1.0f);
}

TEST_CASE("Stealing a voice keeps the output continuous", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.enqueue(makeParamUpdate({{"cutoff", 20000.0}, {"resonance", 0.0}, {"sustain", 1.0}}));
    for (int note = 60; note < 68; ++note) {
        engine.noteOn(note, 100.0f);
    }
    const auto steady = render(engine, 24);
    const size_t tail = 8 * kBlockSize;
    const float steadyStep = TestUtils::maxSampleStep(
        steady.left.data() + steady.left.size() - tail, tail,
        steady.left[steady.left.size() - tail - 1]);
    REQUIRE(steadyStep > 0.0f);

    engine.noteOn(68, 100.0f);
    const auto stealBlock = render(engine, 1);
    REQUIRE(engine.getVoiceNote(0) == 68);

    const float previous = steady.left.back();
    CHECK(std::abs(stealBlock.left[0] - previous) <= steadyStep);
    CHECK(TestUtils::maxSampleStep(stealBlock.left.data(), kBlockSize, previous) <
          1.5f * steadyStep);
}

TEST_CASE("Retriggering a held low note keeps the output continuous",
          "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.enqueue(makeParamUpdate({{"cutoff", 20000.0}, {"resonance", 0.0}, {"sustain", 1.0}}));
    engine.noteOn(36, 100.0f);  // C2, 65 Hz
    const auto out = render(engine, 40);
    const size_t boundary = out.left.size();
    const float amplitude = TestUtils::findPeak(out.left.data() + boundary - 2400, 2400);
    const float slopeLimit = 2.0f * amplitude * kTwoPi *
                             midiNoteToFrequency(36.0f) / static_cast<float>(kSampleRate);

    engine.noteOn(36, 100.0f);
    const auto after = render(engine, 10);
    REQUIRE(engine.getVoiceNote(0) == 36);
    CHECK(engine.getActiveVoiceCount() == 1);

    const float previous = out.left.back();
    CHECK(std::abs(after.left[0] - previous) < slopeLimit);
    CHECK(TestUtils::maxSampleStep(after.left.data(), after.left.size(), previous) < slopeLimit);
}

TEST_CASE("Velocity 0 NoteOn releases the note", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.noteOn(64, 100.0f);
    (void)render(engine, 2);
    REQUIRE(engine.getVoiceState(0) == VoiceState::Active);

    engine.noteOn(64, 0.0f);
    (void)render(engine, 1);
    CHECK(engine.getVoiceState(0) == VoiceState::Releasing);

    // Default release is 50 ms
    (void)render(engine, 40);
    CHECK(engine.getVoiceState(0) == VoiceState::Idle);
    CHECK(engine.getActiveVoiceCount() == 0);
}

TEST_CASE("Invalid note numbers are ignored", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.noteOn(-1, 100.0f);
    engine.noteOn(128, 100.0f);
    engine.noteOff(300);
    const auto out = render(engine, 2);
    CHECK(engine.getActiveVoiceCount() == 0);
    CHECK(TestUtils::isAllZeros(out.left));
}

// =============================================================================
// Silence guarantees
// =============================================================================

TEST_CASE("AllNotesOff silences the next buffer exactly", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.enqueue(makeParamUpdate({
        {"delay_mix", 0.5}, {"delay_feedback", 0.8}, {"delay_time", 0.05},
        {"chorus_mix", 0.5}, {"release", 2.0},
    }));
    for (int note : {48, 55, 60, 64}) {
        engine.noteOn(note, 110.0f);
    }
    const auto before = render(engine, 20);
    REQUIRE(TestUtils::findPeak(before.left) > 0.05f);

    engine.enqueue(AllNotesOffCommand{});
    const auto after = render(engine, 20);
    CHECK(TestUtils::isAllZeros(after.left));
    CHECK(TestUtils::isAllZeros(after.right));
    CHECK(engine.getActiveVoiceCount() == 0);
}

TEST_CASE("MuteGate ramps to silence and the next note reopens it",
          "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.enqueue(makeParamUpdate({{"delay_mix", 0.5}, {"delay_feedback", 0.7}}));
    engine.noteOn(60, 100.0f);
    (void)render(engine, 20);

    engine.enqueue(MuteGateCommand{});
    const auto muted = render(engine, 4);
    CHECK_FALSE(engine.getMasterBus().isGateOpen());
    // Ramp, not a step
    CHECK(TestUtils::maxSampleStep(muted.left) < 0.1f);
    for (size_t i = kGateRampSamples; i < muted.left.size(); ++i) {
        REQUIRE(muted.left[i] == 0.0f);
    }
    CHECK(engine.getVoiceState(0) != VoiceState::Active);

    engine.noteOn(67, 100.0f);
    const auto resumed = render(engine, 20);
    CHECK(engine.getMasterBus().isGateOpen());
    CHECK(TestUtils::findPeak(resumed.left) > 0.05f);
}

// =============================================================================
// Backend conditions
// =============================================================================

TEST_CASE("Backend disconnect silences output until recovery", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.enqueue(makeParamUpdate({{"sustain", 1.0}}));
    engine.noteOn(60, 100.0f);
    (void)render(engine, 10);

    engine.reportBackendEvent(BackendEvent::Disconnected);
    CHECK_FALSE(engine.isBackendConnected());
    const auto lost = render(engine, 4);
    for (size_t i = kGateRampSamples; i < lost.left.size(); ++i) {
        REQUIRE(lost.left[i] == 0.0f);
    }
    // The note itself keeps running
    CHECK(engine.getVoiceState(0) == VoiceState::Active);

    engine.reportBackendEvent(BackendEvent::Recovered);
    const auto back = render(engine, 4);
    CHECK(engine.isBackendConnected());
    CHECK(std::abs(back.left[0]) < 0.05f);
    CHECK(TestUtils::findPeak(back.left) > 0.05f);
}

TEST_CASE("Underruns are counted", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    CHECK(engine.getUnderrunCount() == 0);
    engine.reportBackendEvent(BackendEvent::Underrun);
    engine.reportBackendEvent(BackendEvent::Underrun);
    CHECK(engine.getUnderrunCount() == 2);
    CHECK(engine.isBackendConnected());
}

// =============================================================================
// Output formats and shared state
// =============================================================================

TEST_CASE("Interleaved int16 output carries both channels", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.noteOn(60, 127.0f);

    std::vector<int16_t> frames(2 * kBlockSize * 20, 0);
    for (size_t b = 0; b < 20; ++b) {
        engine.processBlockInterleaved(frames.data() + 2 * kBlockSize * b, kBlockSize);
    }

    int16_t peakL = 0;
    int16_t peakR = 0;
    for (size_t i = 0; i < frames.size(); i += 2) {
        peakL = std::max<int16_t>(peakL, static_cast<int16_t>(std::abs(frames[i])));
        peakR = std::max<int16_t>(peakR, static_cast<int16_t>(std::abs(frames[i + 1])));
    }
    CHECK(peakL > 1000);
    CHECK(peakR > 1000);
    // Centred voice, no chorus: channels match
    CHECK(std::abs(frames[2 * 4000] - frames[2 * 4000 + 1]) <= 1);
}

TEST_CASE("Tempo is published once per buffer", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    CHECK(engine.getPublishedTempo() == Approx(120.0));

    engine.enqueue(makeParamUpdate({{"bpm", 90.0}}));
    CHECK(engine.getPublishedTempo() == Approx(120.0));
    (void)render(engine, 1);
    CHECK(engine.getPublishedTempo() == Approx(90.0));

    engine.enqueue(makeParamUpdate({{"bpm", 1000.0}}));
    (void)render(engine, 1);
    CHECK(engine.getPublishedTempo() == Approx(kMaxTempoBPM));
}

TEST_CASE("Pitch bend is smoothed across buffers", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.enqueue(makeParamUpdate({{"pitch_bend", 2.0}}));
    (void)render(engine, 1);
    CHECK(engine.getPitchBend() == Approx(2.0f * (1.0f - kPitchBendSmoothing)));

    (void)render(engine, 100);
    CHECK(engine.getPitchBend() == 2.0f);
}

TEST_CASE("Master volume 0 renders silence", "[engine][integration]") {
    AcordesEngine engine;
    prepareEngine(engine);
    engine.enqueue(makeParamUpdate({{"master_volume", 0.0}}));
    engine.noteOn(60, 100.0f);
    (void)render(engine, 1);
    const auto out = render(engine, 10);
    CHECK(TestUtils::isAllZeros(out.left));
    CHECK(engine.droppedCommandCount() == 0);
}
