// ==============================================================================
// Layer 0: Core Utility Tests - Xorshift32
// ==============================================================================

#include <acordes/dsp/core/random.h>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>

using namespace Acordes::DSP;

TEST_CASE("Xorshift32 is deterministic per seed", "[core][random]") {
    Xorshift32 a(1234);
    Xorshift32 b(1234);
    for (int i = 0; i < 100; ++i) {
        REQUIRE(a.next() == b.next());
    }

    Xorshift32 c(4321);
    Xorshift32 d(1234);
    bool differs = false;
    for (int i = 0; i < 10; ++i) {
        differs = differs || (c.next() != d.next());
    }
    CHECK(differs);
}

TEST_CASE("Xorshift32 replaces seed 0", "[core][random]") {
    Xorshift32 rng(0);
    CHECK(rng.state() != 0u);
    CHECK(rng.next() != 0u);

    rng.seed(0);
    CHECK(rng.state() != 0u);
}

TEST_CASE("Xorshift32 float ranges", "[core][random]") {
    Xorshift32 rng(99);
    for (int i = 0; i < 10000; ++i) {
        const float bipolar = rng.nextFloat();
        REQUIRE(bipolar >= -1.0f);
        REQUIRE(bipolar <= 1.0f);
        const float unipolar = rng.nextUnipolar();
        REQUIRE(unipolar >= 0.0f);
        REQUIRE(unipolar <= 1.0f);
    }
}

TEST_CASE("Xorshift32 nextIndex covers the whole range", "[core][random]") {
    Xorshift32 rng(7);
    std::array<int, 5> hits{};
    for (int i = 0; i < 5000; ++i) {
        const uint32_t index = rng.nextIndex(5);
        REQUIRE(index < 5u);
        ++hits[index];
    }
    for (int count : hits) {
        CHECK(count > 700);
    }
    CHECK(rng.nextIndex(0) == 0u);
}
