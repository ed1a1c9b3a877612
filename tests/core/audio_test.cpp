/// @file audio_test.cpp
/// @brief Tests for Audio buffer class.

#include "core/audio.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

#include "util/exception.h"

using namespace pitchtrack;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

std::vector<float> generate_sine(int samples, float freq, int sr) {
  std::vector<float> result(samples);
  for (int i = 0; i < samples; ++i) {
    result[i] = std::sin(kTwoPi * freq * i / sr);
  }
  return result;
}
}  // namespace

TEST_CASE("Audio from_buffer", "[audio]") {
  std::vector<float> samples = generate_sine(1000, 440.0f, 48000);
  Audio audio = Audio::from_buffer(samples.data(), samples.size(), 48000);

  REQUIRE(audio.size() == 1000);
  REQUIRE(audio.sample_rate() == 48000);
  REQUIRE_FALSE(audio.empty());
  REQUIRE_THAT(audio.duration(), WithinRel(1000.0 / 48000.0, 0.001));

  // Copy, not a view of the caller's storage
  REQUIRE(audio.data() != samples.data());
}

TEST_CASE("Audio from_vector", "[audio]") {
  std::vector<float> samples = generate_sine(4800, 440.0f, 48000);
  Audio audio = Audio::from_vector(std::move(samples), 48000);

  REQUIRE(audio.size() == 4800);
  REQUIRE_THAT(audio.duration(), WithinRel(0.1, 0.001));  // 100ms
}

TEST_CASE("Audio rejects invalid sample rate", "[audio]") {
  std::vector<float> samples(16, 0.0f);
  REQUIRE_THROWS_AS(Audio::from_buffer(samples.data(), samples.size(), 0), PitchtrackException);
  REQUIRE_THROWS_AS(Audio::from_vector(samples, -1), PitchtrackException);
}

TEST_CASE("Audio slice by time", "[audio]") {
  constexpr int sr = 44100;
  std::vector<float> samples = generate_sine(sr, 440.0f, sr);  // 1 second
  Audio audio = Audio::from_vector(std::move(samples), sr);

  SECTION("slice first half") {
    Audio slice = audio.slice(0.0, 0.5);
    REQUIRE(slice.size() == sr / 2);
    REQUIRE(slice.sample_rate() == sr);
  }

  SECTION("slice second half") {
    Audio slice = audio.slice(0.5, 1.0);
    REQUIRE(slice.size() == sr / 2);
    REQUIRE_THAT(slice[0], WithinAbs(audio[sr / 2], 1e-6f));
  }

  SECTION("slice to end (negative end_time)") {
    Audio slice = audio.slice(0.5);
    REQUIRE(slice.size() == sr / 2);
  }
}

TEST_CASE("Audio slice by samples", "[audio]") {
  std::vector<float> samples(1000);
  for (int i = 0; i < 1000; ++i) {
    samples[i] = static_cast<float>(i);
  }
  Audio audio = Audio::from_vector(std::move(samples), 48000);

  SECTION("slice range") {
    Audio slice = audio.slice_samples(100, 500);
    REQUIRE(slice.size() == 400);
    REQUIRE(slice[0] == 100.0f);
    REQUIRE(slice[399] == 499.0f);
  }

  SECTION("slice shares buffer") {
    Audio slice = audio.slice_samples(0, 500);
    REQUIRE(slice.data() == audio.data());
  }

  SECTION("out of range index throws") {
    REQUIRE_THROWS_AS(audio[1000], PitchtrackException);
  }
}

TEST_CASE("Audio empty", "[audio]") {
  Audio audio;
  REQUIRE(audio.empty());
  REQUIRE(audio.size() == 0);
  REQUIRE(audio.data() == nullptr);
  REQUIRE(audio.duration() == 0.0);
}

TEST_CASE("Audio iterator", "[audio]") {
  std::vector<float> samples = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
  Audio audio = Audio::from_vector(std::move(samples), 48000);

  float sum = 0.0f;
  for (float s : audio) {
    sum += s;
  }
  REQUIRE_THAT(sum, WithinAbs(15.0f, 1e-6f));
}
