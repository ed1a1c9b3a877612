/// @file signal_conditioner_test.cpp
/// @brief Tests for SignalConditioner stages.

#include "streaming/signal_conditioner.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

using namespace pitchtrack;
using Catch::Matchers::WithinAbs;

namespace {

constexpr double kTwoPi = 6.283185307179586;

std::vector<float> generate_sine(size_t samples, double freq, double sr, float amp = 0.5f) {
  std::vector<float> result(samples);
  for (size_t i = 0; i < samples; ++i) {
    result[i] = amp * static_cast<float>(std::sin(kTwoPi * freq * static_cast<double>(i) / sr));
  }
  return result;
}

RawPitch raw(float frequency, float confidence) {
  RawPitch r;
  r.frequency = frequency;
  r.confidence = confidence;
  return r;
}

}  // namespace

TEST_CASE("MedianHistory", "[conditioner]") {
  MedianHistory history;
  REQUIRE(history.value() == 0.0f);

  history.push(200.0f);
  REQUIRE(history.value() == 200.0f);

  history.push(210.0f);
  REQUIRE_THAT(history.value(), WithinAbs(205.0f, 1e-4f));

  history.push(400.0f);
  REQUIRE(history.value() == 210.0f);

  SECTION("oldest value is overwritten") {
    history.push(405.0f);  // drops 200
    REQUIRE(history.value() == 400.0f);
    REQUIRE(history.count == kMedianWindow);
  }

  SECTION("reset") {
    history.reset();
    REQUIRE(history.count == 0);
    REQUIRE(history.value() == 0.0f);
  }
}

TEST_CASE("Median stage is order independent", "[conditioner]") {
  const float orders[][3] = {{300.0f, 310.0f, 320.0f}, {320.0f, 300.0f, 310.0f},
                             {310.0f, 320.0f, 300.0f}, {320.0f, 310.0f, 300.0f}};
  ConditionerParams params;

  for (const auto& order : orders) {
    SignalConditioner conditioner;
    ConditionerOutput out;
    for (float f : order) {
      out = conditioner.process_estimate(raw(f, 0.95f), params);
      REQUIRE(out.action == ConditionerAction::Publish);
    }
    REQUIRE(out.frequency == 310.0f);
  }
}

TEST_CASE("Silence gate always clears", "[conditioner]") {
  YinEstimator yin(48000.0f);
  SignalConditioner conditioner;
  ConditionerParams params;
  std::vector<float> silence(kAnalysisSize, 0.0f);

  SECTION("from the idle state") {
    auto out = conditioner.process_window(silence.data(), yin, params);
    REQUIRE(out.action == ConditionerAction::Clear);
    REQUIRE_FALSE(conditioner.is_showing_pitch());
  }

  SECTION("while showing a note") {
    auto tone = generate_sine(kAnalysisSize, 440.0, 48000.0);
    auto first = conditioner.process_window(tone.data(), yin, params);
    REQUIRE(first.action == ConditionerAction::Publish);
    REQUIRE(conditioner.is_showing_pitch());

    for (int i = 0; i < 3; ++i) {
      auto out = conditioner.process_window(silence.data(), yin, params);
      REQUIRE(out.action == ConditionerAction::Clear);
      REQUIRE_FALSE(conditioner.is_showing_pitch());
    }
  }

  SECTION("quiet tone below the gate") {
    auto quiet = generate_sine(kAnalysisSize, 440.0, 48000.0, 0.001f);  // about -63 dBFS
    auto out = conditioner.process_window(quiet.data(), yin, params);
    REQUIRE(out.action == ConditionerAction::Clear);
  }

  SECTION("window level") {
    REQUIRE(SignalConditioner::window_level_db(silence.data(), silence.size()) ==
            kSilenceDbSentinel);
    std::vector<float> half(kAnalysisSize, 0.5f);
    REQUIRE_THAT(SignalConditioner::window_level_db(half.data(), half.size()),
                 WithinAbs(-6.0206f, 1e-3f));
  }
}

TEST_CASE("No pitch clears", "[conditioner]") {
  SignalConditioner conditioner;
  ConditionerParams params;
  conditioner.process_estimate(raw(440.0f, 0.95f), params);
  REQUIRE(conditioner.is_showing_pitch());

  auto out = conditioner.process_estimate(std::nullopt, params);
  REQUIRE(out.action == ConditionerAction::Clear);
  REQUIRE_FALSE(conditioner.is_showing_pitch());
}

TEST_CASE("Confidence hysteresis is asymmetric", "[conditioner]") {
  SignalConditioner conditioner;
  ConditionerParams params;

  SECTION("0.80 while not showing stays silent without clearing") {
    auto out = conditioner.process_estimate(raw(440.0f, 0.80f), params);
    REQUIRE(out.action == ConditionerAction::Skip);
    REQUIRE_FALSE(conditioner.is_showing_pitch());
    REQUIRE(conditioner.state().median.count == 0);
  }

  SECTION("0.80 while showing keeps the note") {
    REQUIRE(conditioner.process_estimate(raw(440.0f, 0.90f), params).action ==
            ConditionerAction::Publish);
    auto out = conditioner.process_estimate(raw(440.0f, 0.80f), params);
    REQUIRE(out.action == ConditionerAction::Publish);
    REQUIRE(out.note.full_name() == "A4");
    REQUIRE(conditioner.is_showing_pitch());
  }

  SECTION("below exit while showing clears") {
    conditioner.process_estimate(raw(440.0f, 0.90f), params);
    auto out = conditioner.process_estimate(raw(440.0f, 0.70f), params);
    REQUIRE(out.action == ConditionerAction::Clear);
    REQUIRE_FALSE(conditioner.is_showing_pitch());

    // Re-entry needs the enter threshold again
    REQUIRE(conditioner.process_estimate(raw(440.0f, 0.80f), params).action ==
            ConditionerAction::Skip);
    REQUIRE(conditioner.process_estimate(raw(440.0f, 0.86f), params).action ==
            ConditionerAction::Publish);
  }

  SECTION("thresholds come from the params snapshot") {
    params.confidence_enter = 0.5f;
    REQUIRE(conditioner.process_estimate(raw(440.0f, 0.6f), params).action ==
            ConditionerAction::Publish);
  }
}

TEST_CASE("Octave-jump suppression holds then accepts", "[conditioner]") {
  SignalConditioner conditioner;

  SECTION("sustained jump up is accepted after three holds") {
    REQUIRE(conditioner.suppress_octave_jump(200.0f) == 200.0f);
    for (int i = 1; i <= kOctaveSuppressMax; ++i) {
      REQUIRE(conditioner.suppress_octave_jump(400.0f) == 200.0f);
      REQUIRE(conditioner.state().octave_hold_count == i);
    }
    REQUIRE(conditioner.suppress_octave_jump(400.0f) == 400.0f);
    REQUIRE(conditioner.state().octave_hold_count == 0);
    REQUIRE(conditioner.state().prev_frequency == 400.0f);
    REQUIRE(conditioner.suppress_octave_jump(400.0f) == 400.0f);
  }

  SECTION("jump down is suppressed too") {
    conditioner.suppress_octave_jump(400.0f);
    REQUIRE(conditioner.suppress_octave_jump(200.0f) == 400.0f);
  }

  SECTION("ratio outside the bands resets the hold counter") {
    conditioner.suppress_octave_jump(200.0f);
    conditioner.suppress_octave_jump(400.0f);
    conditioner.suppress_octave_jump(400.0f);
    REQUIRE(conditioner.state().octave_hold_count == 2);
    REQUIRE(conditioner.suppress_octave_jump(300.0f) == 300.0f);
    REQUIRE(conditioner.state().octave_hold_count == 0);
  }

  SECTION("fifth is not an octave error") {
    conditioner.suppress_octave_jump(200.0f);
    REQUIRE(conditioner.suppress_octave_jump(300.0f) == 300.0f);
  }
}

TEST_CASE("Octave jump through the full pipeline", "[conditioner]") {
  SignalConditioner conditioner;
  ConditionerParams params;
  const float f = 220.0f;

  auto out = conditioner.process_estimate(raw(f, 0.95f), params);
  REQUIRE(out.frequency == f);

  // Held windows keep publishing the lower octave
  for (int i = 0; i < kOctaveSuppressMax; ++i) {
    out = conditioner.process_estimate(raw(2.0f * f, 0.95f), params);
    REQUIRE(out.action == ConditionerAction::Publish);
    REQUIRE(out.frequency == f);
  }

  // Accepted jump enters the median; two windows later it wins
  out = conditioner.process_estimate(raw(2.0f * f, 0.95f), params);
  REQUIRE(out.frequency == f);
  out = conditioner.process_estimate(raw(2.0f * f, 0.95f), params);
  REQUIRE(out.frequency == 2.0f * f);
  REQUIRE(out.note.full_name() == "A4");
}

TEST_CASE("Out-of-range note conversion skips", "[conditioner]") {
  SignalConditioner conditioner;
  ConditionerParams params;

  auto out = conditioner.process_estimate(raw(6000.0f, 0.95f), params);
  REQUIRE(out.action == ConditionerAction::Skip);
  REQUIRE_FALSE(conditioner.is_showing_pitch());
}

TEST_CASE("A4 reference shifts cents", "[conditioner]") {
  SignalConditioner conditioner;
  ConditionerParams params;
  params.a4_reference_hz = 442.0f;

  auto out = conditioner.process_estimate(raw(440.0f, 0.95f), params);
  REQUIRE(out.action == ConditionerAction::Publish);
  REQUIRE(out.note.full_name() == "A4");
  REQUIRE(out.note.cents < 0);
}

TEST_CASE("SignalConditioner reset", "[conditioner]") {
  SignalConditioner conditioner;
  ConditionerParams params;
  conditioner.process_estimate(raw(440.0f, 0.95f), params);
  conditioner.process_estimate(raw(880.0f, 0.95f), params);

  conditioner.reset();
  const auto& state = conditioner.state();
  REQUIRE_FALSE(state.is_showing_pitch);
  REQUIRE(state.prev_frequency == 0.0f);
  REQUIRE(state.octave_hold_count == 0);
  REQUIRE(state.median.count == 0);
}
