#pragma once

/// @file signal_conditioner.h
/// @brief Silence gate, confidence hysteresis, octave-jump suppression and
/// median smoothing applied to per-window YIN output.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "feature/note.h"
#include "feature/yin_estimator.h"
#include "streaming/detection_config.h"

namespace pitchtrack {

/// @brief What the caller should do with the shared estimate after one window.
enum class ConditionerAction {
  Clear,    ///< Publish "no current note"
  Skip,     ///< Leave the published estimate untouched
  Publish,  ///< Publish the new estimate in ConditionerOutput
};

/// @brief Result of conditioning one window.
struct ConditionerOutput {
  ConditionerAction action = ConditionerAction::Skip;
  float frequency = 0.0f;   ///< Filtered frequency (Publish only)
  float confidence = 0.0f;  ///< Raw YIN confidence (Publish only)
  NoteInfo note;            ///< Converted note (Publish only)
};

/// @brief Rolling buffer of the last kMedianWindow accepted frequencies.
struct MedianHistory {
  std::array<float, kMedianWindow> values{};
  uint8_t write_index = 0;
  uint8_t count = 0;

  /// @brief Adds a value, overwriting the oldest once full.
  void push(float frequency);

  /// @brief Single value, mean of two, or true median of three.
  float value() const;

  void reset() { *this = MedianHistory(); }
};

/// @brief Persistent per-session conditioning state.
struct ConditioningState {
  bool is_showing_pitch = false;
  float prev_frequency = 0.0f;
  uint8_t octave_hold_count = 0;
  MedianHistory median;
};

/// @brief Turns per-window estimator output into debounced note estimates.
/// @details Stages run in a fixed order, each able to stop the window:
///   1. silence gate (window RMS in dBFS below params.silence_db -> Clear)
///   2. YIN (no pitch -> Clear)
///   3. confidence hysteresis (showing: < exit -> Clear; not showing: < enter -> Skip)
///   4. octave-jump suppression (hold previous frequency up to kOctaveSuppressMax times)
///   5. 3-window median
///   6. note conversion (out of range -> Skip, otherwise Publish)
///
/// Owned and mutated by a single processing thread; never allocates.
class SignalConditioner {
 public:
  /// @brief Runs all stages on one analysis window.
  /// @param window Pointer to estimator.window_size() samples
  /// @param estimator Estimator whose scratch buffers are used for stage 2
  /// @param params Tunables snapshot for this window
  ConditionerOutput process_window(const float* window, YinEstimator& estimator,
                                   const ConditionerParams& params);

  /// @brief Runs stages 2-6 on an already computed estimator result.
  /// @param raw Estimator output (std::nullopt = no pitch)
  /// @param params Tunables snapshot for this window
  ConditionerOutput process_estimate(const std::optional<RawPitch>& raw,
                                     const ConditionerParams& params);

  /// @brief Stage 4 in isolation: returns the frequency to use and updates
  /// prev_frequency / octave_hold_count.
  float suppress_octave_jump(float frequency);

  /// @brief Returns to the zero state.
  void reset() { state_ = ConditioningState(); }

  const ConditioningState& state() const { return state_; }

  bool is_showing_pitch() const { return state_.is_showing_pitch; }

  /// @brief RMS level of a window in dBFS (-200 for an all-zero window).
  static float window_level_db(const float* window, size_t size);

 private:
  ConditionerOutput clear();

  ConditioningState state_;
};

}  // namespace pitchtrack
