#pragma once

/// @file detection_config.h
/// @brief Tunables and constants for live pitch detection.

#include <cstddef>
#include <cstdint>
#include <functional>

#include "core/convert.h"
#include "feature/yin_estimator.h"

namespace pitchtrack {

/// @brief Typical capture chunk length in samples.
constexpr size_t kCaptureSize = 1024;

/// @brief Confidence required to start showing a note.
constexpr float kConfidenceEnter = 0.85f;

/// @brief Confidence required to keep showing a note.
constexpr float kConfidenceExit = 0.75f;

/// @brief Default silence gate in dBFS.
constexpr float kSilenceDbDefault = -40.0f;

/// @brief Consecutive suspected octave jumps held before the jump is accepted.
constexpr uint8_t kOctaveSuppressMax = 3;

/// @brief Median filter length in windows.
constexpr size_t kMedianWindow = 3;

/// @brief Published estimates older than this are treated as absent (ms).
constexpr double kStaleAfterMs = 200.0;

/// @brief Ratio bands that look like an octave error (exclusive bounds).
constexpr float kOctaveUpLow = 1.85f;
constexpr float kOctaveUpHigh = 2.15f;
constexpr float kOctaveDownLow = 0.46f;
constexpr float kOctaveDownHigh = 0.54f;

/// @brief Source of wall-clock time in milliseconds.
using ClockFunction = std::function<double()>;

/// @brief Milliseconds since the Unix epoch from the system clock.
double wall_clock_ms();

/// @brief Snapshot of the tunables used while conditioning one window.
struct ConditionerParams {
  float silence_db = kSilenceDbDefault;        ///< Silence gate (dBFS)
  float confidence_enter = kConfidenceEnter;   ///< Enter threshold
  float confidence_exit = kConfidenceExit;     ///< Exit threshold
  float a4_reference_hz = kDefaultA4Hz;        ///< Tuning reference
};

/// @brief Configuration for LiveDetectionSession.
struct SessionConfig {
  float silence_db = kSilenceDbDefault;        ///< Silence gate (dBFS)
  float confidence_enter = kConfidenceEnter;   ///< Enter threshold [0, 1]
  float confidence_exit = kConfidenceExit;     ///< Exit threshold [0, 1]
  float a4_reference_hz = kDefaultA4Hz;        ///< Tuning reference (> 0)
  size_t window_size = kAnalysisSize;          ///< Analysis window (power of two)
  ClockFunction clock;                         ///< Timestamp source (empty = wall clock)
};

/// @brief Validates a confidence threshold.
/// @throws PitchtrackException if value is outside [0, 1]
void check_confidence(float value);

/// @brief Validates an A4 reference frequency.
/// @throws PitchtrackException if value is not a positive finite number
void check_a4_reference(float hz);

}  // namespace pitchtrack
