#pragma once

/// @file pitch_estimate.h
/// @brief Published pitch estimate and the single-slot store that shares it.

#include <mutex>
#include <string>

#include "feature/note.h"
#include "streaming/detection_config.h"
#include "util/types.h"

namespace pitchtrack {

/// @brief Validated, debounced estimate published once per analysis window.
/// @details A default-constructed value is the "no current note" state.
struct PitchEstimate {
  float frequency = 0.0f;                  ///< Smoothed frequency in Hz
  PitchClass pitch_class = PitchClass::C;  ///< Nearest pitch class
  int octave = 0;                          ///< Scientific octave
  int cents = 0;                           ///< Deviation from the nearest note
  float confidence = 0.0f;                 ///< YIN confidence of the window
  double timestamp_ms = 0.0;               ///< Wall-clock time of publication
  bool is_valid = false;                   ///< False means "no current note"

  /// @brief Note name without octave (e.g., "A"); empty when invalid.
  const char* note_name() const { return is_valid ? pitch_class_name(pitch_class) : ""; }

  /// @brief Note name with octave (e.g., "A4"); empty when invalid.
  std::string full_name() const;

  /// @brief True when valid and not older than kStaleAfterMs at now_ms.
  bool is_fresh(double now_ms) const {
    return is_valid && now_ms - timestamp_ms <= kStaleAfterMs;
  }
};

/// @brief Single-writer slot holding the latest PitchEstimate.
/// @details Whole-value replace under a mutex held only for the copy, so a
/// reader always observes one complete write.
class PitchSlot {
 public:
  void store(const PitchEstimate& estimate) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = estimate;
  }

  PitchEstimate load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
  }

  /// @brief Replaces the slot with the "no current note" value.
  void clear() { store(PitchEstimate()); }

 private:
  mutable std::mutex mutex_;
  PitchEstimate value_;
};

}  // namespace pitchtrack
