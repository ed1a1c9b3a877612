#include "streaming/signal_conditioner.h"

#include "core/convert.h"
#include "util/math_utils.h"

namespace pitchtrack {

namespace {

bool looks_like_octave_error(float ratio) {
  return (ratio > kOctaveUpLow && ratio < kOctaveUpHigh) ||
         (ratio > kOctaveDownLow && ratio < kOctaveDownHigh);
}

}  // namespace

void MedianHistory::push(float frequency) {
  values[write_index] = frequency;
  write_index = static_cast<uint8_t>((write_index + 1) % kMedianWindow);
  if (count < kMedianWindow) {
    ++count;
  }
}

float MedianHistory::value() const {
  switch (count) {
    case 0:
      return 0.0f;
    case 1:
      return values[0];
    case 2:
      return (values[0] + values[1]) / 2.0f;
    default:
      return median_of_three(values[0], values[1], values[2]);
  }
}

float SignalConditioner::window_level_db(const float* window, size_t size) {
  return amplitude_to_db(rms(window, size));
}

ConditionerOutput SignalConditioner::process_window(const float* window, YinEstimator& estimator,
                                                    const ConditionerParams& params) {
  if (window_level_db(window, estimator.window_size()) < params.silence_db) {
    return clear();
  }
  return process_estimate(estimator.estimate(window), params);
}

ConditionerOutput SignalConditioner::process_estimate(const std::optional<RawPitch>& raw,
                                                      const ConditionerParams& params) {
  if (!raw) {
    return clear();
  }

  const float confidence = raw->confidence;
  if (state_.is_showing_pitch) {
    if (confidence < params.confidence_exit) {
      return clear();
    }
  } else if (confidence < params.confidence_enter) {
    // Attack transients: stay silent without clearing
    return ConditionerOutput();
  }

  state_.median.push(suppress_octave_jump(raw->frequency));
  const float filtered = state_.median.value();

  auto note = frequency_to_note(filtered, params.a4_reference_hz);
  if (!note) {
    return ConditionerOutput();
  }

  state_.is_showing_pitch = true;

  ConditionerOutput out;
  out.action = ConditionerAction::Publish;
  out.frequency = filtered;
  out.confidence = confidence;
  out.note = *note;
  return out;
}

float SignalConditioner::suppress_octave_jump(float frequency) {
  if (state_.prev_frequency > 0.0f) {
    if (looks_like_octave_error(frequency / state_.prev_frequency)) {
      if (state_.octave_hold_count < kOctaveSuppressMax) {
        frequency = state_.prev_frequency;
        ++state_.octave_hold_count;
      } else {
        // Held long enough; treat it as a real octave change
        state_.octave_hold_count = 0;
      }
    } else {
      state_.octave_hold_count = 0;
    }
  }
  state_.prev_frequency = frequency;
  return frequency;
}

ConditionerOutput SignalConditioner::clear() {
  state_.is_showing_pitch = false;
  ConditionerOutput out;
  out.action = ConditionerAction::Clear;
  return out;
}

}  // namespace pitchtrack
