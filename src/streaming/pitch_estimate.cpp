#include "streaming/pitch_estimate.h"

namespace pitchtrack {

std::string PitchEstimate::full_name() const {
  if (!is_valid) {
    return std::string();
  }
  return format_full_name(pitch_class_name(pitch_class), octave);
}

}  // namespace pitchtrack
