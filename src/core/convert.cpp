/// @file convert.cpp
/// @brief Implementation of unit conversion functions.

#include "core/convert.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pitchtrack {

double hz_to_midi(double hz, double a4) {
  if (hz <= 0.0) return 0.0;
  return 12.0 * std::log2(hz / a4) + kA4Midi;
}

double midi_to_hz(double midi, double a4) { return a4 * std::pow(2.0, (midi - kA4Midi) / 12.0); }

int nearest_midi(double hz, double a4) {
  int midi = static_cast<int>(std::lround(hz_to_midi(hz, a4)));
  return std::max(0, std::min(kMidiNoteCount - 1, midi));
}

float amplitude_to_db(float amplitude) {
  if (amplitude > 0.0f) {
    return 20.0f * std::log10(amplitude);
  }
  return kSilenceDbSentinel;
}

double samples_to_time(size_t samples, int sr) {
  if (sr <= 0) return 0.0;
  return static_cast<double>(samples) / static_cast<double>(sr);
}

size_t time_to_samples(double seconds, int sr) {
  if (!(seconds > 0.0) || sr <= 0) return 0;
  double samples = seconds * static_cast<double>(sr);
  // Saturate; the conversion is undefined past the range of size_t.
  if (samples >= static_cast<double>(std::numeric_limits<size_t>::max())) {
    return std::numeric_limits<size_t>::max();
  }
  return static_cast<size_t>(samples);
}

}  // namespace pitchtrack
