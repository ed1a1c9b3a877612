#include "feature/note.h"

#include <cmath>

namespace pitchtrack {

std::string NoteInfo::full_name() const { return format_full_name(note_name(), octave); }

std::string format_full_name(const char* note_name, int octave) {
  return std::string(note_name) + std::to_string(octave);
}

std::optional<NoteInfo> frequency_to_note(float frequency, float a4) {
  if (!(frequency > kNoteMinHz && frequency <= kNoteMaxHz)) {
    return std::nullopt;
  }
  if (!(std::isfinite(a4) && a4 > 0.0f)) {
    return std::nullopt;
  }

  double note_number = hz_to_midi(frequency, a4);
  int nearest = static_cast<int>(std::lround(note_number));
  double nearest_hz = midi_to_hz(nearest, a4);

  NoteInfo info;
  info.midi = nearest;
  info.cents = static_cast<int>(std::lround(1200.0 * std::log2(frequency / nearest_hz)));
  info.pitch_class = pitch_class_of_midi(nearest);
  // Floor division keeps octave numbering correct below MIDI 0
  info.octave = static_cast<int>(std::floor(nearest / 12.0)) - 1;
  return info;
}

}  // namespace pitchtrack
