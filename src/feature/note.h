#pragma once

/// @file note.h
/// @brief Frequency to note name / octave / cent deviation conversion.

#include <optional>
#include <string>

#include "core/convert.h"
#include "util/types.h"

namespace pitchtrack {

/// @brief Lowest frequency accepted for note naming (exclusive), in Hz.
constexpr float kNoteMinHz = 20.0f;

/// @brief Highest frequency accepted for note naming (inclusive), in Hz.
constexpr float kNoteMaxHz = 5000.0f;

/// @brief Equal-tempered note nearest to a frequency.
/// @details Trivially copyable: names come from a static table, so building a
/// NoteInfo on the audio thread never allocates.
struct NoteInfo {
  PitchClass pitch_class = PitchClass::C;  ///< Sharps-only pitch class
  int octave = 0;                          ///< Scientific octave (MIDI 60 = C4)
  int cents = 0;                           ///< Deviation from the nearest note, rounded
  int midi = 0;                            ///< Nearest MIDI note number

  /// @brief Note name without octave (e.g., "C#").
  const char* note_name() const { return pitch_class_name(pitch_class); }

  /// @brief Note name with octave (e.g., "C#4").
  std::string full_name() const;
};

/// @brief Converts a frequency to the nearest equal-tempered note.
/// @param frequency Frequency in Hz
/// @param a4 Reference frequency of A4 in Hz
/// @return Note info, or std::nullopt when frequency <= 20 Hz or > 5000 Hz,
/// or when a4 is not a positive finite frequency
/// @note Cents are not clamped. At an exact half-semitone tie rounding can
/// produce |cents| slightly above 50.
std::optional<NoteInfo> frequency_to_note(float frequency, float a4 = kDefaultA4Hz);

/// @brief Formats a note name and octave as "<name><octave>".
std::string format_full_name(const char* note_name, int octave);

}  // namespace pitchtrack
