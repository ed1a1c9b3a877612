#pragma once

/// @file types.h
/// @brief Common type definitions for libpitchtrack.

#include <cstddef>
#include <cstdint>

namespace pitchtrack {

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,
  InvalidFormat,
  DecodeFailed,
  InvalidParameter,
  OutOfMemory,
};

/// @brief Pitch class (0-11, C=0).
enum class PitchClass : int {
  C = 0,
  Cs = 1,
  D = 2,
  Ds = 3,
  E = 4,
  F = 5,
  Fs = 6,
  G = 7,
  Gs = 8,
  A = 9,
  As = 10,
  B = 11,
};

/// @brief Returns the sharps-only English name of a pitch class.
/// @param pc Pitch class
/// @return String name (e.g., "C", "C#")
inline const char* pitch_class_name(PitchClass pc) {
  static const char* names[] = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};
  return names[static_cast<int>(pc)];
}

/// @brief Returns the pitch class of a MIDI note number (negative-safe).
inline PitchClass pitch_class_of_midi(int midi) {
  return static_cast<PitchClass>(((midi % 12) + 12) % 12);
}

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::DecodeFailed:
      return "Decode failed";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::OutOfMemory:
      return "Out of memory";
  }
  return "Unknown error";
}

}  // namespace pitchtrack
