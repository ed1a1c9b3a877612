#pragma once

/// @file convert.h
/// @brief Unit conversion functions for pitch processing.

#include <cstddef>

namespace pitchtrack {

/// @brief Standard concert pitch for A4 in Hz.
constexpr float kDefaultA4Hz = 440.0f;

/// @brief MIDI note number of A4.
constexpr int kA4Midi = 69;

/// @brief Number of addressable MIDI notes (0-127).
constexpr int kMidiNoteCount = 128;

/// @brief dB value reported for an exactly silent block.
constexpr float kSilenceDbSentinel = -200.0f;

/// @brief Converts Hz to fractional MIDI note number.
/// @param hz Frequency in Hz (> 0)
/// @param a4 Reference frequency of A4 in Hz
/// @return MIDI note number (A4 = 69); 0 for hz <= 0
double hz_to_midi(double hz, double a4 = kDefaultA4Hz);

/// @brief Converts a MIDI note number to its equal-tempered frequency.
/// @param midi MIDI note number
/// @param a4 Reference frequency of A4 in Hz
double midi_to_hz(double midi, double a4 = kDefaultA4Hz);

/// @brief Nearest MIDI note to a frequency, clamped to [0, 127].
int nearest_midi(double hz, double a4 = kDefaultA4Hz);

/// @brief Converts linear amplitude to dBFS.
/// @return 20*log10(amplitude), or kSilenceDbSentinel when amplitude is not positive
float amplitude_to_db(float amplitude);

/// @brief Converts a sample count to seconds.
double samples_to_time(size_t samples, int sr);

/// @brief Converts seconds to a sample count (truncating, negative -> 0).
size_t time_to_samples(double seconds, int sr);

}  // namespace pitchtrack
