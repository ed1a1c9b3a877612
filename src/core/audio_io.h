#pragma once

/// @file audio_io.h
/// @brief File decoder adapter (dr_wav, minimp3) producing mono float PCM.
/// @details This is the boundary where recorded audio enters the engine. The
/// offline roadmap analyzer and the CLI consume its output; the detection core
/// itself never touches files.

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace pitchtrack {

/// @brief Detected container format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief Decoded samples (mono, [-1,1]) and their native sample rate.
using AudioLoadResult = std::tuple<std::vector<float>, int>;

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit, default 500MB).
  size_t max_file_size = 500 * 1024 * 1024;
};

inline const AudioLoadOptions kDefaultLoadOptions{};

/// @brief Detects container format from the first bytes of a buffer.
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Averages interleaved channels into one mono channel.
/// @param interleaved Interleaved samples
/// @param frame_count Number of frames (samples per channel)
/// @param channels Channel count (>= 1)
std::vector<float> downmix_to_mono(const float* interleaved, size_t frame_count, int channels);

/// @brief Decodes a WAV image held in memory.
/// @throws PitchtrackException on decode error
AudioLoadResult load_buffer_wav(const uint8_t* data, size_t size);

/// @brief Decodes an MP3 image held in memory.
/// @throws PitchtrackException on decode error
AudioLoadResult load_buffer_mp3(const uint8_t* data, size_t size);

/// @brief Decodes a WAV or MP3 image held in memory (format auto-detected).
/// @throws PitchtrackException on unknown format or decode error
AudioLoadResult load_buffer(const uint8_t* data, size_t size);

/// @brief Loads a WAV file from disk.
AudioLoadResult load_wav(const std::string& path);

/// @brief Loads an MP3 file from disk.
AudioLoadResult load_mp3(const std::string& path);

/// @brief Loads an audio file (format auto-detected).
/// @throws PitchtrackException on file not found, unknown format, file too large,
/// or decode error
AudioLoadResult load_audio(const std::string& path,
                           const AudioLoadOptions& options = kDefaultLoadOptions);

/// @brief Writes mono samples to a PCM WAV file.
/// @param bits_per_sample 16 or 24
/// @throws PitchtrackException on invalid arguments or write error
void save_wav(const std::string& path, const float* samples, size_t n_samples, int sample_rate,
              int bits_per_sample = 16);

/// @overload
void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate,
              int bits_per_sample = 16);

}  // namespace pitchtrack
