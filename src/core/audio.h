#pragma once

/// @file audio.h
/// @brief Decoded mono PCM buffer handed to offline analysis.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pitchtrack {

/// @brief Immutable mono float buffer with shared ownership and zero-copy slicing.
/// @details Samples are mono, nominally in [-1, 1]. Multi-channel sources are
/// down-mixed by the decoder before they reach this class.
class Audio {
 public:
  /// @brief Default constructor creates an empty Audio.
  Audio();

  /// @brief Creates Audio by copying existing samples.
  /// @param samples Pointer to sample data
  /// @param size Number of samples
  /// @param sample_rate Sample rate in Hz (> 0)
  /// @throws PitchtrackException if sample_rate <= 0
  static Audio from_buffer(const float* samples, size_t size, int sample_rate);

  /// @brief Creates Audio from a vector of samples (moved).
  /// @throws PitchtrackException if sample_rate <= 0
  static Audio from_vector(std::vector<float> samples, int sample_rate);

  /// @brief Decodes a WAV or MP3 file.
  /// @param path Path to audio file
  /// @throws PitchtrackException on file not found or decode error
  static Audio from_file(const std::string& path);

  /// @brief Decodes a WAV or MP3 image held in memory.
  /// @throws PitchtrackException on decode error
  static Audio from_memory(const uint8_t* data, size_t size);

  /// @brief Returns pointer to sample data (nullptr when empty).
  const float* data() const;

  /// @brief Returns number of samples.
  size_t size() const { return length_; }

  /// @brief Returns sample rate in Hz.
  int sample_rate() const { return sample_rate_; }

  /// @brief Returns duration in seconds.
  double duration() const;

  /// @brief Returns true if audio holds no samples.
  bool empty() const { return length_ == 0; }

  /// @brief Zero-copy view of [start_sec, end_sec); negative end means "to the end".
  Audio slice(double start_sec, double end_sec = -1.0) const;

  /// @brief Zero-copy view of sample range [start, end), clamped to the buffer.
  Audio slice_samples(size_t start, size_t end = static_cast<size_t>(-1)) const;

  /// @brief Access sample by index.
  /// @throws PitchtrackException if index is out of range
  float operator[](size_t index) const;

  const float* begin() const { return data(); }
  const float* end() const { return data() + size(); }

 private:
  Audio(std::shared_ptr<const std::vector<float>> buffer, size_t offset, size_t length,
        int sample_rate);

  std::shared_ptr<const std::vector<float>> buffer_;
  size_t offset_;
  size_t length_;
  int sample_rate_;
};

}  // namespace pitchtrack
