#pragma once

/// @file ring_accumulator.h
/// @brief Circular buffer assembling fixed-size analysis windows from capture chunks.

#include <cstddef>
#include <vector>

namespace pitchtrack {

/// @brief Fixed-capacity ring that turns a stream of chunks into overlapping windows.
/// @details Capacity must be a power of two; the write cursor wraps with a bitmask.
/// After the first `capacity()` samples have been pushed, `snapshot_into()` unrolls
/// the most recent `capacity()` samples, oldest first. Storage is allocated once
/// in the constructor; `push()` and `snapshot_into()` never allocate.
///
/// Usage:
/// @code
///   RingAccumulator ring(2048);
///   std::vector<float> window(2048);
///   ring.push(chunk, 1024);
///   if (ring.is_full()) ring.snapshot_into(window.data());
/// @endcode
class RingAccumulator {
 public:
  /// @brief Constructs an empty ring.
  /// @param capacity Window length in samples (power of two)
  /// @throws PitchtrackException if capacity is not a power of two
  explicit RingAccumulator(size_t capacity);

  /// @brief Appends samples at the write cursor.
  /// @details Accepts any chunk length, including longer than capacity (only the
  /// trailing `capacity()` samples are retained).
  void push(const float* samples, size_t n_samples);

  /// @brief True once at least `capacity()` samples have been pushed since reset.
  bool is_full() const { return samples_seen_ >= capacity_; }

  /// @brief Copies the retained samples, oldest first, into `out[0..capacity)`.
  /// @details Only meaningful once is_full(); before that the leading part of
  /// the window holds zeros.
  void snapshot_into(float* out) const;

  /// @brief Zeroes storage, cursor and the samples-seen counter.
  void reset();

  size_t capacity() const { return capacity_; }

  /// @brief Samples pushed since reset, saturating at capacity().
  size_t samples_seen() const { return samples_seen_; }

  /// @brief Index the next sample will be written to.
  size_t write_position() const { return write_pos_; }

 private:
  std::vector<float> buffer_;
  size_t capacity_;
  size_t mask_;
  size_t write_pos_ = 0;
  size_t samples_seen_ = 0;
};

}  // namespace pitchtrack
