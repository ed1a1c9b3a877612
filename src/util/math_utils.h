#pragma once

/// @file math_utils.h
/// @brief Mathematical utility functions for signal processing.

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace pitchtrack {

/// @brief Clamps a value between min and max.
/// @tparam T Numeric type
/// @param value Value to clamp
/// @param min_val Minimum bound
/// @param max_val Maximum bound
/// @return Clamped value
template <typename T>
T clamp(T value, T min_val, T max_val) {
  return std::max(min_val, std::min(value, max_val));
}

/// @brief Returns true if n is a positive power of two.
inline bool is_power_of_two(size_t n) { return n != 0 && (n & (n - 1)) == 0; }

/// @brief Middle value of three, independent of argument order.
/// @details Three compare-swaps; no allocation.
float median_of_three(float a, float b, float c);

/// @brief Root-mean-square of a sample block.
/// @param samples Pointer to samples
/// @param size Number of samples
/// @return RMS value (0 if empty)
float rms(const float* samples, size_t size);

}  // namespace pitchtrack
