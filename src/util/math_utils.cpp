/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

#include <Eigen/Core>
#include <utility>

namespace pitchtrack {

float median_of_three(float a, float b, float c) {
  if (a > b) std::swap(a, b);
  if (b > c) std::swap(b, c);
  if (a > b) std::swap(a, b);
  return b;
}

float rms(const float* samples, size_t size) {
  if (size == 0) return 0.0f;
  Eigen::Map<const Eigen::VectorXf> block(samples, static_cast<Eigen::Index>(size));
  return std::sqrt(block.squaredNorm() / static_cast<float>(size));
}

}  // namespace pitchtrack
