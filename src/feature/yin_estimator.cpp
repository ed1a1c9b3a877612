#include "feature/yin_estimator.h"

#include <Eigen/Core>
#include <cmath>

#include "util/exception.h"
#include "util/math_utils.h"

namespace pitchtrack {

namespace {

/// @brief Denominator magnitude below which the parabola is treated as flat.
constexpr float kParabolaEpsilon = 1e-8f;

}  // namespace

YinEstimator::YinEstimator(float sample_rate, size_t window_size, float threshold)
    : sample_rate_(sample_rate),
      window_size_(window_size),
      half_(window_size / 2),
      threshold_(threshold) {
  PITCHTRACK_CHECK_MSG(sample_rate > 0.0f, ErrorCode::InvalidParameter,
                       "Sample rate must be positive");
  PITCHTRACK_CHECK_MSG(window_size >= 8 && window_size % 2 == 0, ErrorCode::InvalidParameter,
                       "Window size must be even and at least 8");
  PITCHTRACK_CHECK_MSG(threshold > 0.0f && threshold < 1.0f, ErrorCode::InvalidParameter,
                       "YIN threshold must be in (0, 1)");
  diff_.assign(half_, 0.0f);
  cmnd_.assign(half_, 0.0f);
}

std::optional<RawPitch> YinEstimator::estimate(const float* window) {
  compute_difference(window);
  compute_cmnd();

  int tau = find_lag();
  if (tau <= 0) {
    return std::nullopt;
  }

  float refined = refine_lag(tau);
  float frequency = sample_rate_ / refined;
  if (!(frequency >= kMinFrequency && frequency <= kMaxFrequency)) {
    return std::nullopt;
  }

  RawPitch result;
  result.frequency = frequency;
  result.confidence = clamp(1.0f - cmnd_[tau], 0.0f, 1.0f);
  return result;
}

void YinEstimator::compute_difference(const float* window) {
  const auto n = static_cast<Eigen::Index>(half_);
  Eigen::Map<const Eigen::ArrayXf> head(window, n);

  // d(tau) = sum_{j=0}^{N/2-1} (x[j] - x[j+tau])^2
  diff_[0] = 0.0f;
  for (size_t tau = 1; tau < half_; ++tau) {
    Eigen::Map<const Eigen::ArrayXf> lagged(window + tau, n);
    diff_[tau] = (head - lagged).square().sum();
  }
}

void YinEstimator::compute_cmnd() {
  cmnd_[0] = 1.0f;

  float running_sum = 0.0f;
  for (size_t tau = 1; tau < half_; ++tau) {
    running_sum += diff_[tau];
    if (running_sum > 0.0f) {
      cmnd_[tau] = diff_[tau] * static_cast<float>(tau) / running_sum;
    } else {
      cmnd_[tau] = 1.0f;
    }
  }
}

int YinEstimator::find_lag() const {
  const int half = static_cast<int>(half_);

  for (int tau = 2; tau < half - 1; ++tau) {
    if (cmnd_[tau] < threshold_) {
      // Walk down to the bottom of the dip
      while (tau + 1 < half - 1 && cmnd_[tau + 1] < cmnd_[tau]) {
        ++tau;
      }
      return tau;
    }
  }
  return -1;
}

float YinEstimator::refine_lag(int tau) const {
  const int half = static_cast<int>(half_);
  int prev = std::max(1, tau - 1);
  int next = std::min(half - 2, tau + 1);

  float denom = 2.0f * (cmnd_[prev] - 2.0f * cmnd_[tau] + cmnd_[next]);
  if (std::abs(denom) > kParabolaEpsilon) {
    return static_cast<float>(tau) + (cmnd_[prev] - cmnd_[next]) / denom;
  }
  return static_cast<float>(tau);
}

}  // namespace pitchtrack
