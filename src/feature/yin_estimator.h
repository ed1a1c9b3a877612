#pragma once

/// @file yin_estimator.h
/// @brief YIN fundamental-frequency estimation over one fixed-size window.

#include <cstddef>
#include <optional>
#include <vector>

namespace pitchtrack {

/// @brief Analysis window length in samples.
constexpr size_t kAnalysisSize = 2048;

/// @brief Absolute threshold on the CMND for accepting a lag.
constexpr float kYinThreshold = 0.12f;

/// @brief Lowest frequency the estimator reports (Hz).
constexpr float kMinFrequency = 75.0f;

/// @brief Highest frequency the estimator reports (Hz).
constexpr float kMaxFrequency = 2000.0f;

/// @brief Direct output of one YIN pass.
struct RawPitch {
  float frequency = 0.0f;   ///< Frequency in Hz, within [kMinFrequency, kMaxFrequency]
  float confidence = 0.0f;  ///< 1 - CMND at the chosen lag, clamped to [0, 1]
};

/// @brief YIN pitch estimator with owned scratch buffers.
/// @details The difference function and CMND arrays (window_size / 2 each) are
/// allocated at construction and reused, so estimate() never allocates. Two
/// estimators never share scratch memory, which makes it safe to run a live
/// session and an offline analysis concurrently with separate instances.
///
/// Lags are evaluated over the half window: d[tau] sums
/// (x[j] - x[j + tau])^2 for j in [0, N/2).
class YinEstimator {
 public:
  /// @brief Constructs an estimator.
  /// @param sample_rate Sample rate in Hz (> 0)
  /// @param window_size Window length in samples (even, >= 8)
  /// @param threshold Absolute CMND threshold
  /// @throws PitchtrackException on invalid parameters
  explicit YinEstimator(float sample_rate, size_t window_size = kAnalysisSize,
                        float threshold = kYinThreshold);

  /// @brief Runs YIN on one window of exactly window_size() samples.
  /// @param window Pointer to window_size() samples
  /// @return Frequency and confidence, or std::nullopt when no lag passes the
  /// threshold or the frequency falls outside [kMinFrequency, kMaxFrequency]
  std::optional<RawPitch> estimate(const float* window);

  float sample_rate() const { return sample_rate_; }
  size_t window_size() const { return window_size_; }
  float threshold() const { return threshold_; }

  /// @brief CMND values from the most recent estimate() call [window_size / 2].
  const std::vector<float>& cmnd() const { return cmnd_; }

  /// @brief Difference function from the most recent estimate() call [window_size / 2].
  const std::vector<float>& difference() const { return diff_; }

 private:
  void compute_difference(const float* window);
  void compute_cmnd();
  int find_lag() const;
  float refine_lag(int tau) const;

  float sample_rate_;
  size_t window_size_;
  size_t half_;
  float threshold_;
  std::vector<float> diff_;
  std::vector<float> cmnd_;
};

}  // namespace pitchtrack
