#pragma once

/// @file live_session.h
/// @brief Continuous per-chunk pitch detection with a thread-safe latest estimate.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "core/ring_accumulator.h"
#include "feature/yin_estimator.h"
#include "streaming/detection_config.h"
#include "streaming/pitch_estimate.h"
#include "streaming/signal_conditioner.h"

namespace pitchtrack {

/// @brief Counters describing what a session has done since the last reset.
struct SessionStats {
  uint64_t chunks_received = 0;      ///< Non-empty on_chunk() calls
  uint64_t windows_analyzed = 0;     ///< Full windows run through the conditioner
  uint64_t estimates_published = 0;  ///< Windows that published a note
  uint64_t clears = 0;               ///< Windows that published "no note"
};

/// @brief Live detection session: ring accumulator, YIN, conditioner and a
/// single-slot published estimate.
/// @details Threading model:
///   - one producer thread calls on_chunk() sequentially, in temporal order;
///     it never allocates and only locks the slot for a struct copy
///   - any thread may call latest(), stats() and the tunable setters/getters
///
/// Each tunable is an independent atomic scalar read once at the start of
/// every window, so a change applies from the next window on.
///
/// Usage:
/// @code
///   LiveDetectionSession session(48000.0f);
///
///   // Capture callback:
///   session.on_chunk(samples, n_samples);
///
///   // UI poll (~30 Hz):
///   if (auto estimate = session.latest()) {
///     show(estimate->full_name(), estimate->cents);
///   }
/// @endcode
class LiveDetectionSession {
 public:
  /// @brief Constructs a session.
  /// @param sample_rate Capture sample rate in Hz (> 0)
  /// @param config Initial tunables, window size and clock
  /// @throws PitchtrackException on invalid parameters
  explicit LiveDetectionSession(float sample_rate, const SessionConfig& config = SessionConfig());

  LiveDetectionSession(const LiveDetectionSession&) = delete;
  LiveDetectionSession& operator=(const LiveDetectionSession&) = delete;

  /// @brief Feeds one capture chunk; analyses a window once the ring is full.
  void on_chunk(const float* samples, size_t n_samples);

  /// @brief Latest fresh estimate, read against the session clock.
  /// @return std::nullopt when nothing valid was published in the last 200 ms
  std::optional<PitchEstimate> latest() const;

  /// @brief Latest fresh estimate, read against an explicit time.
  std::optional<PitchEstimate> latest(double now_ms) const;

  /// @brief Raw slot contents, ignoring validity and staleness.
  PitchEstimate peek() const { return slot_.load(); }

  /// @brief Discards buffered audio, conditioning state, the published
  /// estimate and stats. Must not race with on_chunk().
  void reset();

  void set_silence_db(float db);
  void set_confidence_enter(float value);
  void set_confidence_exit(float value);
  void set_a4_reference(float hz);

  float silence_db() const { return silence_db_.load(std::memory_order_relaxed); }
  float confidence_enter() const { return confidence_enter_.load(std::memory_order_relaxed); }
  float confidence_exit() const { return confidence_exit_.load(std::memory_order_relaxed); }
  float a4_reference() const { return a4_reference_hz_.load(std::memory_order_relaxed); }

  float sample_rate() const { return estimator_.sample_rate(); }
  size_t window_size() const { return ring_.capacity(); }

  SessionStats stats() const;

  /// @brief Conditioner state; only meaningful on the producer thread.
  const ConditioningState& conditioning_state() const { return conditioner_.state(); }

 private:
  ConditionerParams snapshot_params() const;
  void publish(const ConditionerOutput& out);

  RingAccumulator ring_;
  YinEstimator estimator_;
  SignalConditioner conditioner_;
  std::vector<float> window_;
  ClockFunction clock_;
  PitchSlot slot_;

  std::atomic<float> silence_db_;
  std::atomic<float> confidence_enter_;
  std::atomic<float> confidence_exit_;
  std::atomic<float> a4_reference_hz_;

  std::atomic<uint64_t> chunks_received_{0};
  std::atomic<uint64_t> windows_analyzed_{0};
  std::atomic<uint64_t> estimates_published_{0};
  std::atomic<uint64_t> clears_{0};
};

}  // namespace pitchtrack
