#include "streaming/live_session.h"

#include <cmath>

#include "util/exception.h"

namespace pitchtrack {

LiveDetectionSession::LiveDetectionSession(float sample_rate, const SessionConfig& config)
    : ring_(config.window_size),
      estimator_(sample_rate, config.window_size),
      window_(config.window_size, 0.0f),
      clock_(config.clock ? config.clock : ClockFunction(wall_clock_ms)),
      silence_db_(config.silence_db),
      confidence_enter_(config.confidence_enter),
      confidence_exit_(config.confidence_exit),
      a4_reference_hz_(config.a4_reference_hz) {
  check_confidence(config.confidence_enter);
  check_confidence(config.confidence_exit);
  check_a4_reference(config.a4_reference_hz);
}

void LiveDetectionSession::on_chunk(const float* samples, size_t n_samples) {
  // An empty chunk carries no new audio, so the current window is not re-published.
  if (samples == nullptr || n_samples == 0) {
    return;
  }
  chunks_received_.fetch_add(1, std::memory_order_relaxed);

  ring_.push(samples, n_samples);
  if (!ring_.is_full()) {
    return;
  }

  ring_.snapshot_into(window_.data());
  windows_analyzed_.fetch_add(1, std::memory_order_relaxed);
  publish(conditioner_.process_window(window_.data(), estimator_, snapshot_params()));
}

std::optional<PitchEstimate> LiveDetectionSession::latest() const { return latest(clock_()); }

std::optional<PitchEstimate> LiveDetectionSession::latest(double now_ms) const {
  PitchEstimate estimate = slot_.load();
  if (!estimate.is_fresh(now_ms)) {
    return std::nullopt;
  }
  return estimate;
}

void LiveDetectionSession::reset() {
  ring_.reset();
  conditioner_.reset();
  slot_.clear();
  chunks_received_.store(0, std::memory_order_relaxed);
  windows_analyzed_.store(0, std::memory_order_relaxed);
  estimates_published_.store(0, std::memory_order_relaxed);
  clears_.store(0, std::memory_order_relaxed);
}

void LiveDetectionSession::set_silence_db(float db) {
  PITCHTRACK_CHECK_MSG(!std::isnan(db), ErrorCode::InvalidParameter, "Silence threshold is NaN");
  silence_db_.store(db, std::memory_order_relaxed);
}

void LiveDetectionSession::set_confidence_enter(float value) {
  check_confidence(value);
  confidence_enter_.store(value, std::memory_order_relaxed);
}

void LiveDetectionSession::set_confidence_exit(float value) {
  check_confidence(value);
  confidence_exit_.store(value, std::memory_order_relaxed);
}

void LiveDetectionSession::set_a4_reference(float hz) {
  check_a4_reference(hz);
  a4_reference_hz_.store(hz, std::memory_order_relaxed);
}

SessionStats LiveDetectionSession::stats() const {
  SessionStats s;
  s.chunks_received = chunks_received_.load(std::memory_order_relaxed);
  s.windows_analyzed = windows_analyzed_.load(std::memory_order_relaxed);
  s.estimates_published = estimates_published_.load(std::memory_order_relaxed);
  s.clears = clears_.load(std::memory_order_relaxed);
  return s;
}

ConditionerParams LiveDetectionSession::snapshot_params() const {
  ConditionerParams params;
  params.silence_db = silence_db();
  params.confidence_enter = confidence_enter();
  params.confidence_exit = confidence_exit();
  params.a4_reference_hz = a4_reference();
  return params;
}

void LiveDetectionSession::publish(const ConditionerOutput& out) {
  switch (out.action) {
    case ConditionerAction::Skip:
      return;
    case ConditionerAction::Clear:
      slot_.clear();
      clears_.fetch_add(1, std::memory_order_relaxed);
      return;
    case ConditionerAction::Publish:
      break;
  }

  PitchEstimate estimate;
  estimate.frequency = out.frequency;
  estimate.pitch_class = out.note.pitch_class;
  estimate.octave = out.note.octave;
  estimate.cents = out.note.cents;
  estimate.confidence = out.confidence;
  estimate.timestamp_ms = clock_();
  estimate.is_valid = true;
  slot_.store(estimate);
  estimates_published_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace pitchtrack
