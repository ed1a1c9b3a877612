#include "analysis/roadmap_analyzer.h"

#include <Eigen/Core>
#include <algorithm>

#include "core/ring_accumulator.h"
#include "feature/note.h"
#include "streaming/signal_conditioner.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace pitchtrack {

namespace {

/// @brief Confidence-weighted votes indexed by MIDI note number.
using VoteTable = Eigen::Array<float, kMidiNoteCount, 1>;

/// @brief Mutable state of one analysis run.
struct RoadmapRun {
  RoadmapRun(const RoadmapConfig& config, int sample_rate)
      : config(config),
        sample_rate(sample_rate),
        ring(config.window_size),
        estimator(static_cast<float>(sample_rate), config.window_size),
        window(config.window_size, 0.0f) {
    segment_votes.setZero();
    global_votes.setZero();
  }

  /// @brief Pushes samples and votes on the window if the ring is full.
  void feed(const float* samples, size_t n) {
    ring.push(samples, n);
    if (!ring.is_full()) {
      return;
    }

    ring.snapshot_into(window.data());
    if (SignalConditioner::window_level_db(window.data(), window.size()) < config.silence_db) {
      return;
    }

    auto raw = estimator.estimate(window.data());
    if (!raw || raw->confidence < config.confidence_enter) {
      return;
    }
    segment_votes[nearest_midi(raw->frequency, config.a4_reference_hz)] += raw->confidence;
  }

  /// @brief Closes the current segment and starts the next one.
  void flush_segment(RoadmapResult& result) {
    RoadmapSegment segment;
    segment.start_sec = samples_to_time(segment_start, sample_rate);
    segment.end_sec = samples_to_time(segment_start + segment_filled, sample_rate);

    float total = segment_votes.sum();
    if (total > 0.0f) {
      Eigen::Index winner = 0;
      segment_votes.maxCoeff(&winner);
      auto note = frequency_to_note(
          static_cast<float>(midi_to_hz(static_cast<double>(winner), config.a4_reference_hz)),
          config.a4_reference_hz);
      if (note) {
        segment.note_name = note->note_name();
        segment.octave = note->octave;
        segment.full_name = note->full_name();
        segment.confidence = segment_votes[winner] / total;
        segment.has_note = true;
        global_votes += segment_votes;
      }
    }
    result.segments.push_back(std::move(segment));

    segment_start += segment_filled;
    segment_filled = 0;
    segment_votes.setZero();
  }

  std::string dominant_note() const {
    if (global_votes.sum() <= 0.0f) {
      return std::string();
    }
    Eigen::Index best = 0;
    global_votes.maxCoeff(&best);
    auto note = frequency_to_note(
        static_cast<float>(midi_to_hz(static_cast<double>(best), config.a4_reference_hz)),
        config.a4_reference_hz);
    return note ? note->full_name() : std::string();
  }

  const RoadmapConfig& config;
  int sample_rate;
  RingAccumulator ring;
  YinEstimator estimator;
  std::vector<float> window;
  VoteTable segment_votes;
  VoteTable global_votes;
  size_t segment_start = 0;   ///< First sample of the open segment
  size_t segment_filled = 0;  ///< Samples fed into the open segment
};

}  // namespace

size_t RoadmapResult::segments_with_notes() const {
  return static_cast<size_t>(std::count_if(segments.begin(), segments.end(),
                                           [](const RoadmapSegment& s) { return s.has_note; }));
}

RoadmapAnalyzer::RoadmapAnalyzer(const RoadmapConfig& config) : config_(config) {
  PITCHTRACK_CHECK_MSG(config.segment_sec > 0.0, ErrorCode::InvalidParameter,
                       "Segment duration must be positive");
  PITCHTRACK_CHECK_MSG(config.chunk_size > 0, ErrorCode::InvalidParameter,
                       "Chunk size must be positive");
  PITCHTRACK_CHECK_MSG(is_power_of_two(config.window_size), ErrorCode::InvalidParameter,
                       "Window size must be a power of two");
  check_confidence(config.confidence_enter);
  check_a4_reference(config.a4_reference_hz);
}

void RoadmapAnalyzer::set_progress_callback(ProgressCallback callback) {
  progress_callback_ = std::move(callback);
}

void RoadmapAnalyzer::report_progress(float progress, const char* stage) const {
  if (progress_callback_) {
    progress_callback_(progress, stage);
  }
}

RoadmapResult RoadmapAnalyzer::analyze(const Audio& audio) const {
  if (audio.empty()) {
    return RoadmapResult();
  }
  return analyze(audio.data(), audio.size(), audio.sample_rate());
}

RoadmapResult RoadmapAnalyzer::analyze(const float* samples, size_t size, int sample_rate) const {
  PITCHTRACK_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter,
                       "Sample rate must be positive");

  RoadmapResult result;
  if (samples == nullptr || size == 0) {
    return result;
  }

  size_t limit = size;
  if (config_.max_duration_sec > 0.0) {
    limit = std::min(limit, time_to_samples(config_.max_duration_sec, sample_rate));
  }
  const size_t segment_samples =
      std::max(time_to_samples(config_.segment_sec, sample_rate), config_.window_size);

  RoadmapRun run(config_, sample_rate);
  size_t processed = 0;

  while (processed < limit) {
    const float* chunk = samples + processed;
    const size_t chunk_len = std::min(config_.chunk_size, limit - processed);

    // Split the chunk so that no feed crosses a segment boundary
    size_t offset = 0;
    while (offset < chunk_len) {
      size_t take = std::min(chunk_len - offset, segment_samples - run.segment_filled);
      run.feed(chunk + offset, take);
      run.segment_filled += take;
      offset += take;
      if (run.segment_filled >= segment_samples) {
        run.flush_segment(result);
        report_progress(static_cast<float>(processed + offset) / static_cast<float>(limit),
                        "segments");
      }
    }
    processed += chunk_len;
  }

  if (run.segment_filled > 0) {
    run.flush_segment(result);
    report_progress(1.0f, "segments");
  }

  result.dominant_note = run.dominant_note();
  result.total_duration_sec = samples_to_time(processed, sample_rate);
  return result;
}

RoadmapResult analyze_roadmap(const Audio& audio, const RoadmapConfig& config) {
  return RoadmapAnalyzer(config).analyze(audio);
}

}  // namespace pitchtrack
