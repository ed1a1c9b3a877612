#pragma once

/// @file roadmap_analyzer.h
/// @brief Offline note roadmap: per-segment confidence-weighted note votes over
/// a decoded buffer.

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/audio.h"
#include "core/convert.h"
#include "feature/yin_estimator.h"
#include "streaming/detection_config.h"

namespace pitchtrack {

/// @brief Progress callback type for analysis progress reporting.
/// @param progress Progress value (0.0 to 1.0)
/// @param stage Name of the current stage
using ProgressCallback = std::function<void(float progress, const char* stage)>;

/// @brief Configuration for RoadmapAnalyzer.
struct RoadmapConfig {
  double segment_sec = 2.0;                    ///< Segment duration in seconds (> 0)
  double max_duration_sec = 300.0;             ///< Processing cap in seconds (<= 0 = no cap)
  size_t chunk_size = kCaptureSize;            ///< Samples fed per step
  float silence_db = kSilenceDbDefault;        ///< Silence gate (dBFS)
  float confidence_enter = kConfidenceEnter;   ///< Minimum confidence for a vote
  float a4_reference_hz = kDefaultA4Hz;        ///< Tuning reference
  size_t window_size = kAnalysisSize;          ///< Analysis window (power of two)
};

/// @brief One fixed-duration time window of a roadmap.
struct RoadmapSegment {
  double start_sec = 0.0;   ///< Segment start (seconds from buffer start)
  double end_sec = 0.0;     ///< Segment end
  std::string note_name;    ///< e.g. "C"; empty when has_note is false
  int octave = 0;           ///< e.g. 4; 0 when has_note is false
  std::string full_name;    ///< e.g. "C4"; empty when has_note is false
  float confidence = 0.0f;  ///< Winning share of the segment's votes [0, 1]
  bool has_note = false;    ///< False = silence or no confident pitch

  double duration() const { return end_sec - start_sec; }
};

/// @brief Output of one offline analysis.
struct RoadmapResult {
  std::vector<RoadmapSegment> segments;
  std::string dominant_note;        ///< Highest-voted note over the whole run, e.g. "A4"
  double total_duration_sec = 0.0;  ///< Seconds of audio actually processed

  /// @brief Number of segments that carry a note.
  size_t segments_with_notes() const;
};

/// @brief Batch driver re-running the live window/estimate pipeline over a buffer.
/// @details Each full window that passes the silence gate and yields a YIN
/// estimate with confidence >= confidence_enter adds its confidence to a vote
/// for its nearest MIDI note. At every segment boundary the argmax note wins
/// the segment. Hysteresis, octave suppression and median smoothing are not
/// applied; voting replaces them.
///
/// Segments are at least one analysis window long. A trailing partial
/// segment is flushed with the same rules.
class RoadmapAnalyzer {
 public:
  /// @brief Constructs an analyzer.
  /// @throws PitchtrackException on invalid configuration
  explicit RoadmapAnalyzer(const RoadmapConfig& config = RoadmapConfig());

  /// @brief Sets progress callback, invoked once per finalized segment.
  void set_progress_callback(ProgressCallback callback);

  /// @brief Analyzes raw mono samples.
  /// @param samples Pointer to samples (may be null when size is 0)
  /// @param size Number of samples
  /// @param sample_rate Sample rate in Hz (> 0)
  /// @return Roadmap; empty (no segments, zero duration) for empty input
  RoadmapResult analyze(const float* samples, size_t size, int sample_rate) const;

  /// @brief Analyzes a decoded Audio buffer.
  RoadmapResult analyze(const Audio& audio) const;

  const RoadmapConfig& config() const { return config_; }

 private:
  void report_progress(float progress, const char* stage) const;

  RoadmapConfig config_;
  ProgressCallback progress_callback_;
};

/// @brief Convenience wrapper: analyzes audio with the given configuration.
RoadmapResult analyze_roadmap(const Audio& audio, const RoadmapConfig& config = RoadmapConfig());

}  // namespace pitchtrack
