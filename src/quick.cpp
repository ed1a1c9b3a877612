/// @file quick.cpp
/// @brief Implementation of stateless helpers.

#include "quick.h"

namespace pitchtrack {
namespace quick {

std::optional<RawPitch> detect_pitch(const float* samples, size_t size, int sample_rate) {
  if (samples == nullptr || size < kAnalysisSize) {
    return std::nullopt;
  }
  YinEstimator estimator(static_cast<float>(sample_rate));
  return estimator.estimate(samples);
}

std::optional<NoteInfo> frequency_to_note(float frequency, float a4) {
  return pitchtrack::frequency_to_note(frequency, a4);
}

RoadmapResult analyze_roadmap(const float* samples, size_t size, int sample_rate,
                              double segment_sec) {
  RoadmapConfig config;
  config.segment_sec = segment_sec;
  return RoadmapAnalyzer(config).analyze(samples, size, sample_rate);
}

std::string dominant_note(const float* samples, size_t size, int sample_rate) {
  return analyze_roadmap(samples, size, sample_rate).dominant_note;
}

}  // namespace quick
}  // namespace pitchtrack
