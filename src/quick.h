#pragma once

/// @file quick.h
/// @brief Stateless helpers for one-off pitch queries.
/// @details Convenience wrappers over YinEstimator, frequency_to_note and
/// RoadmapAnalyzer for callers that do not need a streaming session.

#include <cstddef>
#include <optional>
#include <string>

#include "analysis/roadmap_analyzer.h"
#include "feature/note.h"
#include "feature/yin_estimator.h"

namespace pitchtrack {
namespace quick {

/// @brief Runs YIN on the first full analysis window of a buffer.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples (at least kAnalysisSize for a result)
/// @param sample_rate Sample rate in Hz
/// @return Raw estimate, or std::nullopt for short input or no pitch
std::optional<RawPitch> detect_pitch(const float* samples, size_t size, int sample_rate);

/// @brief Converts a frequency to a note at the given tuning.
std::optional<NoteInfo> frequency_to_note(float frequency, float a4 = kDefaultA4Hz);

/// @brief Builds a note roadmap with default settings and the given segment length.
RoadmapResult analyze_roadmap(const float* samples, size_t size, int sample_rate,
                              double segment_sec = 2.0);

/// @brief Returns the dominant note name (e.g., "A4"), empty if none was found.
std::string dominant_note(const float* samples, size_t size, int sample_rate);

}  // namespace quick
}  // namespace pitchtrack
