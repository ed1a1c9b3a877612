/// @file pitchtrack_c.cpp
/// @brief Implementation of C API.

#include "pitchtrack_c.h"

#include <cstdio>
#include <cstring>
#include <new>
#include <string>

#include "analysis/roadmap_analyzer.h"
#include "feature/note.h"
#include "pitchtrack.h"
#include "streaming/live_session.h"
#include "util/exception.h"

using namespace pitchtrack;

// Internal wrapper structure
struct PitchtrackSession {
  explicit PitchtrackSession(float sample_rate) : session(sample_rate) {}
  LiveDetectionSession session;
};

namespace {

/// @brief Minimum valid sample rate (8kHz - telephone quality)
constexpr int kMinSampleRate = 8000;
/// @brief Maximum valid sample rate (384kHz - high-res audio)
constexpr int kMaxSampleRate = 384000;
/// @brief Maximum roadmap input (~3 hours at 48kHz)
constexpr size_t kMaxBufferSize = 500000000;

PitchtrackError to_c_error(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return PITCHTRACK_OK;
    case ErrorCode::FileNotFound:
      return PITCHTRACK_ERROR_FILE_NOT_FOUND;
    case ErrorCode::InvalidFormat:
      return PITCHTRACK_ERROR_INVALID_FORMAT;
    case ErrorCode::DecodeFailed:
      return PITCHTRACK_ERROR_DECODE_FAILED;
    case ErrorCode::InvalidParameter:
      return PITCHTRACK_ERROR_INVALID_PARAMETER;
    case ErrorCode::OutOfMemory:
      return PITCHTRACK_ERROR_OUT_OF_MEMORY;
  }
  return PITCHTRACK_ERROR_UNKNOWN;
}

template <size_t N>
void copy_name(char (&dst)[N], const std::string& src) {
  std::snprintf(dst, N, "%s", src.c_str());
}

/// @brief Runs a setter, mapping library exceptions to error codes.
template <typename Fn>
PitchtrackError guarded(Fn&& fn) {
  try {
    fn();
    return PITCHTRACK_OK;
  } catch (const PitchtrackException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return PITCHTRACK_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return PITCHTRACK_ERROR_UNKNOWN;
  }
}

}  // namespace

// Live session

PitchtrackError pitchtrack_session_create(int sample_rate, PitchtrackSession** out) {
  if (out == nullptr) {
    return PITCHTRACK_ERROR_INVALID_PARAMETER;
  }
  *out = nullptr;
  if (sample_rate < kMinSampleRate || sample_rate > kMaxSampleRate) {
    return PITCHTRACK_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { *out = new PitchtrackSession(static_cast<float>(sample_rate)); });
}

void pitchtrack_session_free(PitchtrackSession* session) { delete session; }

PitchtrackError pitchtrack_session_push(PitchtrackSession* session, const float* samples,
                                        size_t length) {
  if (session == nullptr || (samples == nullptr && length > 0)) {
    return PITCHTRACK_ERROR_INVALID_PARAMETER;
  }
  session->session.on_chunk(samples, length);
  return PITCHTRACK_OK;
}

int pitchtrack_session_latest(const PitchtrackSession* session, PitchtrackEstimate* out) {
  if (session == nullptr || out == nullptr) {
    return 0;
  }
  auto estimate = session->session.latest();
  if (!estimate) {
    return 0;
  }
  out->frequency = estimate->frequency;
  copy_name(out->note_name, estimate->note_name());
  out->octave = estimate->octave;
  copy_name(out->full_name, estimate->full_name());
  out->cents = estimate->cents;
  out->confidence = estimate->confidence;
  out->timestamp_ms = estimate->timestamp_ms;
  return 1;
}

void pitchtrack_session_reset(PitchtrackSession* session) {
  if (session != nullptr) {
    session->session.reset();
  }
}

PitchtrackError pitchtrack_session_set_silence_db(PitchtrackSession* session, float db) {
  if (session == nullptr) return PITCHTRACK_ERROR_INVALID_PARAMETER;
  return guarded([&] { session->session.set_silence_db(db); });
}

PitchtrackError pitchtrack_session_set_confidence_enter(PitchtrackSession* session, float value) {
  if (session == nullptr) return PITCHTRACK_ERROR_INVALID_PARAMETER;
  return guarded([&] { session->session.set_confidence_enter(value); });
}

PitchtrackError pitchtrack_session_set_confidence_exit(PitchtrackSession* session, float value) {
  if (session == nullptr) return PITCHTRACK_ERROR_INVALID_PARAMETER;
  return guarded([&] { session->session.set_confidence_exit(value); });
}

PitchtrackError pitchtrack_session_set_a4_reference(PitchtrackSession* session, float hz) {
  if (session == nullptr) return PITCHTRACK_ERROR_INVALID_PARAMETER;
  return guarded([&] { session->session.set_a4_reference(hz); });
}

// Note conversion

int pitchtrack_frequency_to_note(float frequency, float a4, PitchtrackNote* out) {
  if (out == nullptr || !(a4 > 0.0f)) {
    return 0;
  }
  auto note = frequency_to_note(frequency, a4);
  if (!note) {
    return 0;
  }
  copy_name(out->note_name, note->note_name());
  out->octave = note->octave;
  copy_name(out->full_name, note->full_name());
  out->cents = note->cents;
  out->midi = note->midi;
  return 1;
}

// Offline roadmap

PitchtrackError pitchtrack_analyze_roadmap(const float* samples, size_t length, int sample_rate,
                                           double segment_sec, PitchtrackRoadmap* out) {
  if (out == nullptr || (samples == nullptr && length > 0)) {
    return PITCHTRACK_ERROR_INVALID_PARAMETER;
  }
  std::memset(out, 0, sizeof(*out));
  if (sample_rate < kMinSampleRate || sample_rate > kMaxSampleRate) {
    return PITCHTRACK_ERROR_INVALID_PARAMETER;
  }
  if (length > kMaxBufferSize || !(segment_sec > 0.0)) {
    return PITCHTRACK_ERROR_INVALID_PARAMETER;
  }

  return guarded([&] {
    RoadmapConfig config;
    config.segment_sec = segment_sec;
    RoadmapResult result = RoadmapAnalyzer(config).analyze(samples, length, sample_rate);

    if (!result.segments.empty()) {
      out->segments = new PitchtrackSegment[result.segments.size()];
      out->segment_count = result.segments.size();
      for (size_t i = 0; i < result.segments.size(); ++i) {
        const RoadmapSegment& src = result.segments[i];
        PitchtrackSegment& dst = out->segments[i];
        dst.start_sec = src.start_sec;
        dst.end_sec = src.end_sec;
        copy_name(dst.note_name, src.note_name);
        dst.octave = src.octave;
        copy_name(dst.full_name, src.full_name);
        dst.confidence = src.confidence;
        dst.has_note = src.has_note ? 1 : 0;
      }
    }
    copy_name(out->dominant_note, result.dominant_note);
    out->total_duration_sec = result.total_duration_sec;
  });
}

void pitchtrack_free_roadmap(PitchtrackRoadmap* roadmap) {
  if (roadmap != nullptr) {
    delete[] roadmap->segments;
    roadmap->segments = nullptr;
    roadmap->segment_count = 0;
  }
}

// Error handling

const char* pitchtrack_error_message(PitchtrackError error) {
  switch (error) {
    case PITCHTRACK_OK:
      return "OK";
    case PITCHTRACK_ERROR_FILE_NOT_FOUND:
      return "File not found";
    case PITCHTRACK_ERROR_INVALID_FORMAT:
      return "Invalid format";
    case PITCHTRACK_ERROR_DECODE_FAILED:
      return "Decode failed";
    case PITCHTRACK_ERROR_INVALID_PARAMETER:
      return "Invalid parameter";
    case PITCHTRACK_ERROR_OUT_OF_MEMORY:
      return "Out of memory";
    default:
      return "Unknown error";
  }
}

// Version

const char* pitchtrack_version(void) { return PITCHTRACK_VERSION_STRING; }
