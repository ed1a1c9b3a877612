#pragma once

/// @file pitchtrack_c.h
/// @brief C API for libpitchtrack.
/// @details Provides a C-compatible interface for host bridges (mobile
/// runtimes, FFI) around the live session, note conversion and roadmap analysis.

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Error codes
typedef enum {
  PITCHTRACK_OK = 0,
  PITCHTRACK_ERROR_FILE_NOT_FOUND = 1,
  PITCHTRACK_ERROR_INVALID_FORMAT = 2,
  PITCHTRACK_ERROR_DECODE_FAILED = 3,
  PITCHTRACK_ERROR_INVALID_PARAMETER = 4,
  PITCHTRACK_ERROR_OUT_OF_MEMORY = 5,
  PITCHTRACK_ERROR_UNKNOWN = 99
} PitchtrackError;

// Opaque types
typedef struct PitchtrackSession PitchtrackSession;

// Note conversion result
typedef struct {
  char note_name[4];   // e.g. "C#"
  int octave;
  char full_name[8];   // e.g. "C#4"
  int cents;
  int midi;
} PitchtrackNote;

// Latest live estimate
typedef struct {
  float frequency;
  char note_name[4];
  int octave;
  char full_name[8];
  int cents;
  float confidence;
  double timestamp_ms;
} PitchtrackEstimate;

// One roadmap segment
typedef struct {
  double start_sec;
  double end_sec;
  char note_name[4];   // empty when has_note is 0
  int octave;
  char full_name[8];   // empty when has_note is 0
  float confidence;
  int has_note;
} PitchtrackSegment;

// Roadmap analysis result
typedef struct {
  PitchtrackSegment* segments;
  size_t segment_count;
  char dominant_note[8];
  double total_duration_sec;
} PitchtrackRoadmap;

// Live session
PitchtrackError pitchtrack_session_create(int sample_rate, PitchtrackSession** out);
void pitchtrack_session_free(PitchtrackSession* session);
PitchtrackError pitchtrack_session_push(PitchtrackSession* session, const float* samples,
                                        size_t length);
// Returns 1 and fills out when a fresh estimate exists, 0 otherwise.
int pitchtrack_session_latest(const PitchtrackSession* session, PitchtrackEstimate* out);
void pitchtrack_session_reset(PitchtrackSession* session);
PitchtrackError pitchtrack_session_set_silence_db(PitchtrackSession* session, float db);
PitchtrackError pitchtrack_session_set_confidence_enter(PitchtrackSession* session, float value);
PitchtrackError pitchtrack_session_set_confidence_exit(PitchtrackSession* session, float value);
PitchtrackError pitchtrack_session_set_a4_reference(PitchtrackSession* session, float hz);

// Note conversion. Returns 1 and fills out for frequencies in (20, 5000] Hz, 0 otherwise.
int pitchtrack_frequency_to_note(float frequency, float a4, PitchtrackNote* out);

// Offline roadmap
PitchtrackError pitchtrack_analyze_roadmap(const float* samples, size_t length, int sample_rate,
                                           double segment_sec, PitchtrackRoadmap* out);
void pitchtrack_free_roadmap(PitchtrackRoadmap* roadmap);

// Error handling
const char* pitchtrack_error_message(PitchtrackError error);

// Version
const char* pitchtrack_version(void);

#ifdef __cplusplus
}
#endif
