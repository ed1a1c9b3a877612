/// @file pitchtrack_c_test.cpp
/// @brief Tests for C API functions.

#include "pitchtrack_c.h"

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstring>
#include <vector>

namespace {

// Generate sine wave
std::vector<float> generate_sine(float freq, int sample_rate, float duration) {
  size_t n_samples = static_cast<size_t>(sample_rate * duration);
  std::vector<float> samples(n_samples);
  for (size_t i = 0; i < n_samples; ++i) {
    samples[i] = 0.5f * std::sin(2.0f * static_cast<float>(M_PI) * freq * i / sample_rate);
  }
  return samples;
}

}  // namespace

TEST_CASE("pitchtrack_session_create", "[c_api]") {
  SECTION("creates a session") {
    PitchtrackSession* session = nullptr;
    REQUIRE(pitchtrack_session_create(48000, &session) == PITCHTRACK_OK);
    REQUIRE(session != nullptr);
    pitchtrack_session_free(session);
  }

  SECTION("rejects invalid sample rates") {
    PitchtrackSession* session = nullptr;
    REQUIRE(pitchtrack_session_create(0, &session) == PITCHTRACK_ERROR_INVALID_PARAMETER);
    REQUIRE(session == nullptr);
    REQUIRE(pitchtrack_session_create(1000000, &session) == PITCHTRACK_ERROR_INVALID_PARAMETER);
    REQUIRE(session == nullptr);
  }

  SECTION("rejects null output") {
    REQUIRE(pitchtrack_session_create(48000, nullptr) == PITCHTRACK_ERROR_INVALID_PARAMETER);
  }

  SECTION("free accepts null") { pitchtrack_session_free(nullptr); }
}

TEST_CASE("pitchtrack_session push and latest", "[c_api]") {
  PitchtrackSession* session = nullptr;
  REQUIRE(pitchtrack_session_create(48000, &session) == PITCHTRACK_OK);

  PitchtrackEstimate estimate;
  REQUIRE(pitchtrack_session_latest(session, &estimate) == 0);

  auto samples = generate_sine(440.0f, 48000, 0.1f);
  for (size_t pos = 0; pos + 1024 <= samples.size(); pos += 1024) {
    REQUIRE(pitchtrack_session_push(session, samples.data() + pos, 1024) == PITCHTRACK_OK);
  }

  REQUIRE(pitchtrack_session_latest(session, &estimate) == 1);
  REQUIRE(std::strcmp(estimate.note_name, "A") == 0);
  REQUIRE(std::strcmp(estimate.full_name, "A4") == 0);
  REQUIRE(estimate.octave == 4);
  REQUIRE(std::abs(estimate.frequency - 440.0f) < 1.0f);
  REQUIRE(estimate.confidence >= 0.85f);
  REQUIRE(estimate.timestamp_ms > 0.0);

  SECTION("reset discards the estimate") {
    pitchtrack_session_reset(session);
    REQUIRE(pitchtrack_session_latest(session, &estimate) == 0);
  }

  SECTION("silence clears the estimate") {
    std::vector<float> zeros(2048, 0.0f);
    REQUIRE(pitchtrack_session_push(session, zeros.data(), zeros.size()) == PITCHTRACK_OK);
    REQUIRE(pitchtrack_session_latest(session, &estimate) == 0);
  }

  SECTION("invalid arguments") {
    REQUIRE(pitchtrack_session_push(nullptr, samples.data(), 1024) ==
            PITCHTRACK_ERROR_INVALID_PARAMETER);
    REQUIRE(pitchtrack_session_push(session, nullptr, 1024) == PITCHTRACK_ERROR_INVALID_PARAMETER);
    REQUIRE(pitchtrack_session_push(session, nullptr, 0) == PITCHTRACK_OK);
    REQUIRE(pitchtrack_session_latest(session, nullptr) == 0);
    REQUIRE(pitchtrack_session_latest(nullptr, &estimate) == 0);
  }

  pitchtrack_session_free(session);
}

TEST_CASE("pitchtrack_session setters", "[c_api]") {
  PitchtrackSession* session = nullptr;
  REQUIRE(pitchtrack_session_create(44100, &session) == PITCHTRACK_OK);

  REQUIRE(pitchtrack_session_set_silence_db(session, -50.0f) == PITCHTRACK_OK);
  REQUIRE(pitchtrack_session_set_confidence_enter(session, 0.9f) == PITCHTRACK_OK);
  REQUIRE(pitchtrack_session_set_confidence_exit(session, 0.7f) == PITCHTRACK_OK);
  REQUIRE(pitchtrack_session_set_a4_reference(session, 442.0f) == PITCHTRACK_OK);

  REQUIRE(pitchtrack_session_set_confidence_enter(session, 1.5f) ==
          PITCHTRACK_ERROR_INVALID_PARAMETER);
  REQUIRE(pitchtrack_session_set_confidence_exit(session, -1.0f) ==
          PITCHTRACK_ERROR_INVALID_PARAMETER);
  REQUIRE(pitchtrack_session_set_a4_reference(session, 0.0f) ==
          PITCHTRACK_ERROR_INVALID_PARAMETER);
  REQUIRE(pitchtrack_session_set_silence_db(session, std::nanf("")) ==
          PITCHTRACK_ERROR_INVALID_PARAMETER);
  REQUIRE(pitchtrack_session_set_silence_db(nullptr, -40.0f) ==
          PITCHTRACK_ERROR_INVALID_PARAMETER);

  pitchtrack_session_free(session);
}

TEST_CASE("pitchtrack_frequency_to_note", "[c_api]") {
  PitchtrackNote note;

  REQUIRE(pitchtrack_frequency_to_note(445.0f, 440.0f, &note) == 1);
  REQUIRE(std::strcmp(note.note_name, "A") == 0);
  REQUIRE(std::strcmp(note.full_name, "A4") == 0);
  REQUIRE(note.octave == 4);
  REQUIRE(note.midi == 69);
  REQUIRE(note.cents >= 19);
  REQUIRE(note.cents <= 21);

  REQUIRE(pitchtrack_frequency_to_note(277.183f, 440.0f, &note) == 1);
  REQUIRE(std::strcmp(note.full_name, "C#4") == 0);

  REQUIRE(pitchtrack_frequency_to_note(10.0f, 440.0f, &note) == 0);
  REQUIRE(pitchtrack_frequency_to_note(6000.0f, 440.0f, &note) == 0);
  REQUIRE(pitchtrack_frequency_to_note(440.0f, 0.0f, &note) == 0);
  REQUIRE(pitchtrack_frequency_to_note(440.0f, 440.0f, nullptr) == 0);
}

TEST_CASE("pitchtrack_analyze_roadmap", "[c_api]") {
  SECTION("tone roadmap") {
    auto samples = generate_sine(440.0f, 48000, 3.0f);
    PitchtrackRoadmap roadmap;

    REQUIRE(pitchtrack_analyze_roadmap(samples.data(), samples.size(), 48000, 2.0, &roadmap) ==
            PITCHTRACK_OK);
    REQUIRE(roadmap.segment_count == 2);
    REQUIRE(roadmap.segments != nullptr);
    REQUIRE(roadmap.segments[0].has_note == 1);
    REQUIRE(std::strcmp(roadmap.segments[0].full_name, "A4") == 0);
    REQUIRE(roadmap.segments[0].end_sec > 1.99);
    REQUIRE(std::strcmp(roadmap.dominant_note, "A4") == 0);
    REQUIRE(roadmap.total_duration_sec > 2.99);

    pitchtrack_free_roadmap(&roadmap);
    REQUIRE(roadmap.segments == nullptr);
    REQUIRE(roadmap.segment_count == 0);
  }

  SECTION("empty input") {
    PitchtrackRoadmap roadmap;
    REQUIRE(pitchtrack_analyze_roadmap(nullptr, 0, 48000, 2.0, &roadmap) == PITCHTRACK_OK);
    REQUIRE(roadmap.segment_count == 0);
    REQUIRE(roadmap.segments == nullptr);
    REQUIRE(roadmap.dominant_note[0] == '\0');
    pitchtrack_free_roadmap(&roadmap);
  }

  SECTION("invalid parameters") {
    std::vector<float> samples(4096, 0.0f);
    PitchtrackRoadmap roadmap;
    REQUIRE(pitchtrack_analyze_roadmap(samples.data(), samples.size(), 100, 2.0, &roadmap) ==
            PITCHTRACK_ERROR_INVALID_PARAMETER);
    REQUIRE(pitchtrack_analyze_roadmap(samples.data(), samples.size(), 48000, 0.0, &roadmap) ==
            PITCHTRACK_ERROR_INVALID_PARAMETER);
    REQUIRE(pitchtrack_analyze_roadmap(samples.data(), samples.size(), 48000, 2.0, nullptr) ==
            PITCHTRACK_ERROR_INVALID_PARAMETER);
  }

  SECTION("free accepts null") { pitchtrack_free_roadmap(nullptr); }
}

TEST_CASE("pitchtrack_error_message", "[c_api]") {
  REQUIRE(std::strcmp(pitchtrack_error_message(PITCHTRACK_OK), "OK") == 0);
  REQUIRE(std::strcmp(pitchtrack_error_message(PITCHTRACK_ERROR_INVALID_PARAMETER),
                      "Invalid parameter") == 0);
  REQUIRE(std::strcmp(pitchtrack_error_message(PITCHTRACK_ERROR_UNKNOWN), "Unknown error") == 0);
}

TEST_CASE("pitchtrack_version", "[c_api]") {
  REQUIRE(std::strcmp(pitchtrack_version(), "1.0.0") == 0);
}
