/// @file ring_accumulator_test.cpp
/// @brief Tests for RingAccumulator.

#include "core/ring_accumulator.h"

#include <catch2/catch_test_macros.hpp>
#include <numeric>
#include <vector>

#include "util/exception.h"

using namespace pitchtrack;

namespace {

std::vector<float> ramp(size_t n, float start) {
  std::vector<float> v(n);
  std::iota(v.begin(), v.end(), start);
  return v;
}

}  // namespace

TEST_CASE("RingAccumulator construction", "[ring]") {
  REQUIRE_NOTHROW(RingAccumulator(2048));
  REQUIRE_NOTHROW(RingAccumulator(8));
  REQUIRE_THROWS_AS(RingAccumulator(2000), PitchtrackException);
  REQUIRE_THROWS_AS(RingAccumulator(0), PitchtrackException);

  RingAccumulator ring(16);
  REQUIRE(ring.capacity() == 16);
  REQUIRE_FALSE(ring.is_full());
  REQUIRE(ring.samples_seen() == 0);
}

TEST_CASE("RingAccumulator fills after capacity samples", "[ring]") {
  RingAccumulator ring(2048);
  auto chunk = ramp(1024, 0.0f);

  ring.push(chunk.data(), chunk.size());
  REQUIRE_FALSE(ring.is_full());
  REQUIRE(ring.samples_seen() == 1024);

  ring.push(chunk.data(), chunk.size());
  REQUIRE(ring.is_full());
  REQUIRE(ring.samples_seen() == 2048);

  SECTION("samples_seen saturates") {
    ring.push(chunk.data(), chunk.size());
    REQUIRE(ring.samples_seen() == 2048);
    REQUIRE(ring.is_full());
  }
}

TEST_CASE("RingAccumulator snapshot order", "[ring]") {
  RingAccumulator ring(8);
  std::vector<float> out(8);

  SECTION("exactly one ring") {
    auto data = ramp(8, 0.0f);
    ring.push(data.data(), data.size());
    ring.snapshot_into(out.data());
    REQUIRE(out == data);
  }

  SECTION("wrapped chunks yield oldest first") {
    auto a = ramp(5, 0.0f);   // 0..4
    auto b = ramp(6, 5.0f);   // 5..10
    ring.push(a.data(), a.size());
    ring.push(b.data(), b.size());
    ring.snapshot_into(out.data());
    REQUIRE(out == ramp(8, 3.0f));  // 3..10
  }

  SECTION("chunk longer than capacity keeps the trailing samples") {
    auto data = ramp(20, 0.0f);
    ring.push(data.data(), data.size());
    REQUIRE(ring.is_full());
    ring.snapshot_into(out.data());
    REQUIRE(out == ramp(8, 12.0f));
  }

  SECTION("repeated snapshots are identical") {
    auto data = ramp(11, 0.0f);
    ring.push(data.data(), data.size());
    std::vector<float> again(8);
    ring.snapshot_into(out.data());
    ring.snapshot_into(again.data());
    REQUIRE(out == again);
  }
}

TEST_CASE("RingAccumulator ignores empty pushes", "[ring]") {
  RingAccumulator ring(8);
  ring.push(nullptr, 0);
  std::vector<float> none;
  ring.push(none.data(), 0);
  REQUIRE(ring.samples_seen() == 0);
  REQUIRE(ring.write_position() == 0);
}

TEST_CASE("RingAccumulator reset", "[ring]") {
  RingAccumulator ring(8);
  auto data = ramp(13, 1.0f);
  ring.push(data.data(), data.size());
  REQUIRE(ring.is_full());

  ring.reset();
  REQUIRE_FALSE(ring.is_full());
  REQUIRE(ring.samples_seen() == 0);
  REQUIRE(ring.write_position() == 0);

  std::vector<float> out(8, -1.0f);
  ring.snapshot_into(out.data());
  REQUIRE(out == std::vector<float>(8, 0.0f));
}
