#include "core/ring_accumulator.h"

#include <algorithm>

#include "util/exception.h"
#include "util/math_utils.h"

namespace pitchtrack {

RingAccumulator::RingAccumulator(size_t capacity)
    : capacity_(capacity), mask_(capacity - 1) {
  PITCHTRACK_CHECK_MSG(is_power_of_two(capacity), ErrorCode::InvalidParameter,
                       "Ring capacity must be a power of two");
  buffer_.assign(capacity_, 0.0f);
}

void RingAccumulator::push(const float* samples, size_t n_samples) {
  if (samples == nullptr || n_samples == 0) {
    return;
  }

  // Samples older than one full ring would be overwritten anyway
  if (n_samples > capacity_) {
    size_t skipped = n_samples - capacity_;
    write_pos_ = (write_pos_ + skipped) & mask_;
    samples += skipped;
    n_samples = capacity_;
  }

  size_t first = std::min(n_samples, capacity_ - write_pos_);
  std::copy(samples, samples + first, buffer_.begin() + static_cast<std::ptrdiff_t>(write_pos_));
  std::copy(samples + first, samples + n_samples, buffer_.begin());
  write_pos_ = (write_pos_ + n_samples) & mask_;

  samples_seen_ = std::min(samples_seen_ + n_samples, capacity_);
}

void RingAccumulator::snapshot_into(float* out) const {
  // Oldest retained sample sits at the write cursor
  auto split = buffer_.begin() + static_cast<std::ptrdiff_t>(write_pos_);
  float* tail = std::copy(split, buffer_.end(), out);
  std::copy(buffer_.begin(), split, tail);
}

void RingAccumulator::reset() {
  std::fill(buffer_.begin(), buffer_.end(), 0.0f);
  write_pos_ = 0;
  samples_seen_ = 0;
}

}  // namespace pitchtrack
