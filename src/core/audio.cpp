#include "core/audio.h"

#include <algorithm>

#include "core/audio_io.h"
#include "util/exception.h"

namespace pitchtrack {

Audio::Audio() : buffer_(nullptr), offset_(0), length_(0), sample_rate_(0) {}

Audio::Audio(std::shared_ptr<const std::vector<float>> buffer, size_t offset, size_t length,
             int sample_rate)
    : buffer_(std::move(buffer)), offset_(offset), length_(length), sample_rate_(sample_rate) {}

Audio Audio::from_buffer(const float* samples, size_t size, int sample_rate) {
  PITCHTRACK_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  PITCHTRACK_CHECK(samples != nullptr || size == 0, ErrorCode::InvalidParameter);
  if (size == 0) {
    return Audio(std::make_shared<std::vector<float>>(), 0, 0, sample_rate);
  }
  auto buffer = std::make_shared<std::vector<float>>(samples, samples + size);
  return Audio(buffer, 0, size, sample_rate);
}

Audio Audio::from_vector(std::vector<float> samples, int sample_rate) {
  PITCHTRACK_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  size_t size = samples.size();
  auto buffer = std::make_shared<std::vector<float>>(std::move(samples));
  return Audio(buffer, 0, size, sample_rate);
}

Audio Audio::from_file(const std::string& path) {
  auto [samples, sample_rate] = load_audio(path);
  return from_vector(std::move(samples), sample_rate);
}

Audio Audio::from_memory(const uint8_t* data, size_t size) {
  auto [samples, sample_rate] = load_buffer(data, size);
  return from_vector(std::move(samples), sample_rate);
}

const float* Audio::data() const {
  if (!buffer_) {
    return nullptr;
  }
  return buffer_->data() + offset_;
}

double Audio::duration() const {
  if (sample_rate_ == 0) {
    return 0.0;
  }
  return static_cast<double>(length_) / static_cast<double>(sample_rate_);
}

Audio Audio::slice(double start_sec, double end_sec) const {
  if (!buffer_ || sample_rate_ == 0) {
    return Audio();
  }

  size_t start = static_cast<size_t>(std::max(0.0, start_sec) * sample_rate_);
  size_t end = end_sec < 0.0 ? length_ : static_cast<size_t>(end_sec * sample_rate_);
  return slice_samples(start, end);
}

Audio Audio::slice_samples(size_t start, size_t end) const {
  if (!buffer_) {
    return Audio();
  }

  start = std::min(start, length_);
  end = std::min(end, length_);
  if (start >= end) {
    return Audio(buffer_, offset_ + start, 0, sample_rate_);
  }
  return Audio(buffer_, offset_ + start, end - start, sample_rate_);
}

float Audio::operator[](size_t index) const {
  PITCHTRACK_CHECK(index < length_, ErrorCode::InvalidParameter);
  return (*buffer_)[offset_ + index];
}

}  // namespace pitchtrack
