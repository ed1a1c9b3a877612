#include "core/audio_io.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "util/exception.h"

#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

#define MINIMP3_IMPLEMENTATION
#include "minimp3.h"
#include "minimp3_ex.h"

namespace pitchtrack {

namespace {

/// @brief Frees the minimp3 decode buffer on scope exit.
struct Mp3BufferGuard {
  mp3d_sample_t* ptr = nullptr;
  ~Mp3BufferGuard() {
    if (ptr) {
      free(ptr);
    }
  }
};

std::vector<uint8_t> read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  PITCHTRACK_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  auto size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  file.read(reinterpret_cast<char*>(buffer.data()), size);
  PITCHTRACK_CHECK_MSG(file.good(), ErrorCode::DecodeFailed, "Failed to read file: " + path);

  return buffer;
}

}  // namespace

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (data == nullptr || size < 12) {
    return AudioFormat::Unknown;
  }

  if (data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F' && data[8] == 'W' &&
      data[9] == 'A' && data[10] == 'V' && data[11] == 'E') {
    return AudioFormat::WAV;
  }

  // Frame sync or ID3v2 tag
  if ((data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) ||
      (data[0] == 'I' && data[1] == 'D' && data[2] == '3')) {
    return AudioFormat::MP3;
  }

  return AudioFormat::Unknown;
}

std::vector<float> downmix_to_mono(const float* interleaved, size_t frame_count, int channels) {
  PITCHTRACK_CHECK(channels >= 1, ErrorCode::InvalidParameter);
  std::vector<float> mono(frame_count);

  if (channels == 1) {
    std::copy(interleaved, interleaved + frame_count, mono.begin());
    return mono;
  }

  const float scale = 1.0f / static_cast<float>(channels);
  for (size_t i = 0; i < frame_count; ++i) {
    const float* frame = interleaved + i * static_cast<size_t>(channels);
    float sum = 0.0f;
    for (int ch = 0; ch < channels; ++ch) {
      sum += frame[ch];
    }
    mono[i] = sum * scale;
  }
  return mono;
}

AudioLoadResult load_buffer_wav(const uint8_t* data, size_t size) {
  drwav wav;
  drwav_bool32 ok = drwav_init_memory(&wav, data, size, nullptr);
  PITCHTRACK_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to parse WAV data");

  int channels = static_cast<int>(wav.channels);
  int sample_rate = static_cast<int>(wav.sampleRate);
  std::vector<float> interleaved(static_cast<size_t>(wav.totalPCMFrameCount) * channels);

  drwav_uint64 frames_read =
      drwav_read_pcm_frames_f32(&wav, wav.totalPCMFrameCount, interleaved.data());
  drwav_uninit(&wav);

  PITCHTRACK_CHECK_MSG(frames_read > 0, ErrorCode::DecodeFailed, "No audio frames in WAV data");
  PITCHTRACK_CHECK_MSG(sample_rate > 0, ErrorCode::DecodeFailed, "WAV reports no sample rate");

  return {downmix_to_mono(interleaved.data(), static_cast<size_t>(frames_read), channels),
          sample_rate};
}

AudioLoadResult load_buffer_mp3(const uint8_t* data, size_t size) {
  mp3dec_t mp3d;
  mp3dec_file_info_t info;

  mp3dec_init(&mp3d);
  int result = mp3dec_load_buf(&mp3d, data, size, &info, nullptr, nullptr);
  PITCHTRACK_CHECK_MSG(result == 0, ErrorCode::DecodeFailed, "Failed to decode MP3 data");

  Mp3BufferGuard guard;
  guard.ptr = info.buffer;

  PITCHTRACK_CHECK_MSG(info.samples > 0 && info.channels > 0, ErrorCode::DecodeFailed,
                       "No audio samples in MP3 data");

  size_t total = static_cast<size_t>(info.samples);
  std::vector<float> interleaved(total);
  for (size_t i = 0; i < total; ++i) {
    interleaved[i] = static_cast<float>(info.buffer[i]) / 32768.0f;
  }

  size_t frame_count = total / static_cast<size_t>(info.channels);
  return {downmix_to_mono(interleaved.data(), frame_count, info.channels), info.hz};
}

AudioLoadResult load_buffer(const uint8_t* data, size_t size) {
  switch (detect_format(data, size)) {
    case AudioFormat::WAV:
      return load_buffer_wav(data, size);
    case AudioFormat::MP3:
      return load_buffer_mp3(data, size);
    default:
      throw PitchtrackException(ErrorCode::InvalidFormat, "Unknown or unsupported audio format");
  }
}

AudioLoadResult load_wav(const std::string& path) {
  std::vector<uint8_t> data = read_file(path);
  return load_buffer_wav(data.data(), data.size());
}

AudioLoadResult load_mp3(const std::string& path) {
  std::vector<uint8_t> data = read_file(path);
  return load_buffer_mp3(data.data(), data.size());
}

AudioLoadResult load_audio(const std::string& path, const AudioLoadOptions& options) {
  if (options.max_file_size > 0) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    PITCHTRACK_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);
    auto size = static_cast<size_t>(file.tellg());
    PITCHTRACK_CHECK_MSG(size <= options.max_file_size, ErrorCode::InvalidParameter,
                         "File too large: " + std::to_string(size) + " bytes (max: " +
                             std::to_string(options.max_file_size) + " bytes)");
  }

  std::vector<uint8_t> data = read_file(path);
  return load_buffer(data.data(), data.size());
}

void save_wav(const std::string& path, const float* samples, size_t n_samples, int sample_rate,
              int bits_per_sample) {
  PITCHTRACK_CHECK_MSG(samples != nullptr, ErrorCode::InvalidParameter, "Samples pointer is null");
  PITCHTRACK_CHECK_MSG(n_samples > 0, ErrorCode::InvalidParameter, "No samples to save");
  PITCHTRACK_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");
  PITCHTRACK_CHECK_MSG(bits_per_sample == 16 || bits_per_sample == 24,
                       ErrorCode::InvalidParameter, "bits_per_sample must be 16 or 24");

  drwav_data_format format;
  format.container = drwav_container_riff;
  format.format = DR_WAVE_FORMAT_PCM;
  format.channels = 1;
  format.sampleRate = static_cast<drwav_uint32>(sample_rate);
  format.bitsPerSample = static_cast<drwav_uint32>(bits_per_sample);

  drwav wav;
  drwav_bool32 ok = drwav_init_file_write(&wav, path.c_str(), &format, nullptr);
  PITCHTRACK_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to create WAV file: " + path);

  drwav_uint64 written = 0;
  if (bits_per_sample == 16) {
    std::vector<int16_t> pcm(n_samples);
    for (size_t i = 0; i < n_samples; ++i) {
      pcm[i] = static_cast<int16_t>(std::max(-1.0f, std::min(1.0f, samples[i])) * 32767.0f);
    }
    written = drwav_write_pcm_frames(&wav, n_samples, pcm.data());
  } else {
    // 24-bit frames are packed 3 bytes per sample, little endian
    std::vector<uint8_t> pcm(n_samples * 3);
    for (size_t i = 0; i < n_samples; ++i) {
      auto v = static_cast<int32_t>(std::max(-1.0f, std::min(1.0f, samples[i])) * 8388607.0f);
      pcm[i * 3] = static_cast<uint8_t>(v & 0xFF);
      pcm[i * 3 + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
      pcm[i * 3 + 2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    }
    written = drwav_write_pcm_frames(&wav, n_samples, pcm.data());
  }
  drwav_uninit(&wav);
  PITCHTRACK_CHECK_MSG(written == n_samples, ErrorCode::DecodeFailed,
                       "Failed to write all samples");
}

void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate,
              int bits_per_sample) {
  save_wav(path, samples.data(), samples.size(), sample_rate, bits_per_sample);
}

}  // namespace pitchtrack
