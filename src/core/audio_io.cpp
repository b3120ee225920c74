/// @file audio_io.cpp
/// @brief Implementation of audio decoding and WAV output.

#include "core/audio_io.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "util/exception.h"

// dr_wav implementation
#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

// minimp3 implementation
#define MINIMP3_IMPLEMENTATION
#include "minimp3.h"
#include "minimp3_ex.h"

namespace cadenza {

namespace {

/// @brief RAII guard for MP3 decode buffer.
struct Mp3BufferGuard {
  mp3d_sample_t* ptr = nullptr;
  ~Mp3BufferGuard() {
    if (ptr) {
      free(ptr);
    }
  }
};

/// @brief Averages interleaved channels down to mono.
/// @tparam T Sample type
/// @param data Interleaved samples
/// @param frame_count Number of frames
/// @param channels Number of channels
/// @param scale Factor applied to each sample (int16 -> float)
template <typename T>
std::vector<float> downmix(const T* data, size_t frame_count, int channels, float scale) {
  std::vector<float> mono(frame_count);
  for (size_t i = 0; i < frame_count; ++i) {
    float sum = 0.0f;
    for (int ch = 0; ch < channels; ++ch) {
      sum += static_cast<float>(data[i * channels + ch]) * scale;
    }
    mono[i] = sum / static_cast<float>(channels);
  }
  return mono;
}

/// @brief Reads entire file into memory.
std::vector<uint8_t> read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  CADENZA_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  auto size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  file.read(reinterpret_cast<char*>(buffer.data()), size);
  CADENZA_CHECK_MSG(file.good(), ErrorCode::DecodeFailed, "Failed to read file: " + path);

  return buffer;
}

}  // namespace

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (data == nullptr || size < 12) {
    return AudioFormat::Unknown;
  }

  // WAV: "RIFF....WAVE"
  if (data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F' && data[8] == 'W' &&
      data[9] == 'A' && data[10] == 'V' && data[11] == 'E') {
    return AudioFormat::WAV;
  }

  // MP3: frame sync or ID3 tag
  if ((data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) ||
      (data[0] == 'I' && data[1] == 'D' && data[2] == '3')) {
    return AudioFormat::MP3;
  }

  return AudioFormat::Unknown;
}

DecodedAudio load_buffer_wav(const uint8_t* data, size_t size) {
  drwav wav;
  drwav_bool32 ok = drwav_init_memory(&wav, data, size, nullptr);
  CADENZA_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to parse WAV data");

  int channels = static_cast<int>(wav.channels);
  std::vector<float> interleaved(static_cast<size_t>(wav.totalPCMFrameCount) * channels);
  drwav_uint64 frames_read =
      drwav_read_pcm_frames_f32(&wav, wav.totalPCMFrameCount, interleaved.data());

  DecodedAudio audio;
  audio.sample_rate = static_cast<int>(wav.sampleRate);
  drwav_uninit(&wav);

  CADENZA_CHECK_MSG(frames_read > 0, ErrorCode::DecodeFailed, "No audio frames in WAV data");

  audio.samples = downmix(interleaved.data(), static_cast<size_t>(frames_read), channels, 1.0f);
  return audio;
}

DecodedAudio load_buffer_mp3(const uint8_t* data, size_t size) {
  mp3dec_t mp3d;
  mp3dec_file_info_t info;

  mp3dec_init(&mp3d);
  int result = mp3dec_load_buf(&mp3d, data, size, &info, nullptr, nullptr);
  CADENZA_CHECK_MSG(result == 0, ErrorCode::DecodeFailed, "Failed to decode MP3 data");

  Mp3BufferGuard buffer_guard;
  buffer_guard.ptr = info.buffer;

  CADENZA_CHECK_MSG(info.samples > 0 && info.channels > 0, ErrorCode::DecodeFailed,
                    "No audio samples in MP3 data");

  DecodedAudio audio;
  audio.sample_rate = info.hz;
  size_t frame_count = static_cast<size_t>(info.samples) / static_cast<size_t>(info.channels);
  audio.samples = downmix(info.buffer, frame_count, info.channels, 1.0f / 32768.0f);
  return audio;
}

DecodedAudio load_buffer(const uint8_t* data, size_t size) {
  switch (detect_format(data, size)) {
    case AudioFormat::WAV:
      return load_buffer_wav(data, size);
    case AudioFormat::MP3:
      return load_buffer_mp3(data, size);
    default:
      throw CadenzaException(ErrorCode::InvalidFormat, "Unknown or unsupported audio format");
  }
}

DecodedAudio load_audio(const std::string& path, const AudioLoadOptions& options) {
  std::vector<uint8_t> data = read_file(path);
  if (options.max_file_size > 0) {
    CADENZA_CHECK_MSG(data.size() <= options.max_file_size, ErrorCode::InvalidParameter,
                      "File too large: " + std::to_string(data.size()) + " bytes (max: " +
                          std::to_string(options.max_file_size) + " bytes)");
  }
  return load_buffer(data.data(), data.size());
}

void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate) {
  CADENZA_CHECK_MSG(!samples.empty(), ErrorCode::InvalidParameter, "No samples to save");
  CADENZA_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");

  drwav_data_format format;
  format.container = drwav_container_riff;
  format.format = DR_WAVE_FORMAT_PCM;
  format.channels = 1;
  format.sampleRate = static_cast<drwav_uint32>(sample_rate);
  format.bitsPerSample = 16;

  drwav wav;
  drwav_bool32 ok = drwav_init_file_write(&wav, path.c_str(), &format, nullptr);
  CADENZA_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to create WAV file: " + path);

  std::vector<int16_t> pcm(samples.size());
  for (size_t i = 0; i < samples.size(); ++i) {
    float clamped = std::max(-1.0f, std::min(1.0f, samples[i]));
    pcm[i] = static_cast<int16_t>(clamped * 32767.0f);
  }
  drwav_uint64 written = drwav_write_pcm_frames(&wav, pcm.size(), pcm.data());
  drwav_uninit(&wav);
  CADENZA_CHECK_MSG(written == pcm.size(), ErrorCode::DecodeFailed, "Failed to write all samples");
}

}  // namespace cadenza
