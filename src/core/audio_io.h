#pragma once

/// @file audio_io.h
/// @brief Audio file loading utilities using dr_wav and minimp3.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cadenza {

/// @brief Detected audio format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief Decoded mono audio.
struct DecodedAudio {
  std::vector<float> samples;  ///< Mono samples normalized to [-1, 1]
  int sample_rate = 0;         ///< Sample rate in Hz

  /// @brief Returns duration in seconds.
  float duration() const {
    return sample_rate > 0 ? static_cast<float>(samples.size()) / static_cast<float>(sample_rate)
                           : 0.0f;
  }
};

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit).
  /// @details Default is 500MB. Set to 0 to disable size checking.
  size_t max_file_size = 500 * 1024 * 1024;
};

/// @brief Detects audio format from buffer header.
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @return Detected audio format
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Decodes WAV from memory buffer.
/// @throws CadenzaException(DecodeFailed) on decode error
DecodedAudio load_buffer_wav(const uint8_t* data, size_t size);

/// @brief Decodes MP3 from memory buffer.
/// @throws CadenzaException(DecodeFailed) on decode error
DecodedAudio load_buffer_mp3(const uint8_t* data, size_t size);

/// @brief Decodes audio from memory buffer (auto-detect format).
/// @throws CadenzaException on unknown format or decode error
DecodedAudio load_buffer(const uint8_t* data, size_t size);

/// @brief Loads audio file (auto-detect format).
/// @param path Path to audio file
/// @param options Loading options (max file size, etc.)
/// @return Decoded mono audio
/// @throws CadenzaException on file not found, unknown format, file too large, or decode error
DecodedAudio load_audio(const std::string& path, const AudioLoadOptions& options = AudioLoadOptions());

/// @brief Saves mono samples to a 16-bit PCM WAV file.
/// @param path Output file path
/// @param samples Audio samples (mono, normalized to [-1,1])
/// @param sample_rate Sample rate in Hz
/// @throws CadenzaException on write error
void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate);

}  // namespace cadenza
