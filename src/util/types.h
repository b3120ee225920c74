#pragma once

/// @file types.h
/// @brief Common type definitions for libcadenza.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace cadenza {

/// @brief Number of pitch classes in a chroma vector.
constexpr int kNumChroma = 12;

/// @brief Chroma vector indexed by pitch class (0 = C .. 11 = B), values in [0, 1].
using ChromaVector = std::array<float, kNumChroma>;

/// @brief Lightweight read-only view over one magnitude spectrum.
/// @details Bins are linearly spaced from 0 Hz to Nyquist. The view does not own
/// its data; the producer keeps it alive for the duration of one pipeline call.
class MagnitudeFrame {
 public:
  MagnitudeFrame() : data_(nullptr), size_(0) {}

  /// @brief Constructs a view over existing data.
  /// @param data Pointer to non-negative magnitudes
  /// @param size Number of bins
  MagnitudeFrame(const float* data, size_t size) : data_(data), size_(size) {}

  const float* data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return data_ == nullptr || size_ == 0; }

  const float& operator[](size_t bin) const { return data_[bin]; }

  const float* begin() const { return data_; }
  const float* end() const { return data_ + size_; }

 private:
  const float* data_;
  size_t size_;
};

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,
  InvalidFormat,
  DecodeFailed,
  InvalidParameter,
  OutOfMemory,
};

/// @brief Pitch class (0-11, C=0).
enum class PitchClass : int {
  C = 0,
  Cs = 1,
  D = 2,
  Ds = 3,
  E = 4,
  F = 5,
  Fs = 6,
  G = 7,
  Gs = 8,
  A = 9,
  As = 10,
  B = 11,
};

/// @brief Window function types.
enum class WindowType {
  Hann,
  Hamming,
  Blackman,
  Rectangular,
};

/// @brief Coarse activity state reported alongside each chroma frame.
enum class ActivityLevel {
  Stopped,       ///< Pipeline reset, nothing processed yet
  Listening,     ///< Input present but below the music threshold
  HearingMusic,  ///< Amplified loudness above the music threshold
};

/// @brief Returns the name of a pitch class.
/// @param pc Pitch class
/// @return String name (e.g., "C", "C#")
inline const char* pitch_class_name(PitchClass pc) {
  static const char* names[] = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};
  return names[static_cast<int>(pc)];
}

/// @brief Returns a short description of an activity level.
inline const char* activity_name(ActivityLevel level) {
  switch (level) {
    case ActivityLevel::Stopped:
      return "stopped";
    case ActivityLevel::Listening:
      return "listening";
    case ActivityLevel::HearingMusic:
      return "hearing music";
  }
  return "unknown";
}

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::DecodeFailed:
      return "Decode failed";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::OutOfMemory:
      return "Out of memory";
  }
  return "Unknown error";
}

}  // namespace cadenza
