/// @file window.cpp
/// @brief Implementation of window functions.

#include "core/window.h"

#include <cmath>
#include <numeric>

#include "util/exception.h"

namespace cadenza {

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

/// @brief Denominator for symmetric windows; guards length 1.
float span(int length) { return length > 1 ? static_cast<float>(length - 1) : 1.0f; }
}  // namespace

std::vector<float> create_window(WindowType type, int length) {
  switch (type) {
    case WindowType::Hann:
      return hann_window(length);
    case WindowType::Hamming:
      return hamming_window(length);
    case WindowType::Blackman:
      return blackman_window(length);
    case WindowType::Rectangular:
      return rectangular_window(length);
  }
  return hann_window(length);  // default
}

float window_amplitude_scale(const std::vector<float>& window) {
  float sum = std::accumulate(window.begin(), window.end(), 0.0f);
  return sum > 0.0f ? 2.0f / sum : 0.0f;
}

std::vector<float> hann_window(int length) {
  std::vector<float> window(length);
  for (int i = 0; i < length; ++i) {
    window[i] = 0.5f * (1.0f - std::cos(kTwoPi * i / span(length)));
  }
  return window;
}

std::vector<float> hamming_window(int length) {
  std::vector<float> window(length);
  for (int i = 0; i < length; ++i) {
    window[i] = 0.54f - 0.46f * std::cos(kTwoPi * i / span(length));
  }
  return window;
}

std::vector<float> blackman_window(int length) {
  std::vector<float> window(length);
  constexpr float a0 = 0.42f;
  constexpr float a1 = 0.5f;
  constexpr float a2 = 0.08f;
  for (int i = 0; i < length; ++i) {
    float t = static_cast<float>(i) / span(length);
    window[i] = a0 - a1 * std::cos(kTwoPi * t) + a2 * std::cos(2.0f * kTwoPi * t);
  }
  return window;
}

std::vector<float> rectangular_window(int length) { return std::vector<float>(length, 1.0f); }

WindowType window_from_name(const std::string& name) {
  if (name == "hann") return WindowType::Hann;
  if (name == "hamming") return WindowType::Hamming;
  if (name == "blackman") return WindowType::Blackman;
  if (name == "rect" || name == "rectangular") return WindowType::Rectangular;
  throw CadenzaException(ErrorCode::InvalidParameter, "Unknown window type: " + name);
}

}  // namespace cadenza
