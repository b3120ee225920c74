#pragma once

/// @file math_utils.h
/// @brief Mathematical utility functions for signal processing.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>

namespace cadenza {

/// @brief Clamps a value between min and max.
/// @tparam T Numeric type
/// @param value Value to clamp
/// @param min_val Minimum bound
/// @param max_val Maximum bound
/// @return Clamped value
template <typename T>
T clamp(T value, T min_val, T max_val) {
  return std::max(min_val, std::min(value, max_val));
}

/// @brief Returns the index of the maximum element.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Index of maximum element (0 if empty)
template <typename T>
size_t argmax(const T* data, size_t size) {
  if (size == 0) return 0;
  return std::distance(data, std::max_element(data, data + size));
}

/// @brief Returns the maximum element.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Maximum value (0 if empty)
template <typename T>
T max_value(const T* data, size_t size) {
  if (size == 0) return T{0};
  return *std::max_element(data, data + size);
}

/// @brief Mathematical modulo: result is always in [0, m) for m > 0.
/// @details Integer % truncates toward zero, so -3 % 12 == -3; this returns 9.
inline int positive_mod(int value, int m) {
  int r = value % m;
  return r < 0 ? r + m : r;
}

/// @brief Returns true if value is finite and strictly positive.
inline bool is_positive_finite(float value) { return std::isfinite(value) && value > 0.0f; }

/// @brief Returns true if every element is finite (true for an empty range).
template <typename T>
bool all_finite(const T* data, size_t size) {
  return std::all_of(data, data + size, [](T v) { return std::isfinite(v); });
}

}  // namespace cadenza
