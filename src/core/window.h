#pragma once

/// @file window.h
/// @brief Window function generators.

#include <string>
#include <vector>

#include "util/types.h"

namespace cadenza {

/// @brief Creates a window of the specified type.
/// @param type Window type
/// @param length Window length in samples
/// @return Vector containing window coefficients
std::vector<float> create_window(WindowType type, int length);

/// @brief Amplitude normalization factor for a window.
/// @details 2 / sum(window): scales a one-sided magnitude spectrum so a sine of
///          amplitude A peaks at approximately A.
/// @param window Window coefficients
/// @return Scale factor (0 for an all-zero window)
float window_amplitude_scale(const std::vector<float>& window);

/// @brief Creates a Hann (raised cosine) window.
std::vector<float> hann_window(int length);

/// @brief Creates a Hamming window.
std::vector<float> hamming_window(int length);

/// @brief Creates a Blackman window.
std::vector<float> blackman_window(int length);

/// @brief Creates a rectangular (boxcar) window.
std::vector<float> rectangular_window(int length);

/// @brief Parses a window name ("hann", "hamming", "blackman", "rect").
/// @throws CadenzaException(InvalidParameter) for unknown names
WindowType window_from_name(const std::string& name);

}  // namespace cadenza
