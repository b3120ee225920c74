#pragma once

/// @file convert.h
/// @brief Unit conversion functions for spectral bins, frequencies and pitch.

#include <cstddef>

namespace cadenza {

/// @brief Standard concert pitch for A4 (MIDI note 69).
constexpr double kConcertPitchHz = 440.0;

/// @brief Converts Hz to (fractional) MIDI note number.
/// @param hz Frequency in Hz
/// @param ref_hz Frequency of A4 (MIDI 69)
/// @return MIDI note number, 0 for non-positive frequencies
double hz_to_midi(double hz, double ref_hz = kConcertPitchHz);

/// @brief Maps a fractional MIDI note to its pitch class.
/// @param midi MIDI note number (may be negative)
/// @return Pitch class in [0, 11] of the nearest equal-tempered note
int midi_to_pitch_class(double midi);

/// @brief Maps a frequency to the pitch class of its nearest equal-tempered note.
/// @param hz Frequency in Hz
/// @param ref_hz Frequency of A4
/// @return Pitch class in [0, 11], or -1 if hz <= 0
int hz_to_pitch_class(double hz, double ref_hz = kConcertPitchHz);

/// @brief Frequency spacing of a magnitude frame.
/// @param sample_rate Sample rate in Hz
/// @param n_bins Number of bins spanning 0 Hz to Nyquist
/// @return Hz per bin, sample_rate / (2 * n_bins)
double bin_resolution(double sample_rate, size_t n_bins);

/// @brief Converts a magnitude frame bin index to Hz.
/// @param bin Bin index
/// @param sample_rate Sample rate in Hz
/// @param n_bins Number of bins spanning 0 Hz to Nyquist
/// @return Frequency in Hz
double bin_to_hz(size_t bin, double sample_rate, size_t n_bins);

/// @brief Converts Hz to the nearest magnitude frame bin index.
/// @param hz Frequency in Hz
/// @param sample_rate Sample rate in Hz
/// @param n_bins Number of bins spanning 0 Hz to Nyquist
/// @return Bin index
size_t hz_to_bin(double hz, double sample_rate, size_t n_bins);

}  // namespace cadenza
