#pragma once

/// @file reference_sequence.h
/// @brief Precomputed chroma sequence of a reference performance.

#include <cstddef>
#include <string>
#include <vector>

#include "util/types.h"

namespace cadenza {

/// @brief Ordered sequence of 12-element chroma vectors.
/// @details Stored on disk as nested JSON arrays, one row per frame:
/// @code
///   [[1.0, 0.0, 0.2, ...], [0.9, 0.1, 0.3, ...], ...]
/// @endcode
/// Rows must have exactly 12 numbers in [0, 1]. The sequence has the same shape
/// and range as the output of ChromaPipeline, so the two can be compared
/// directly.
class ReferenceSequence {
 public:
  ReferenceSequence() = default;

  /// @brief Constructs from frames.
  /// @throws CadenzaException(InvalidFormat) if any value is outside [0, 1]
  explicit ReferenceSequence(std::vector<ChromaVector> frames);

  /// @brief Parses JSON text.
  /// @param json Nested numeric arrays
  /// @return Parsed sequence
  /// @throws CadenzaException(InvalidFormat) on malformed JSON, a row that is not
  ///         12 numbers, or a value outside [0, 1]
  static ReferenceSequence parse(const std::string& json);

  /// @brief Loads a JSON file.
  /// @throws CadenzaException(FileNotFound) if the file cannot be opened
  /// @throws CadenzaException(InvalidFormat) as parse()
  static ReferenceSequence load(const std::string& path);

  /// @brief Serializes to JSON text.
  /// @param precision Significant digits per value
  std::string to_json(int precision = 6) const;

  /// @brief Writes to_json() to a file.
  /// @throws CadenzaException(FileNotFound) if the file cannot be created
  void save(const std::string& path) const;

  /// @brief Appends a frame.
  /// @throws CadenzaException(InvalidFormat) if any value is outside [0, 1]
  void append(const ChromaVector& frame);

  size_t size() const { return frames_.size(); }
  bool empty() const { return frames_.empty(); }

  /// @brief Returns frame i.
  /// @throws CadenzaException(InvalidParameter) if i >= size()
  const ChromaVector& frame(size_t i) const;

  const std::vector<ChromaVector>& frames() const { return frames_; }

  /// @brief Mean chroma over all frames (zeros when empty).
  ChromaVector mean() const;

 private:
  std::vector<ChromaVector> frames_;
};

}  // namespace cadenza
