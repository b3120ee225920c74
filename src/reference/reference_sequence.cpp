/// @file reference_sequence.cpp
/// @brief Implementation of ReferenceSequence.

#include "reference/reference_sequence.h"

#include <Eigen/Core>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <locale>
#include <sstream>

#include "util/exception.h"

namespace cadenza {

namespace {

/// @brief Values may exceed 1 by float noise from the generating tool.
constexpr float kRangeTolerance = 1e-6f;

using ChromaArray = Eigen::Array<float, kNumChroma, 1>;

/// @brief Checks and clamps one value; throws naming the row on failure.
float checked_value(double value, size_t row) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0 + kRangeTolerance) {
    throw CadenzaException(ErrorCode::InvalidFormat,
                           "Reference row " + std::to_string(row) + " has value outside [0, 1]");
  }
  return static_cast<float>(std::min(value, 1.0));
}

/// @brief Recursive-descent reader for [[number, ...], ...].
class NestedArrayParser {
 public:
  explicit NestedArrayParser(const std::string& text) : text_(text), pos_(0) {}

  std::vector<ChromaVector> parse() {
    std::vector<ChromaVector> frames;
    skip_whitespace();
    expect('[');
    skip_whitespace();

    if (peek() == ']') {
      ++pos_;
    } else {
      while (true) {
        frames.push_back(parse_row(frames.size()));
        skip_whitespace();
        char c = next();
        if (c == ']') break;
        if (c != ',') fail("expected ',' or ']' between rows");
      }
    }

    skip_whitespace();
    if (pos_ != text_.size()) {
      fail("unexpected trailing content");
    }
    return frames;
  }

 private:
  ChromaVector parse_row(size_t row) {
    ChromaVector frame{};
    skip_whitespace();
    expect('[');

    size_t count = 0;
    skip_whitespace();
    if (peek() != ']') {
      while (true) {
        skip_whitespace();
        double value = parse_number();
        if (count < static_cast<size_t>(kNumChroma)) {
          frame[count] = checked_value(value, row);
        }
        ++count;
        skip_whitespace();
        char c = next();
        if (c == ']') break;
        if (c != ',') fail("expected ',' or ']' in row " + std::to_string(row));
      }
    } else {
      ++pos_;
    }

    if (count != static_cast<size_t>(kNumChroma)) {
      throw CadenzaException(ErrorCode::InvalidFormat,
                             "Reference row " + std::to_string(row) + " has " +
                                 std::to_string(count) + " values, expected 12");
    }
    return frame;
  }

  /// JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
  double parse_number() {
    size_t start = pos_;
    if (peek() == '-') ++pos_;

    if (peek() == '0') {
      ++pos_;
      if (is_digit(peek())) fail("leading zeros are not allowed");
    } else if (is_digit(peek())) {
      skip_digits();
    } else {
      fail("expected a number");
    }

    if (peek() == '.') {
      ++pos_;
      if (!is_digit(peek())) fail("expected a digit after '.'");
      skip_digits();
    }

    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!is_digit(peek())) fail("expected a digit in exponent");
      skip_digits();
    }

    std::istringstream token(text_.substr(start, pos_ - start));
    token.imbue(std::locale::classic());
    double value = 0.0;
    token >> value;
    if (token.fail()) {
      /// Out-of-range magnitudes fail extraction; report them as range errors
      return std::numeric_limits<double>::infinity();
    }
    return value;
  }

  static bool is_digit(char c) { return c >= '0' && c <= '9'; }

  void skip_digits() {
    while (is_digit(peek())) ++pos_;
  }

  void skip_whitespace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  char next() {
    if (pos_ >= text_.size()) {
      fail("unexpected end of input");
    }
    return text_[pos_++];
  }

  void expect(char c) {
    if (next() != c) {
      fail(std::string("expected '") + c + "'");
    }
  }

  [[noreturn]] void fail(const std::string& what) const {
    throw CadenzaException(ErrorCode::InvalidFormat,
                           "Malformed reference JSON at offset " + std::to_string(pos_) + ": " +
                               what);
  }

  const std::string& text_;
  size_t pos_;
};

}  // namespace

ReferenceSequence::ReferenceSequence(std::vector<ChromaVector> frames) {
  frames_.reserve(frames.size());
  for (const auto& frame : frames) {
    append(frame);
  }
}

ReferenceSequence ReferenceSequence::parse(const std::string& json) {
  ReferenceSequence sequence;
  sequence.frames_ = NestedArrayParser(json).parse();
  return sequence;
}

ReferenceSequence ReferenceSequence::load(const std::string& path) {
  std::ifstream file(path);
  CADENZA_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

std::string ReferenceSequence::to_json(int precision) const {
  std::ostringstream ss;
  ss.precision(precision);
  ss << "[";
  for (size_t i = 0; i < frames_.size(); ++i) {
    if (i > 0) ss << ",\n ";
    ss << "[";
    for (int k = 0; k < kNumChroma; ++k) {
      if (k > 0) ss << ", ";
      ss << frames_[i][k];
    }
    ss << "]";
  }
  ss << "]\n";
  return ss.str();
}

void ReferenceSequence::save(const std::string& path) const {
  std::ofstream file(path);
  CADENZA_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot create file: " + path);
  file << to_json();
  CADENZA_CHECK_MSG(file.good(), ErrorCode::InvalidFormat, "Failed to write file: " + path);
}

void ReferenceSequence::append(const ChromaVector& frame) {
  ChromaVector checked;
  for (int k = 0; k < kNumChroma; ++k) {
    checked[k] = checked_value(frame[k], frames_.size());
  }
  frames_.push_back(checked);
}

const ChromaVector& ReferenceSequence::frame(size_t i) const {
  CADENZA_CHECK_MSG(i < frames_.size(), ErrorCode::InvalidParameter,
                    "Reference frame index " + std::to_string(i) + " out of range");
  return frames_[i];
}

ChromaVector ReferenceSequence::mean() const {
  ChromaVector result{};
  if (frames_.empty()) {
    return result;
  }

  ChromaArray sum = ChromaArray::Zero();
  for (const auto& frame : frames_) {
    sum += Eigen::Map<const ChromaArray>(frame.data());
  }
  Eigen::Map<ChromaArray>(result.data()) = sum / static_cast<float>(frames_.size());
  return result;
}

}  // namespace cadenza
