#pragma once

/// @file exception.h
/// @brief Exception classes for libcadenza.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace cadenza {

/// @brief Base exception class for libcadenza errors.
class CadenzaException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit CadenzaException(ErrorCode code) : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  CadenzaException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def CADENZA_CHECK
/// @brief Throws CadenzaException if condition is false.
#define CADENZA_CHECK(cond, code)    \
  do {                               \
    if (!(cond)) {                   \
      throw CadenzaException(code);  \
    }                                \
  } while (0)

/// @def CADENZA_CHECK_MSG
/// @brief Throws CadenzaException with custom message if condition is false.
#define CADENZA_CHECK_MSG(cond, code, msg) \
  do {                                     \
    if (!(cond)) {                         \
      throw CadenzaException(code, msg);   \
    }                                      \
  } while (0)

}  // namespace cadenza
