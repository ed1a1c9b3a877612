#pragma once

/// @file exception.h
/// @brief Exception classes for libpitchtrack.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace pitchtrack {

/// @brief Base exception class for libpitchtrack errors.
/// @details Only thrown for programmer errors (bad construction parameters,
/// out-of-domain tunables) and file decoding failures. Absence of a pitch is
/// never reported through an exception.
class PitchtrackException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit PitchtrackException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  PitchtrackException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def PITCHTRACK_CHECK
/// @brief Throws PitchtrackException if condition is false.
#define PITCHTRACK_CHECK(cond, code)   \
  do {                                 \
    if (!(cond)) {                     \
      throw PitchtrackException(code); \
    }                                  \
  } while (0)

/// @def PITCHTRACK_CHECK_MSG
/// @brief Throws PitchtrackException with custom message if condition is false.
#define PITCHTRACK_CHECK_MSG(cond, code, msg) \
  do {                                        \
    if (!(cond)) {                            \
      throw PitchtrackException(code, msg);   \
    }                                         \
  } while (0)

}  // namespace pitchtrack
