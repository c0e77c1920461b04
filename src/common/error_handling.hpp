#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

namespace invZK {
namespace ErrorHandling {

// Common exception types
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string &message)
      : std::invalid_argument(message) {}
};

// Malformed parameter bundle. Only raised while constructing parameters.
class ConfigurationError : public ValidationError {
public:
  explicit ConfigurationError(const std::string &message)
      : ValidationError("invalid configuration: " + message) {}
};

class ComputationError : public std::runtime_error {
public:
  explicit ComputationError(const std::string &message)
      : std::runtime_error(message) {}
};

// A batched S-box product was zero, so no inverse exists.
class InversionError : public ComputationError {
public:
  explicit InversionError(const std::string &message)
      : ComputationError("field inversion error: " + message) {}
};

class IndexError : public std::out_of_range {
public:
  explicit IndexError(const std::string &message)
      : std::out_of_range(message) {}
};

inline void log_error(const std::string &message) {
  std::cerr << "[invZK] error: " << message << std::endl;
}

// Common validation functions
inline void validate_range(size_t value, size_t min_val, size_t max_val,
                           const std::string &param_name) {
  if (value < min_val || value > max_val) {
    throw ValidationError(
        param_name + " must be between " + std::to_string(min_val) + " and " +
        std::to_string(max_val) + ", got " + std::to_string(value));
  }
}

inline void validate_index(size_t index, size_t max_index,
                           const std::string &context) {
  if (index >= max_index) {
    throw IndexError(context + ": index " + std::to_string(index) +
                     " out of range [0, " + std::to_string(max_index) + ")");
  }
}

inline void validate_non_empty(size_t size, const std::string &context) {
  if (size == 0) {
    throw ValidationError(context + " cannot be empty");
  }
}

inline void validate_size(size_t actual, size_t expected,
                          const std::string &context) {
  if (actual != expected) {
    throw ValidationError(context + ": expected size " +
                          std::to_string(expected) + ", got " +
                          std::to_string(actual));
  }
}

} // namespace ErrorHandling
} // namespace invZK
