// errors.h
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace roster {

// Invalid grid size, empty population or malformed people list.
struct ConfigError : std::runtime_error {
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Grid too small (or too large) for the populations supplied.
struct CapacityError : std::runtime_error {
  explicit CapacityError(const std::string& msg) : std::runtime_error(msg) {}
};

// Every problem found in the pin list, not just the first.
struct PinValidationError : std::runtime_error {
  std::vector<std::string> issues;

  explicit PinValidationError(std::vector<std::string> all)
      : std::runtime_error(join(all)), issues(std::move(all)) {}

 private:
  static std::string join(const std::vector<std::string>& v) {
    std::string out = "Pin validation failed: ";
    for (std::size_t i = 0; i < v.size(); ++i) {
      if (i) out += "; ";
      out += v[i];
    }
    return out;
  }
};

}  // namespace roster
