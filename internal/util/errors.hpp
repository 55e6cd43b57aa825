#pragma once

#include <stdexcept>
#include <string>

namespace relay::util {

/*
  Central error types.

  SpecError is the only error a caller of the spec loader ever sees.
  Everything else raised below the loader is rewrapped into it.
*/

class SpecError : public std::runtime_error {
 public:
  explicit SpecError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by document sources when raw text is not a well-formed document.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace relay::util
