#pragma once

#include <stdexcept>
#include <string>

namespace impact::util {

/*
  Central error types.

  The analysis core itself does not throw in normal operation; these are
  raised at the boundaries (snapshot intake, config loading) and caught by
  the command line entry point.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Input snapshot is missing required fields or is not parseable.
class InvalidSnapshot : public std::runtime_error {
 public:
  explicit InvalidSnapshot(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace impact::util
