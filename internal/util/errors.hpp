#pragma once

#include <stdexcept>
#include <string>

namespace execmon::util {

/*
  Central error types.

  Nothing here may escape a lifecycle hook; hooks catch and log.
*/

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ChannelClosed : public std::runtime_error {
 public:
  explicit ChannelClosed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace execmon::util
