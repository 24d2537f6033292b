#pragma once

#include <csignal>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace herald::common {

[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Programmer error in client configuration (malformed hook, retired
/// completion mode, sample rate outside [0, 1]). Never caught by herald.
class configuration_error final : public std::invalid_argument {
 public:
  explicit configuration_error(const std::string& message)
      : std::invalid_argument{message} {}
};

}  // namespace herald::common
