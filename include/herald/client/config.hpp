#pragma once

#include <herald/client/hook.hpp>
#include <herald/schema/completion_mode.hpp>

#include <spdlog/common.h>

#include <cstdint>
#include <optional>

namespace herald::client {

/// Client-wide submission settings.
struct client_config final {
  /// Probability in [0, 1] that a submission is kept.
  double sample_rate{1.0};
  herald::schema::completion_mode_t send_result{
      herald::schema::completion_mode_t::sync};
  /// Passed through to the transport; this layer never retries.
  uint32_t request_retries{4};
  /// Severity of the line logged when a blocking send fails.
  spdlog::level::level_enum log_level{spdlog::level::warn};
  std::optional<before_send_hook_t> before_send;
  std::optional<after_send_hook_t> after_send;

  /// Throw herald::common::configuration_error on a malformed hook, a
  /// sample rate outside [0, 1] or the retired `async` completion mode.
  void validate() const;
};

/// Per-submission overrides; unset members fall back to client_config.
struct send_options final {
  std::optional<double> sample_rate;
  std::optional<herald::schema::completion_mode_t> result;
  std::optional<uint32_t> request_retries;
};

}  // namespace herald::client
