#pragma once

#include <herald/schema/primitives.hpp>
#include <herald/schema/send_result.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace herald::transport {

/// Blocking delivery of rendered payloads.
class transport {
 public:
  virtual ~transport() = default;

  /// Deliver `payloads` as one batch, retrying up to `retries` times.
  ///
  /// Returns std::nullopt once the destination acknowledged the batch,
  /// otherwise the reason of the last failed attempt.
  virtual std::optional<herald::schema::send_error_t> post(
      const std::vector<herald::schema::value_t>& payloads,
      uint32_t retries) = 0;
};

/// Fire-and-forget delivery. `send_async` returns before delivery starts.
class sender {
 public:
  virtual ~sender() = default;

  virtual void send_async(herald::schema::value_t payload) = 0;
};

}  // namespace herald::transport
