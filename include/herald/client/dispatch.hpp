#pragma once

#include <herald/client/last_event_store.hpp>
#include <herald/schema/completion_mode.hpp>
#include <herald/schema/encoding/json/encoder.hpp>
#include <herald/schema/event.hpp>
#include <herald/schema/send_result.hpp>
#include <herald/transport/transport.hpp>

#include <spdlog/common.h>

#include <cstdint>
#include <optional>
#include <string>

namespace herald::client {

/// Message explaining why `error` happened, without the common prefix.
std::string describe_failure(const herald::schema::send_error_t& error);

/// Log a failed blocking send at `level`, unless the event came from the
/// logging integration itself.
void log_send_failure(const herald::schema::send_error_t& error,
                      const herald::schema::event_t& event,
                      spdlog::level::level_enum level);

/// Hands rendered events to the transport according to the completion mode.
class dispatcher final {
 public:
  /// `sender` may be null when fire-and-forget delivery is never requested.
  dispatcher(herald::schema::encoding::json_encoder_t& encoder,
             herald::transport::transport& transport,
             herald::transport::sender* sender,
             last_event_store& last_event);

  /// Render and deliver `event`.
  ///
  /// `sync` waits for the transport and reports its outcome. `none` queues
  /// the payload and returns an accepted result with an empty identifier.
  /// `async` throws herald::common::configuration_error before anything is
  /// rendered or sent.
  herald::schema::send_result_t dispatch(
      const herald::schema::event_t& event,
      herald::schema::completion_mode_t mode,
      uint32_t request_retries,
      spdlog::level::level_enum log_level);

 private:
  herald::schema::send_result_t dispatch_sync(
      const herald::schema::event_t& event,
      uint32_t request_retries,
      spdlog::level::level_enum log_level);

  herald::schema::send_result_t dispatch_none(
      const herald::schema::event_t& event);

  herald::schema::encoding::json_encoder_t& encoder_;
  herald::transport::transport& transport_;
  herald::transport::sender* sender_{nullptr};
  last_event_store& last_event_;
};

}  // namespace herald::client
