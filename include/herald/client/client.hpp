#pragma once

#include <herald/client/config.hpp>
#include <herald/client/dispatch.hpp>
#include <herald/client/last_event_store.hpp>
#include <herald/client/sampler.hpp>
#include <herald/schema/encoding/json/encoder.hpp>
#include <herald/schema/event.hpp>
#include <herald/schema/primitives.hpp>
#include <herald/schema/send_result.hpp>
#include <herald/transport/transport.hpp>

namespace herald::client {

/// Event pipeline: sampling, before-send hook, render and dispatch,
/// after-send hook.
///
/// Dropped events (sampling or hook) are never rendered, never reach the
/// transport and never reach the after-send hook. Delivery failures come
/// back as `failed_t`; configuration errors are thrown.
class client final {
 public:
  /// Validates `config`; throws herald::common::configuration_error.
  client(client_config config,
         herald::schema::encoding::json_encoder_t& encoder,
         herald::transport::transport& transport,
         herald::transport::sender* sender,
         last_event_store& last_event,
         random_source_t random = make_default_random_source());

  /// Submit one event. `options` override the configured sample rate,
  /// completion mode and retry count for this call only.
  herald::schema::send_result_t send_event(herald::schema::event_t event,
                                           const send_options& options = {});

  /// Final payload for `event` without submitting it.
  herald::schema::value_t render_event(const herald::schema::event_t& event);

  const client_config& config() const { return config_; }

 private:
  client_config config_;
  herald::schema::encoding::json_encoder_t& encoder_;
  dispatcher dispatcher_;
  random_source_t random_;
};

}  // namespace herald::client
