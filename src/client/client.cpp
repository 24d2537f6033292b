#include <herald/client/client.hpp>
#include <herald/client/hook.hpp>
#include <herald/client/renderer.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace herald::client {

client::client(client_config config,
               herald::schema::encoding::json_encoder_t& encoder,
               herald::transport::transport& transport,
               herald::transport::sender* sender,
               last_event_store& last_event,
               random_source_t random)
    : config_{std::move(config)},
      encoder_{encoder},
      dispatcher_{encoder, transport, sender, last_event},
      random_{std::move(random)} {
  config_.validate();
}

herald::schema::send_result_t client::send_event(herald::schema::event_t event,
                                                 const send_options& options) {
  const auto mode = options.result.value_or(config_.send_result);
  const auto sample_rate = options.sample_rate.value_or(config_.sample_rate);
  const auto request_retries =
      options.request_retries.value_or(config_.request_retries);

  if (!sample(sample_rate, random_)) {
    spdlog::debug("Event {} dropped by sampling", event.event_id);
    return herald::schema::unsampled_t{};
  }

  auto hooked = call_before_send(config_.before_send, std::move(event));
  if (!hooked) {
    spdlog::debug("Event dropped by before_send hook");
    return herald::schema::excluded_t{};
  }

  auto result =
      dispatcher_.dispatch(*hooked, mode, request_retries, config_.log_level);
  call_after_send(config_.after_send, *hooked, result);
  return result;
}

herald::schema::value_t client::render_event(
    const herald::schema::event_t& event) {
  return herald::client::render_event(event, encoder_);
}

}  // namespace herald::client
