#include <herald/client/dispatch.hpp>
#include <herald/client/renderer.hpp>
#include <herald/common/critical.hpp>

#include <boost/core/demangle.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <typeinfo>
#include <utility>
#include <vector>

namespace herald::client {

namespace {

constexpr auto kRetiredModeMessage =
    "the async completion mode is not supported anymore. Instead, spawn a "
    "thread yourself that calls send_event with the sync completion mode; "
    "the effect is exactly the same";

void append_causes(const std::exception& ex, std::vector<std::string>& out) {
  try {
    std::rethrow_if_nested(ex);
  } catch (const std::exception& cause) {
    out.push_back(fmt::format("caused by {}: {}",
                              boost::core::demangle(typeid(cause).name()),
                              cause.what()));
    append_causes(cause, out);
  }
}

/// Chain of std::nested_exception causes below `ex`, outermost first.
std::vector<std::string> nested_causes(const std::exception& ex) {
  auto out = std::vector<std::string>{};
  append_causes(ex, out);
  return out;
}

}  // namespace

std::string describe_failure(const herald::schema::send_error_t& error) {
  return std::visit(
      overloaded{
          [](const herald::schema::invalid_dsn_t&) {
            return std::string{"Cannot send event because of invalid DSN"};
          },
          [](const herald::schema::invalid_json_t& invalid) {
            return fmt::format("Unable to encode JSON event - {}",
                               invalid.error);
          },
          [](const herald::schema::request_failure_t& failure) {
            return std::visit(
                overloaded{[](const herald::schema::fault_t& fault) {
                             return herald::schema::format_fault(fault);
                           },
                           [](const std::string& reason) {
                             return fmt::format("Error in HTTP request - {}",
                                                reason);
                           }},
                failure.last_error);
          }},
      error);
}

void log_send_failure(const herald::schema::send_error_t& error,
                      const herald::schema::event_t& event,
                      const spdlog::level::level_enum level) {
  if (event.source == herald::schema::event_source_t::logger) {
    return;
  }
  spdlog::log(level, "Failed to send event. {}", describe_failure(error));
}

dispatcher::dispatcher(herald::schema::encoding::json_encoder_t& encoder,
                       herald::transport::transport& transport,
                       herald::transport::sender* sender,
                       last_event_store& last_event)
    : encoder_{encoder},
      transport_{transport},
      sender_{sender},
      last_event_{last_event} {}

herald::schema::send_result_t dispatcher::dispatch(
    const herald::schema::event_t& event,
    const herald::schema::completion_mode_t mode,
    const uint32_t request_retries,
    const spdlog::level::level_enum log_level) {
  switch (mode) {
    case herald::schema::completion_mode_t::sync:
      return dispatch_sync(event, request_retries, log_level);
    case herald::schema::completion_mode_t::none:
      return dispatch_none(event);
    case herald::schema::completion_mode_t::async:
    default:
      throw herald::common::configuration_error{kRetiredModeMessage};
  }
}

herald::schema::send_result_t dispatcher::dispatch_sync(
    const herald::schema::event_t& event,
    const uint32_t request_retries,
    const spdlog::level::level_enum log_level) {
  auto payloads =
      std::vector<herald::schema::value_t>{render_event(event, encoder_)};
  auto error = std::optional<herald::schema::send_error_t>{};
  try {
    error = transport_.post(payloads, request_retries);
  } catch (const std::exception& ex) {
    error = herald::schema::request_failure_t{
        .last_error = herald::schema::fault_t{
            .kind = boost::core::demangle(typeid(ex).name()),
            .message = ex.what(),
            .trace = nested_causes(ex)}};
  }
  if (error) {
    log_send_failure(*error, event, log_level);
    return herald::schema::failed_t{.reason = std::move(*error)};
  }

  last_event_.put(event.event_id, event.source);
  spdlog::debug("Sent event {}", event.event_id);
  return herald::schema::accepted_t{.event_id = event.event_id};
}

herald::schema::send_result_t dispatcher::dispatch_none(
    const herald::schema::event_t& event) {
  if (sender_ == nullptr) {
    throw herald::common::configuration_error{
        "the none completion mode requires a sender"};
  }
  sender_->send_async(render_event(event, encoder_));
  last_event_.put(event.event_id, event.source);
  return herald::schema::accepted_t{};
}

}  // namespace herald::client
