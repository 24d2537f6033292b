#include <herald/client/hook.hpp>
#include <herald/common/critical.hpp>

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace herald::client {

namespace {

constexpr auto kBeforeSendMessage =
    "before_send must be a non-empty function or a (module, method) pair "
    "exporting a unary method";
constexpr auto kAfterSendMessage =
    "after_send must be a non-empty function or a (module, method) pair "
    "exporting a binary method";

void validate_bound_method(const bound_method_t& bound,
                           const std::size_t arity,
                           const std::string_view message) {
  if (!bound.target) {
    throw herald::common::configuration_error{
        fmt::format("{}: bound method '{}' has no receiver", message,
                    bound.method)};
  }
  if (!bound.target->exports(bound.method, arity)) {
    throw herald::common::configuration_error{
        fmt::format("{}: {} does not export {}/{}", message,
                    bound.target->name(), bound.method, arity)};
  }
}

}  // namespace

hook_module::hook_module(std::string name) : name_{std::move(name)} {}

hook_module& hook_module::define_unary(std::string method,
                                       before_send_fn_t function) {
  unary_.insert_or_assign(std::move(method), std::move(function));
  return *this;
}

hook_module& hook_module::define_binary(std::string method,
                                        after_send_fn_t function) {
  binary_.insert_or_assign(std::move(method), std::move(function));
  return *this;
}

bool hook_module::exports(const std::string_view method,
                          const std::size_t arity) const {
  switch (arity) {
    case 1: {
      auto it = unary_.find(method);
      return it != std::end(unary_) && static_cast<bool>(it->second);
    }
    case 2: {
      auto it = binary_.find(method);
      return it != std::end(binary_) && static_cast<bool>(it->second);
    }
    default:
      return false;
  }
}

std::optional<herald::schema::event_t> hook_module::apply(
    const std::string_view method,
    herald::schema::event_t event) const {
  auto it = unary_.find(method);
  if (it == std::end(unary_) || !it->second) {
    throw herald::common::configuration_error{
        fmt::format("{} does not export {}/1", name_, method)};
  }
  return it->second(std::move(event));
}

void hook_module::apply(const std::string_view method,
                        const herald::schema::event_t& event,
                        const herald::schema::send_result_t& result) const {
  auto it = binary_.find(method);
  if (it == std::end(binary_) || !it->second) {
    throw herald::common::configuration_error{
        fmt::format("{} does not export {}/2", name_, method)};
  }
  it->second(event, result);
}

void validate(const before_send_hook_t& hook) {
  std::visit(overloaded{[](const before_send_fn_t& function) {
                          if (!function) {
                            throw herald::common::configuration_error{
                                kBeforeSendMessage};
                          }
                        },
                        [](const bound_method_t& bound) {
                          validate_bound_method(bound, 1, kBeforeSendMessage);
                        }},
             hook);
}

void validate(const after_send_hook_t& hook) {
  std::visit(overloaded{[](const after_send_fn_t& function) {
                          if (!function) {
                            throw herald::common::configuration_error{
                                kAfterSendMessage};
                          }
                        },
                        [](const bound_method_t& bound) {
                          validate_bound_method(bound, 2, kAfterSendMessage);
                        }},
             hook);
}

std::optional<herald::schema::event_t> call_before_send(
    const std::optional<before_send_hook_t>& hook,
    herald::schema::event_t event) {
  if (!hook) {
    return event;
  }
  validate(*hook);
  return std::visit(
      overloaded{[&](const before_send_fn_t& function) {
                   return function(std::move(event));
                 },
                 [&](const bound_method_t& bound) {
                   return bound.target->apply(bound.method, std::move(event));
                 }},
      *hook);
}

void call_after_send(const std::optional<after_send_hook_t>& hook,
                     const herald::schema::event_t& event,
                     const herald::schema::send_result_t& result) {
  if (!hook) {
    return;
  }
  validate(*hook);
  std::visit(overloaded{[&](const after_send_fn_t& function) {
                          function(event, result);
                        },
                        [&](const bound_method_t& bound) {
                          bound.target->apply(bound.method, event, result);
                        }},
             *hook);
}

}  // namespace herald::client
