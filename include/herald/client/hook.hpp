#pragma once

#include <herald/schema/event.hpp>
#include <herald/schema/send_result.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace herald::client {

/// Returns the event to continue with, or std::nullopt to drop it.
using before_send_fn_t = std::function<std::optional<herald::schema::event_t>(
    herald::schema::event_t event)>;

/// Observes the delivered event and the final result.
using after_send_fn_t =
    std::function<void(const herald::schema::event_t& event,
                       const herald::schema::send_result_t& result)>;

/// Named collection of hook functions, the receiver half of a
/// `bound_method_t`.
///
/// Methods are exported with a fixed arity: unary methods are before-send
/// filters, binary methods are after-send observers.
class hook_module final {
 public:
  explicit hook_module(std::string name);

  hook_module& define_unary(std::string method, before_send_fn_t function);
  hook_module& define_binary(std::string method, after_send_fn_t function);

  bool exports(std::string_view method, std::size_t arity) const;

  std::optional<herald::schema::event_t> apply(
      std::string_view method,
      herald::schema::event_t event) const;

  void apply(std::string_view method,
             const herald::schema::event_t& event,
             const herald::schema::send_result_t& result) const;

  const std::string& name() const { return name_; }

 private:
  std::string name_;
  std::map<std::string, before_send_fn_t, std::less<>> unary_;
  std::map<std::string, after_send_fn_t, std::less<>> binary_;
};

/// (receiver, method name) pair resolved at call time.
struct bound_method_t final {
  std::shared_ptr<const hook_module> target;
  std::string method;
};

using before_send_hook_t = std::variant<before_send_fn_t, bound_method_t>;
using after_send_hook_t = std::variant<after_send_fn_t, bound_method_t>;

/// Throw herald::common::configuration_error unless the hook is callable
/// with the arity its slot requires.
void validate(const before_send_hook_t& hook);
void validate(const after_send_hook_t& hook);

/// Run the before-send slot. An empty slot returns the event unchanged.
std::optional<herald::schema::event_t> call_before_send(
    const std::optional<before_send_hook_t>& hook,
    herald::schema::event_t event);

/// Run the after-send slot. Exceptions thrown by the hook propagate.
void call_after_send(const std::optional<after_send_hook_t>& hook,
                     const herald::schema::event_t& event,
                     const herald::schema::send_result_t& result);

}  // namespace herald::client
