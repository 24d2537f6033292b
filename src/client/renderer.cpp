#include <herald/client/renderer.hpp>
#include <herald/client/sanitizer.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

using namespace herald::schema;

namespace {

// Nesting level of each free-form field inside the rendered payload:
// payload > field, payload > request > data and
// payload > breadcrumbs > breadcrumb > data.
constexpr std::size_t kEventFieldDepth = 1;
constexpr std::size_t kRequestDataDepth = 2;
constexpr std::size_t kBreadcrumbDataDepth = 3;

template <typename T>
value_t optional_value(const std::optional<T>& field) {
  if (!field) {
    return value_t{};
  }
  return value_t{*field};
}

value_t optional_level(const std::optional<level_t>& level) {
  if (!level) {
    return value_t{};
  }
  return value_t{to_string(*level)};
}

template <typename T>
void put_if_present(map_t& out,
                    const std::string& key,
                    const std::optional<T>& field) {
  if (field) {
    out.insert_or_assign(key, value_t{*field});
  }
}

template <typename T, typename Render>
value_t render_list(const std::vector<T>& items, Render&& render) {
  auto out = list_t{};
  out.reserve(items.size());
  std::transform(std::begin(items), std::end(items), std::back_inserter(out),
                 std::forward<Render>(render));
  return value_t{std::move(out)};
}

value_t render_sdk(const sdk_t& sdk) {
  return value_t{map_t{{"name", value_t{sdk.name}},
                       {"version", value_t{sdk.sdk_version}},
                       {"integrations", make_value(sdk.integrations)}}};
}

value_t render_mechanism(const std::optional<mechanism_t>& mechanism) {
  if (!mechanism) {
    return value_t{};
  }
  return value_t{map_t{{"type", value_t{mechanism->type}},
                       {"handled", value_t{mechanism->handled}}}};
}

value_t render_frame(const frame_t& frame) {
  auto out = map_t{};
  out.emplace("function", optional_value(frame.function));
  out.emplace("module", optional_value(frame.module));
  out.emplace("filename", optional_value(frame.filename));
  out.emplace("abs_path", optional_value(frame.abs_path));
  out.emplace("lineno", optional_value(frame.lineno));
  out.emplace("context_line", optional_value(frame.context_line));
  out.emplace("pre_context", make_value(frame.pre_context));
  out.emplace("post_context", make_value(frame.post_context));
  out.emplace("in_app", optional_value(frame.in_app));
  out.emplace("vars", make_value(frame.vars));
  return value_t{std::move(out)};
}

}  // namespace

namespace herald::client {

value_t render_breadcrumb(const breadcrumb_t& breadcrumb,
                          encoding::json_encoder_t& encoder) {
  auto out = map_t{};
  out.emplace("type", optional_value(breadcrumb.type));
  out.emplace("category", optional_value(breadcrumb.category));
  out.emplace("message", optional_value(breadcrumb.message));
  out.emplace("level", optional_level(breadcrumb.level));
  out.emplace("timestamp", optional_value(breadcrumb.timestamp));
  if (breadcrumb.data) {
    out.emplace("data", sanitize_field(*breadcrumb.data, encoder,
                                       kBreadcrumbDataDepth));
  } else {
    out.emplace("data", value_t{});
  }
  return value_t{std::move(out)};
}

value_t render_request(const request_t& request,
                       encoding::json_encoder_t& encoder) {
  auto out = map_t{};
  put_if_present(out, "method", request.method);
  put_if_present(out, "url", request.url);
  put_if_present(out, "query_string", request.query_string);
  put_if_present(out, "cookies", request.cookies);
  if (request.data && !is_nil(*request.data)) {
    out.emplace("data",
                sanitize(*request.data, encoder, kRequestDataDepth).value);
  }
  if (request.headers) {
    out.emplace("headers", make_value(*request.headers));
  }
  if (request.env) {
    out.emplace("env", make_value(*request.env));
  }
  return value_t{std::move(out)};
}

value_t render_exception(const exception_t& exception) {
  auto out = map_t{};
  out.emplace("type", value_t{exception.type});
  out.emplace("value", optional_value(exception.value));
  out.emplace("module", optional_value(exception.module));
  out.emplace("thread_id", optional_value(exception.thread_id));
  out.emplace("mechanism", render_mechanism(exception.mechanism));
  if (exception.stacktrace) {
    auto frames = render_list(exception.stacktrace->frames, render_frame);
    out.emplace("stacktrace", value_t{map_t{{"frames", std::move(frames)}}});
  } else {
    out.emplace("stacktrace", value_t{});
  }
  return value_t{std::move(out)};
}

value_t render_event(const event_t& event,
                     encoding::json_encoder_t& encoder) {
  auto out = map_t{};
  out.emplace("event_id", value_t{event.event_id});
  put_if_present(out, "timestamp", event.timestamp);
  if (event.level) {
    out.emplace("level", optional_level(event.level));
  }
  put_if_present(out, "platform", event.platform);
  put_if_present(out, "logger", event.logger);
  put_if_present(out, "server_name", event.server_name);
  put_if_present(out, "release", event.release);
  put_if_present(out, "environment", event.environment);
  put_if_present(out, "transaction", event.transaction);

  if (event.message) {
    out.emplace("message", value_t{truncate_utf8(*event.message,
                                                 kMaxMessageLength)});
  }
  if (event.fingerprint) {
    out.emplace("fingerprint", make_value(*event.fingerprint));
  }
  if (event.breadcrumbs) {
    out.emplace("breadcrumbs",
                render_list(*event.breadcrumbs,
                            [&](const breadcrumb_t& breadcrumb) {
                              return render_breadcrumb(breadcrumb, encoder);
                            }));
  }
  if (event.sdk) {
    out.emplace("sdk", render_sdk(*event.sdk));
  }
  if (event.request) {
    out.emplace("request", render_request(*event.request, encoder));
  }
  if (event.extra) {
    out.emplace("extra",
                sanitize_field(*event.extra, encoder, kEventFieldDepth));
  }
  if (event.user) {
    out.emplace("user",
                sanitize_field(*event.user, encoder, kEventFieldDepth));
  }
  if (event.tags) {
    out.emplace("tags",
                sanitize_field(*event.tags, encoder, kEventFieldDepth));
  }
  if (event.contexts) {
    out.emplace("contexts",
                sanitize_field(*event.contexts, encoder, kEventFieldDepth));
  }
  if (event.modules) {
    out.emplace("modules", make_value(*event.modules));
  }
  if (event.exception) {
    out.emplace("exception", render_list(*event.exception, render_exception));
  }
  return value_t{std::move(out)};
}

}  // namespace herald::client
