#pragma once

#include <herald/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: exception.
// One entry of the event's exception chain with an optional stack trace.
namespace herald::schema {

template <uint16_t Version>
struct frame;

template <>
struct frame<1> final {
  uint16_t version{1};
  std::optional<std::string> function;
  std::optional<std::string> module;
  std::optional<std::string> filename;
  std::optional<std::string> abs_path;
  std::optional<int64_t> lineno;
  std::optional<std::string> context_line;
  std::vector<std::string> pre_context;
  std::vector<std::string> post_context;
  std::optional<bool> in_app;
  string_map_t vars;
};

using frame_t = frame<1>;

template <uint16_t Version>
struct stacktrace;

template <>
struct stacktrace<1> final {
  uint16_t version{1};
  std::vector<frame_t> frames;
};

using stacktrace_t = stacktrace<1>;

template <uint16_t Version>
struct mechanism;

template <>
struct mechanism<1> final {
  uint16_t version{1};
  std::string type{"generic"};
  bool handled{true};
};

using mechanism_t = mechanism<1>;

template <uint16_t Version>
struct exception;

template <>
struct exception<1> final {
  uint16_t version{1};
  std::string type;
  std::optional<std::string> value;
  std::optional<std::string> module;
  std::optional<std::string> thread_id;
  std::optional<mechanism_t> mechanism;
  std::optional<stacktrace_t> stacktrace;
};

using exception_t = exception<1>;

}  // namespace herald::schema
