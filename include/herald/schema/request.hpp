#pragma once

#include <herald/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: request.
// HTTP request context of the event. Unset members are dropped on render.
namespace herald::schema {

template <uint16_t Version>
struct request;

template <>
struct request<1> final {
  uint16_t version{1};
  std::optional<std::string> method;
  std::optional<std::string> url;
  std::optional<std::string> query_string;
  std::optional<std::string> cookies;
  std::optional<value_t> data;
  std::optional<string_map_t> headers;
  std::optional<string_map_t> env;
};

using request_t = request<1>;

}  // namespace herald::schema
