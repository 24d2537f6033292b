#pragma once

#include <herald/schema/level.hpp>
#include <herald/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: breadcrumb.
// Trail entry recorded before the event; `data` is free-form.
namespace herald::schema {

template <uint16_t Version>
struct breadcrumb;

template <>
struct breadcrumb<1> final {
  uint16_t version{1};
  std::optional<std::string> type;
  std::optional<std::string> category;
  std::optional<std::string> message;
  std::optional<map_t> data;
  std::optional<level_t> level;
  std::optional<std::string> timestamp;
};

using breadcrumb_t = breadcrumb<1>;

}  // namespace herald::schema
