#pragma once

#include <herald/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event level.
namespace herald::schema {

enum class level_t : uint8_t {
  debug = 0,
  info = 1,
  warning = 2,
  error = 3,
  fatal = 4,
};

inline constexpr auto kLevelMappings = std::array{
    std::pair<std::string_view, level_t>{"debug", level_t::debug},
    std::pair<std::string_view, level_t>{"info", level_t::info},
    std::pair<std::string_view, level_t>{"warning", level_t::warning},
    std::pair<std::string_view, level_t>{"error", level_t::error},
    std::pair<std::string_view, level_t>{"fatal", level_t::fatal}};

template <>
inline std::optional<level_t> try_from_string<level_t>(
    const std::string_view value) {
  return from_string(value, kLevelMappings);
}

inline constexpr std::string_view to_string(const level_t value) {
  return to_string(value, kLevelMappings).value_or("unknown");
}

}  // namespace herald::schema
