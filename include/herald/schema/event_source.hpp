#pragma once

#include <herald/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event source.
// Origin of an event. Events produced by the logging integration are tagged
// `logger` so delivery failures about them are never logged again.
namespace herald::schema {

enum class event_source_t : uint8_t { none = 0, logger = 1, manual = 2 };

inline constexpr auto kEventSourceMappings = std::array{
    std::pair<std::string_view, event_source_t>{"none", event_source_t::none},
    std::pair<std::string_view, event_source_t>{"logger",
                                                event_source_t::logger},
    std::pair<std::string_view, event_source_t>{"manual",
                                                event_source_t::manual}};

template <>
inline std::optional<event_source_t> try_from_string<event_source_t>(
    const std::string_view value) {
  return from_string(value, kEventSourceMappings);
}

inline constexpr std::string_view to_string(const event_source_t value) {
  return to_string(value, kEventSourceMappings).value_or("unknown");
}

}  // namespace herald::schema
