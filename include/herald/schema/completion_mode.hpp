#pragma once

#include <herald/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: completion mode.
// How a submission waits for the transport: `sync` blocks for the response,
// `none` hands off and returns at once, `async` is retired and rejected.
namespace herald::schema {

enum class completion_mode_t : uint8_t { sync = 0, none = 1, async = 2 };

inline constexpr auto kCompletionModeMappings = std::array{
    std::pair<std::string_view, completion_mode_t>{"sync",
                                                   completion_mode_t::sync},
    std::pair<std::string_view, completion_mode_t>{"none",
                                                   completion_mode_t::none},
    std::pair<std::string_view, completion_mode_t>{"async",
                                                   completion_mode_t::async}};

template <>
inline std::optional<completion_mode_t> try_from_string<completion_mode_t>(
    const std::string_view value) {
  return from_string(value, kCompletionModeMappings);
}

inline constexpr std::string_view to_string(const completion_mode_t value) {
  return to_string(value, kCompletionModeMappings).value_or("unknown");
}

}  // namespace herald::schema
