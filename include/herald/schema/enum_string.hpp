#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Name tables for the enums that appear on the command line and in payloads.
// Each enum header defines a `k<Name>Mappings` table and specializes
// try_from_string/to_string on top of the lookups below.
namespace herald::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view name,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, name,
                              &std::pair<std::string_view, Enum>::first);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, value,
                              &std::pair<std::string_view, Enum>::second);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->first;
}

/// Comma separated list of accepted names, for error messages.
template <typename Enum, std::size_t N>
std::string joined_names(const enum_mappings_t<Enum, N>& mappings) {
  auto out = std::string{};
  for (const auto& mapping : mappings) {
    if (!out.empty()) {
      out.append(", ");
    }
    out.append(mapping.first);
  }
  return out;
}

/// Parse a name into `Enum`. Only the specializations next to each enum are
/// defined.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view name);

}  // namespace herald::schema
