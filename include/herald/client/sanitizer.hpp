#pragma once

#include <herald/schema/primitives.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace herald::client {

/// Result of sanitizing one value. When `changed` is false, `value` shares
/// every list and map with the input.
struct sanitized_t final {
  herald::schema::value_t value;
  bool changed{false};
};

/// Replace every value `encoder` cannot encode with its inspect() text.
///
/// Finite scalars are returned as is without consulting the encoder;
/// non-finite doubles become text. Lists and maps are walked recursively and
/// copied only when one of their children changed; a copy keeps positions,
/// order and keys of the original. A non-empty container whose children
/// would sit deeper than `Encoder::kMaxDepth` is replaced by its text as a
/// whole. Objects are trial-encoded at their depth and degrade to text on
/// failure. Never throws.
///
/// `depth` is the nesting level of `value` inside the payload it is copied
/// into. `Encoder` provides `kMaxDepth` and
/// `std::optional<std::string> try_encode(const value_t&, std::string&,
/// std::size_t depth)`.
template <typename Encoder>
sanitized_t sanitize(const herald::schema::value_t& value,
                     Encoder& encoder,
                     std::size_t depth = 0);

namespace detail {

inline sanitized_t as_text(const herald::schema::value_t& value) {
  return sanitized_t{
      .value = herald::schema::value_t{herald::schema::inspect(value)},
      .changed = true};
}

}  // namespace detail

template <typename Encoder>
sanitized_t sanitize_list(const herald::schema::list_ptr_t& list,
                          Encoder& encoder,
                          const std::size_t depth = 0) {
  if (!list) {
    return sanitized_t{.value = herald::schema::value_t{list}};
  }
  if (!list->empty() && depth >= Encoder::kMaxDepth) {
    spdlog::debug("Replacing list nested {} levels deep in event payload",
                  depth);
    return detail::as_text(herald::schema::value_t{list});
  }

  auto updated = std::shared_ptr<herald::schema::list_t>{};
  for (std::size_t i = 0; i < list->size(); ++i) {
    auto item = sanitize((*list)[i], encoder, depth + 1);
    if (!item.changed) {
      continue;
    }
    if (!updated) {
      updated = std::make_shared<herald::schema::list_t>(*list);
    }
    (*updated)[i] = std::move(item.value);
  }

  if (!updated) {
    return sanitized_t{.value = herald::schema::value_t{list}};
  }
  return sanitized_t{
      .value = herald::schema::value_t{herald::schema::list_ptr_t{updated}},
      .changed = true};
}

template <typename Encoder>
sanitized_t sanitize_map(const herald::schema::map_ptr_t& map,
                         Encoder& encoder,
                         const std::size_t depth = 0) {
  if (!map) {
    return sanitized_t{.value = herald::schema::value_t{map}};
  }
  if (!map->empty() && depth >= Encoder::kMaxDepth) {
    spdlog::debug("Replacing map nested {} levels deep in event payload",
                  depth);
    return detail::as_text(herald::schema::value_t{map});
  }

  auto updated = std::shared_ptr<herald::schema::map_t>{};
  for (const auto& [key, item] : *map) {
    auto sanitized = sanitize(item, encoder, depth + 1);
    if (!sanitized.changed) {
      continue;
    }
    if (!updated) {
      updated = std::make_shared<herald::schema::map_t>(*map);
    }
    updated->insert_or_assign(key, std::move(sanitized.value));
  }

  if (!updated) {
    return sanitized_t{.value = herald::schema::value_t{map}};
  }
  return sanitized_t{
      .value = herald::schema::value_t{herald::schema::map_ptr_t{updated}},
      .changed = true};
}

template <typename Encoder>
sanitized_t sanitize(const herald::schema::value_t& value,
                     Encoder& encoder,
                     const std::size_t depth) {
  if (const auto* number = std::get_if<double>(&value.data)) {
    if (!std::isfinite(*number)) {
      return detail::as_text(value);
    }
    return sanitized_t{.value = value};
  }
  if (herald::schema::is_scalar(value)) {
    return sanitized_t{.value = value};
  }
  if (const auto* list = std::get_if<herald::schema::list_ptr_t>(&value.data)) {
    return sanitize_list(*list, encoder, depth);
  }
  if (const auto* map = std::get_if<herald::schema::map_ptr_t>(&value.data)) {
    return sanitize_map(*map, encoder, depth);
  }

  auto error = std::string{};
  if (encoder.try_encode(value, error, depth)) {
    return sanitized_t{.value = value};
  }
  spdlog::debug("Replacing unencodable value in event payload: {}", error);
  return detail::as_text(value);
}

/// Sanitize a free-form map field sitting `depth` levels deep in the
/// payload, returning it as a value.
template <typename Encoder>
herald::schema::value_t sanitize_field(const herald::schema::map_t& field,
                                       Encoder& encoder,
                                       const std::size_t depth = 0) {
  return sanitize_map(std::make_shared<const herald::schema::map_t>(field),
                      encoder, depth)
      .value;
}

}  // namespace herald::client
