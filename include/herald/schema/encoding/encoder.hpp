#pragma once
#include <herald/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace herald::schema::encoding {

// The wire format is a build time choice: callers name the library through
// the tag and there is no runtime registry.
template <typename Library>
struct encoder {
  /// Encode `value`, or return std::nullopt and describe the failure in
  /// `error`. `depth` is the nesting level `value` will occupy inside the
  /// final document. Never throws for a well-formed tree.
  std::optional<std::string> try_encode(const herald::schema::value_t& value,
                                        std::string& error,
                                        std::size_t depth = 0);
};

}  // namespace herald::schema::encoding
