#pragma once
#include <herald/schema/encoding/encoder.hpp>
#include <herald/schema/primitives.hpp>

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <optional>
#include <string>

namespace herald::schema::encoding {

struct json_encoder_tag {};

/// JSON encoder backed by protobuf's `google.protobuf.Value` and its JSON
/// printer.
///
/// Objects without an encodable form, non-finite numbers and trees nested
/// deeper than `kMaxDepth` fail to encode.
template <>
struct encoder<json_encoder_tag> final {
  static constexpr std::size_t kMaxDepth = 128;

  /// Encode `value` as if nested `depth` levels deep, so a subtree can be
  /// checked against the limit of the document it will end up in.
  std::optional<std::string> try_encode(const herald::schema::value_t& value,
                                        std::string& error,
                                        std::size_t depth = 0);

  /// Convert `value` into `out`. Returns false and sets `error` on failure.
  bool to_protobuf(const herald::schema::value_t& value,
                   google::protobuf::Value& out,
                   std::string& error,
                   std::size_t depth = 0);
};

using json_encoder_t = encoder<json_encoder_tag>;

}  // namespace herald::schema::encoding
