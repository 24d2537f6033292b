#include <herald/schema/encoding/json/encoder.hpp>

#include <google/protobuf/util/json_util.h>
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <exception>

namespace herald::schema::encoding {

std::optional<std::string> encoder<json_encoder_tag>::try_encode(
    const herald::schema::value_t& value,
    std::string& error,
    const std::size_t depth) {
  auto message = google::protobuf::Value{};
  if (!to_protobuf(value, message, error, depth)) {
    return std::nullopt;
  }

  auto encoded = std::string{};
  auto status = google::protobuf::util::MessageToJsonString(message, &encoded);
  if (!status.ok()) {
    error = status.ToString();
    return std::nullopt;
  }
  return encoded;
}

bool encoder<json_encoder_tag>::to_protobuf(
    const herald::schema::value_t& value,
    google::protobuf::Value& out,
    std::string& error,
    const std::size_t depth) {
  if (depth > kMaxDepth) {
    error = fmt::format("value nested deeper than {} levels", kMaxDepth);
    return false;
  }

  return std::visit(
      overloaded{
          [&](const std::nullptr_t) {
            out.set_null_value(google::protobuf::NULL_VALUE);
            return true;
          },
          [&](const bool v) {
            out.set_bool_value(v);
            return true;
          },
          [&](const int64_t v) {
            out.set_number_value(static_cast<double>(v));
            return true;
          },
          [&](const double v) {
            if (!std::isfinite(v)) {
              error = fmt::format("cannot encode non-finite number {}", v);
              return false;
            }
            out.set_number_value(v);
            return true;
          },
          [&](const std::string& v) {
            out.set_string_value(v);
            return true;
          },
          [&](const herald::schema::list_ptr_t& v) {
            auto* list = out.mutable_list_value();
            if (!v) {
              return true;
            }
            for (const auto& item : *v) {
              if (!to_protobuf(item, *list->add_values(), error, depth + 1)) {
                return false;
              }
            }
            return true;
          },
          [&](const herald::schema::map_ptr_t& v) {
            auto* fields = out.mutable_struct_value()->mutable_fields();
            if (!v) {
              return true;
            }
            for (const auto& [key, item] : *v) {
              if (!to_protobuf(item, (*fields)[key], error, depth + 1)) {
                return false;
              }
            }
            return true;
          },
          [&](const herald::schema::object_ptr_t& v) {
            if (!v) {
              out.set_null_value(google::protobuf::NULL_VALUE);
              return true;
            }
            auto encodable = std::optional<herald::schema::value_t>{};
            try {
              encodable = v->to_value();
            } catch (const std::exception& ex) {
              error = fmt::format("{} failed to convert: {}", v->type_name(),
                                  ex.what());
              return false;
            }
            if (!encodable) {
              error = fmt::format("unsupported type {}", v->type_name());
              return false;
            }
            return to_protobuf(*encodable, out, error, depth + 1);
          }},
      value.data);
}

}  // namespace herald::schema::encoding
