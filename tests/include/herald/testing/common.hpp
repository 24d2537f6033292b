#pragma once

#include <herald/schema/event.hpp>
#include <herald/schema/primitives.hpp>
#include <herald/schema/send_result.hpp>
#include <herald/transport/transport.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace herald::schema {

inline void PrintTo(const value_t& value, std::ostream* os) {
  *os << inspect(value);
}

}  // namespace herald::schema

namespace herald::testing {

/// Custom object with no encodable form.
class opaque_object final : public herald::schema::object_t {
 public:
  explicit opaque_object(std::string label) : label_{std::move(label)} {}

  std::string_view type_name() const override { return "opaque_object"; }

  std::string inspect() const override {
    return "#opaque_object<" + label_ + ">";
  }

 private:
  std::string label_;
};

/// Record type that knows how to encode itself.
class point_object final : public herald::schema::object_t {
 public:
  point_object(int x, int y) : x_{x}, y_{y} {}

  std::string_view type_name() const override { return "point_object"; }

  std::optional<herald::schema::value_t> to_value() const override {
    return herald::schema::value_t{herald::schema::map_t{
        {"x", herald::schema::value_t{x_}}, {"y", herald::schema::value_t{y_}}}};
  }

 private:
  int x_{};
  int y_{};
};

/// Object whose inspect() throws.
class broken_object final : public herald::schema::object_t {
 public:
  std::string_view type_name() const override { return "broken_object"; }

  std::string inspect() const override {
    throw std::runtime_error{"inspect exploded"};
  }
};

inline herald::schema::value_t make_opaque(std::string label) {
  return herald::schema::value_t{herald::schema::object_ptr_t{
      std::make_shared<const opaque_object>(std::move(label))}};
}

inline herald::schema::value_t make_point(int x, int y) {
  return herald::schema::value_t{
      herald::schema::object_ptr_t{std::make_shared<const point_object>(x, y)}};
}

/// Encoder wrapper counting how often the sanitizer consults it.
template <typename Encoder>
struct counting_encoder final {
  static constexpr auto kMaxDepth = Encoder::kMaxDepth;

  std::optional<std::string> try_encode(const herald::schema::value_t& value,
                                        std::string& error,
                                        const std::size_t depth = 0) {
    ++calls;
    return inner.try_encode(value, error, depth);
  }

  Encoder inner{};
  std::size_t calls{};
};

/// Transport recording every batch it is given.
class recording_transport final : public herald::transport::transport {
 public:
  std::optional<herald::schema::send_error_t> post(
      const std::vector<herald::schema::value_t>& payloads,
      const uint32_t retries) override {
    batches.push_back(payloads);
    last_retries = retries;
    if (throw_message) {
      throw std::runtime_error{*throw_message};
    }
    return next_error;
  }

  std::vector<std::vector<herald::schema::value_t>> batches;
  uint32_t last_retries{};
  std::optional<herald::schema::send_error_t> next_error;
  std::optional<std::string> throw_message;
};

/// Sender keeping payloads in memory.
class recording_sender final : public herald::transport::sender {
 public:
  void send_async(herald::schema::value_t payload) override {
    payloads.push_back(std::move(payload));
  }

  std::vector<herald::schema::value_t> payloads;
};

/// Random source replaying fixed draws, wrapping around.
inline std::function<double()> make_sequence(std::vector<double> draws) {
  auto index = std::make_shared<std::size_t>(0);
  return [draws = std::move(draws), index] {
    auto draw = draws[*index % draws.size()];
    ++*index;
    return draw;
  };
}

inline herald::schema::event_t make_test_event(
    const std::string_view message = "boom") {
  auto event = herald::schema::event_t{};
  event.event_id = "0123456789abcdef0123456789abcdef";
  event.message = std::string{message};
  return event;
}

inline const herald::schema::value_t& field(const herald::schema::value_t& map,
                                            const std::string& key) {
  const auto* fields = herald::schema::as_map(map);
  if (fields == nullptr) {
    throw std::logic_error{"value is not a map"};
  }
  return fields->at(key);
}

inline bool has_field(const herald::schema::value_t& map,
                      const std::string& key) {
  const auto* fields = herald::schema::as_map(map);
  return fields != nullptr && fields->contains(key);
}

inline std::filesystem::path make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (std::string{prefix} + "_" +
          std::to_string(static_cast<unsigned long long>(now)));
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace herald::testing
