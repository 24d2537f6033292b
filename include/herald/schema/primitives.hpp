#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace herald::schema {

struct value_t;
class object_t;

using list_t = std::vector<value_t>;
using map_t = std::map<std::string, value_t>;
using list_ptr_t = std::shared_ptr<const list_t>;
using map_ptr_t = std::shared_ptr<const map_t>;
using object_ptr_t = std::shared_ptr<const object_t>;
using string_map_t = std::map<std::string, std::string>;

/// Node of a free-form value tree (extra, user, tags, contexts, ...).
///
/// Lists and maps are immutable and shared, so copying a value never copies
/// its children and an untouched subtree keeps its identity.
struct value_t final {
  using variant_t = std::variant<std::nullptr_t,
                                 bool,
                                 int64_t,
                                 double,
                                 std::string,
                                 list_ptr_t,
                                 map_ptr_t,
                                 object_ptr_t>;

  value_t() = default;
  value_t(std::nullptr_t) {}
  value_t(bool value) : data{value} {}
  value_t(int value) : data{int64_t{value}} {}
  value_t(int64_t value) : data{value} {}
  value_t(double value) : data{value} {}
  value_t(const char* value) : data{std::string{value}} {}
  value_t(std::string value) : data{std::move(value)} {}
  value_t(std::string_view value) : data{std::string{value}} {}
  value_t(list_t value)
      : data{std::make_shared<const list_t>(std::move(value))} {}
  value_t(map_t value)
      : data{std::make_shared<const map_t>(std::move(value))} {}
  value_t(list_ptr_t value) : data{std::move(value)} {}
  value_t(map_ptr_t value) : data{std::move(value)} {}
  value_t(object_ptr_t value) : data{std::move(value)} {}

  variant_t data{};
};

/// User type carried inside a value tree.
///
/// The encoder asks `to_value()` for an encodable form; objects returning
/// std::nullopt cannot be encoded and are replaced by `inspect()` text when
/// sanitized.
class object_t {
 public:
  virtual ~object_t() = default;

  virtual std::string_view type_name() const = 0;

  virtual std::optional<value_t> to_value() const { return std::nullopt; }

  /// Best-effort human-readable rendering. The format is not stable.
  virtual std::string inspect() const;
};

bool is_nil(const value_t& value);
bool is_scalar(const value_t& value);

const std::string* as_string(const value_t& value);
const list_t* as_list(const value_t& value);
const map_t* as_map(const value_t& value);

value_t make_value(const string_map_t& map);
value_t make_value(const std::vector<std::string>& list);

/// Debug-style rendering of any value; never throws for well-formed trees.
std::string inspect(const value_t& value);

/// Prefix of `text` holding at most `max_characters` UTF-8 code points.
std::string truncate_utf8(std::string_view text, std::size_t max_characters);

bool operator==(const value_t& lhs, const value_t& rhs);

}  // namespace herald::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
