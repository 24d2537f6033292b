#include <herald/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <string_view>

namespace herald::schema {

namespace {

void append_inspect(const value_t& value, std::string& out);

void append_quoted(const std::string_view text, std::string& out) {
  out.push_back('"');
  for (const auto c : text) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

std::string inspect_object(const object_t& object) {
  try {
    return object.inspect();
  } catch (const std::exception& ex) {
    return fmt::format("#<{} (inspect failed: {})>", object.type_name(),
                       ex.what());
  }
}

void append_inspect(const value_t& value, std::string& out) {
  std::visit(
      overloaded{
          [&](const std::nullptr_t) { out.append("nil"); },
          [&](const bool v) { out.append(v ? "true" : "false"); },
          [&](const int64_t v) { out.append(std::to_string(v)); },
          [&](const double v) { out.append(fmt::format("{}", v)); },
          [&](const std::string& v) { append_quoted(v, out); },
          [&](const list_ptr_t& v) {
            out.push_back('[');
            auto first = true;
            for (const auto& item : *v) {
              if (!first) {
                out.append(", ");
              }
              first = false;
              append_inspect(item, out);
            }
            out.push_back(']');
          },
          [&](const map_ptr_t& v) {
            out.append("%{");
            auto first = true;
            for (const auto& [key, item] : *v) {
              if (!first) {
                out.append(", ");
              }
              first = false;
              append_quoted(key, out);
              out.append(" => ");
              append_inspect(item, out);
            }
            out.push_back('}');
          },
          [&](const object_ptr_t& v) {
            if (!v) {
              out.append("nil");
              return;
            }
            out.append(inspect_object(*v));
          }},
      value.data);
}

bool is_continuation_byte(const char c) {
  return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
}

}  // namespace

std::string object_t::inspect() const {
  return fmt::format("#<{}>", type_name());
}

bool is_nil(const value_t& value) {
  return std::holds_alternative<std::nullptr_t>(value.data);
}

bool is_scalar(const value_t& value) {
  return std::holds_alternative<std::nullptr_t>(value.data) ||
         std::holds_alternative<bool>(value.data) ||
         std::holds_alternative<int64_t>(value.data) ||
         std::holds_alternative<double>(value.data) ||
         std::holds_alternative<std::string>(value.data);
}

const std::string* as_string(const value_t& value) {
  return std::get_if<std::string>(&value.data);
}

const list_t* as_list(const value_t& value) {
  const auto* list = std::get_if<list_ptr_t>(&value.data);
  if (list == nullptr || !*list) {
    return nullptr;
  }
  return list->get();
}

const map_t* as_map(const value_t& value) {
  const auto* map = std::get_if<map_ptr_t>(&value.data);
  if (map == nullptr || !*map) {
    return nullptr;
  }
  return map->get();
}

value_t make_value(const string_map_t& map) {
  auto out = map_t{};
  for (const auto& [key, item] : map) {
    out.emplace(key, value_t{item});
  }
  return value_t{std::move(out)};
}

value_t make_value(const std::vector<std::string>& list) {
  auto out = list_t{};
  out.reserve(list.size());
  std::transform(std::begin(list), std::end(list), std::back_inserter(out),
                 [](const std::string& item) { return value_t{item}; });
  return value_t{std::move(out)};
}

std::string inspect(const value_t& value) {
  auto out = std::string{};
  append_inspect(value, out);
  return out;
}

std::string truncate_utf8(const std::string_view text,
                          const std::size_t max_characters) {
  auto characters = std::size_t{};
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_continuation_byte(text[i])) {
      continue;
    }
    if (characters == max_characters) {
      return std::string{text.substr(0, i)};
    }
    ++characters;
  }
  return std::string{text};
}

bool operator==(const value_t& lhs, const value_t& rhs) {
  if (lhs.data.index() != rhs.data.index()) {
    return false;
  }
  return std::visit(
      overloaded{
          [&](const list_ptr_t& left) {
            const auto& right = std::get<list_ptr_t>(rhs.data);
            if (left == right) {
              return true;
            }
            if (!left || !right) {
              return false;
            }
            return *left == *right;
          },
          [&](const map_ptr_t& left) {
            const auto& right = std::get<map_ptr_t>(rhs.data);
            if (left == right) {
              return true;
            }
            if (!left || !right) {
              return false;
            }
            return *left == *right;
          },
          [&](const double left) {
            const auto right = std::get<double>(rhs.data);
            return left == right || (std::isnan(left) && std::isnan(right));
          },
          [&](const auto& left) {
            return left == std::get<std::decay_t<decltype(left)>>(rhs.data);
          }},
      lhs.data);
}

}  // namespace herald::schema
