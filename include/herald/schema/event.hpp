#pragma once

#include <herald/schema/breadcrumb.hpp>
#include <herald/schema/event_source.hpp>
#include <herald/schema/exception.hpp>
#include <herald/schema/level.hpp>
#include <herald/schema/primitives.hpp>
#include <herald/schema/request.hpp>
#include <herald/schema/sdk.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: event.
// One error or message record to be reported. Everything but `event_id` is
// optional; `source`, `original_exception` and `attachments` are local
// bookkeeping and never rendered.
namespace herald::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string event_id;
  std::optional<std::string> timestamp;
  std::optional<level_t> level;
  std::optional<std::string> platform;
  std::optional<std::string> logger;
  std::optional<std::string> server_name;
  std::optional<std::string> release;
  std::optional<std::string> environment;
  std::optional<std::string> transaction;
  std::optional<std::string> message;
  std::optional<std::vector<std::string>> fingerprint;
  std::optional<std::vector<breadcrumb_t>> breadcrumbs;
  std::optional<sdk_t> sdk;
  std::optional<request_t> request;
  std::optional<map_t> extra;
  std::optional<map_t> tags;
  std::optional<map_t> user;
  std::optional<map_t> contexts;
  std::optional<string_map_t> modules;
  std::optional<std::vector<exception_t>> exception;

  event_source_t source{event_source_t::none};
  std::optional<std::string> original_exception;
  std::vector<std::string> attachments;
};

using event_t = event<1>;

/// Random 32 character lowercase hex identifier.
std::string make_event_id();

/// ISO-8601 UTC timestamp with second precision, e.g. 2024-05-01T12:00:00Z.
std::string make_timestamp(std::chrono::system_clock::time_point when =
                               std::chrono::system_clock::now());

/// Event with a fresh identifier, timestamp, platform and sdk.
event_t make_event();

}  // namespace herald::schema
