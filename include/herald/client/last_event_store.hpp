#pragma once

#include <herald/schema/event_source.hpp>

#include <mutex>
#include <optional>
#include <string>

namespace herald::client {

/// Identifier and source of the last event handed to the transport.
///
/// Single slot, last writer wins. Advisory only: concurrent submissions may
/// overwrite each other in any order.
class last_event_store final {
 public:
  struct entry_t final {
    std::string event_id;
    herald::schema::event_source_t source{herald::schema::event_source_t::none};
  };

  void put(std::string event_id, herald::schema::event_source_t source);

  std::optional<entry_t> get() const;

  void clear();

 private:
  mutable std::mutex mutex_;
  std::optional<entry_t> entry_;
};

}  // namespace herald::client
