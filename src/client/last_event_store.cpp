#include <herald/client/last_event_store.hpp>

#include <utility>

namespace herald::client {

void last_event_store::put(std::string event_id,
                           const herald::schema::event_source_t source) {
  auto lock = std::scoped_lock{mutex_};
  entry_ = entry_t{.event_id = std::move(event_id), .source = source};
}

std::optional<last_event_store::entry_t> last_event_store::get() const {
  auto lock = std::scoped_lock{mutex_};
  return entry_;
}

void last_event_store::clear() {
  auto lock = std::scoped_lock{mutex_};
  entry_.reset();
}

}  // namespace herald::client
