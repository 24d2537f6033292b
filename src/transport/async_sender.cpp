#include <herald/schema/send_result.hpp>
#include <herald/transport/async_sender.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>
#include <vector>

namespace herald::transport {

async_sender::async_sender(transport& delivery, const uint32_t retries)
    : transport_{delivery}, retries_{retries}, worker_{[this] { run(); }} {}

async_sender::~async_sender() {
  {
    auto lock = std::scoped_lock{mutex_};
    stopping_ = true;
  }
  queued_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void async_sender::send_async(herald::schema::value_t payload) {
  {
    auto lock = std::scoped_lock{mutex_};
    queue_.push_back(std::move(payload));
  }
  queued_.notify_one();
}

void async_sender::flush() {
  auto lock = std::unique_lock{mutex_};
  drained_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

void async_sender::run() {
  while (true) {
    auto lock = std::unique_lock{mutex_};
    queued_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
    if (queue_.empty()) {
      return;
    }
    auto payload = std::move(queue_.front());
    queue_.pop_front();
    ++in_flight_;
    lock.unlock();

    try {
      auto error = transport_.post(
          std::vector<herald::schema::value_t>{std::move(payload)}, retries_);
      if (error) {
        spdlog::warn("Dropping queued event: {}",
                     herald::schema::describe(
                         herald::schema::failed_t{.reason = *error}));
      }
    } catch (const std::exception& ex) {
      spdlog::error("Transport raised while sending queued event: {}",
                    ex.what());
    }

    lock.lock();
    --in_flight_;
    if (queue_.empty() && in_flight_ == 0) {
      drained_.notify_all();
    }
  }
}

}  // namespace herald::transport
