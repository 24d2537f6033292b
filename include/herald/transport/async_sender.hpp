#pragma once

#include <herald/transport/transport.hpp>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

namespace herald::transport {

/// Sender draining a queue into a transport on one worker thread.
///
/// Pending payloads are delivered before the destructor returns. Failures
/// are logged at warn level and otherwise dropped.
class async_sender final : public sender {
 public:
  explicit async_sender(transport& delivery, uint32_t retries = 0);

  async_sender(const async_sender&) = delete;
  async_sender& operator=(const async_sender&) = delete;
  async_sender(async_sender&&) = delete;
  async_sender& operator=(async_sender&&) = delete;

  ~async_sender() override;

  void send_async(herald::schema::value_t payload) override;

  /// Block until every payload queued so far has been attempted.
  void flush();

 private:
  void run();

  transport& transport_;
  uint32_t retries_{};
  std::mutex mutex_;
  std::condition_variable queued_;
  std::condition_variable drained_;
  std::deque<herald::schema::value_t> queue_;
  std::size_t in_flight_{};
  bool stopping_{false};
  std::thread worker_;
};

}  // namespace herald::transport
