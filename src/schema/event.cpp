#include <herald/schema/event.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <ctime>
#include <random>

namespace herald::schema {

std::string make_event_id() {
  thread_local auto engine = std::mt19937_64{std::random_device{}()};
  auto distribution = std::uniform_int_distribution<uint64_t>{};
  return fmt::format("{:016x}{:016x}", distribution(engine),
                     distribution(engine));
}

std::string make_timestamp(const std::chrono::system_clock::time_point when) {
  const auto seconds = std::chrono::system_clock::to_time_t(when);
  auto utc = std::tm{};
  gmtime_r(&seconds, &utc);
  auto buffer = std::array<char, 32>{};
  const auto written =
      std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string{buffer.data(), written};
}

event_t make_event() {
  auto event = event_t{};
  event.event_id = make_event_id();
  event.timestamp = make_timestamp();
  event.platform = "native";
  event.sdk = sdk_t{};
  return event;
}

}  // namespace herald::schema
