#include <herald/client/sampler.hpp>
#include <herald/common/critical.hpp>

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <random>

namespace herald::client {

random_source_t make_default_random_source() {
  return [] {
    thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto distribution = std::uniform_real_distribution<double>{0.0, 1.0};
    return distribution(engine);
  };
}

bool sample(const double rate, const random_source_t& random) {
  if (std::isnan(rate) || rate < 0.0 || rate > 1.0) {
    throw herald::common::configuration_error{
        fmt::format("sample rate must be a number in [0, 1], got {}", rate)};
  }
  if (rate == 1.0) {
    return true;
  }
  if (rate == 0.0) {
    return false;
  }
  if (!random) {
    throw herald::common::configuration_error{
        "a random source is required for sample rates between 0 and 1"};
  }
  return random() < rate;
}

}  // namespace herald::client
