#include <herald/client/config.hpp>
#include <herald/common/critical.hpp>

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace herald::client {

void client_config::validate() const {
  if (std::isnan(sample_rate) || sample_rate < 0.0 || sample_rate > 1.0) {
    throw herald::common::configuration_error{fmt::format(
        "sample_rate must be a number in [0, 1], got {}", sample_rate)};
  }
  if (send_result == herald::schema::completion_mode_t::async) {
    throw herald::common::configuration_error{
        "the async completion mode is not supported anymore; spawn a thread "
        "that submits with the sync mode instead"};
  }
  if (before_send) {
    herald::client::validate(*before_send);
  }
  if (after_send) {
    herald::client::validate(*after_send);
  }
}

}  // namespace herald::client
