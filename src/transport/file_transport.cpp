#include <herald/transport/file_transport.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <ios>
#include <system_error>
#include <utility>

namespace herald::transport {

file_transport::file_transport(std::filesystem::path destination)
    : destination_{std::move(destination)} {}

std::optional<herald::schema::send_error_t> file_transport::post(
    const std::vector<herald::schema::value_t>& payloads,
    const uint32_t retries) {
  if (destination_.empty()) {
    return herald::schema::invalid_dsn_t{};
  }

  auto batch = std::string{};
  for (const auto& payload : payloads) {
    auto error = std::string{};
    auto encoded = encoder_.try_encode(payload, error);
    if (!encoded) {
      return herald::schema::invalid_json_t{.error = std::move(error)};
    }
    batch.append(*encoded);
    batch.push_back('\n');
  }

  auto last_error = std::optional<herald::schema::send_error_t>{};
  for (uint32_t attempt = 0; attempt <= retries; ++attempt) {
    last_error = append_batch(batch);
    if (!last_error) {
      return std::nullopt;
    }
    spdlog::debug("Attempt {} of {} writing to '{}' failed", attempt + 1,
                  retries + 1, destination_.string());
  }
  return last_error;
}

std::optional<herald::schema::send_error_t> file_transport::append_batch(
    const std::string& batch) {
  auto lock = std::scoped_lock{mutex_};
  auto size_error = std::error_code{};
  auto previous_size = std::filesystem::file_size(destination_, size_error);
  if (size_error) {
    previous_size = 0;
  }
  try {
    auto output = std::ofstream{};
    output.exceptions(std::ios::badbit);
    output.open(destination_, std::ios::app | std::ios::binary);
    if (!output.is_open()) {
      return herald::schema::request_failure_t{
          .last_error = "cannot open " + destination_.string()};
    }
    output.write(batch.data(), static_cast<std::streamsize>(batch.size()));
    output.flush();
    return std::nullopt;
  } catch (const std::ios_base::failure& ex) {
    rollback(previous_size);
    return herald::schema::request_failure_t{
        .last_error = herald::schema::fault_t{
            .kind = "std::ios_base::failure",
            .message = ex.what(),
            .trace = {ex.code().message()}}};
  }
}

void file_transport::rollback(const std::uintmax_t size) {
  auto error = std::error_code{};
  std::filesystem::resize_file(destination_, size, error);
  if (error) {
    spdlog::warn("Cannot truncate '{}' back to {} bytes: {}",
                 destination_.string(), size, error.message());
  }
}

}  // namespace herald::transport
