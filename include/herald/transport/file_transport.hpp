#pragma once

#include <herald/schema/encoding/json/encoder.hpp>
#include <herald/transport/transport.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace herald::transport {

/// Transport that appends each payload as one JSON line to a file. A batch
/// is written as one buffer and rolled back before it is retried.
///
/// An empty destination is reported as an invalid DSN, an unencodable
/// payload as invalid JSON, and I/O errors as request failures.
class file_transport final : public transport {
 public:
  explicit file_transport(std::filesystem::path destination);

  std::optional<herald::schema::send_error_t> post(
      const std::vector<herald::schema::value_t>& payloads,
      uint32_t retries) override;

  const std::filesystem::path& destination() const { return destination_; }

 private:
  /// Append one encoded batch. A write failing partway is truncated back
  /// so a retry never duplicates lines.
  std::optional<herald::schema::send_error_t> append_batch(
      const std::string& batch);

  void rollback(std::uintmax_t size);

  std::mutex mutex_;
  std::filesystem::path destination_;
  herald::schema::encoding::json_encoder_t encoder_;
};

}  // namespace herald::transport
