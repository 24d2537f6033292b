#pragma once

#include <string>
#include <variant>
#include <vector>

// Schema type: send result.
// Outcome of one submission. Exactly one alternative is produced per call.
namespace herald::schema {

/// Event handed to the transport. `event_id` is empty for fire-and-forget
/// submissions, where no confirmation exists.
struct accepted_t final {
  std::string event_id;
};

/// Dropped by sampling.
struct unsampled_t final {};

/// Dropped by the before-send hook.
struct excluded_t final {};

struct invalid_dsn_t final {};

struct invalid_json_t final {
  std::string error;
};

/// Exception caught while talking to the destination, with the trace that
/// was captured alongside it.
struct fault_t final {
  std::string kind;
  std::string message;
  std::vector<std::string> trace;
};

struct request_failure_t final {
  std::variant<std::string, fault_t> last_error;
};

using send_error_t =
    std::variant<invalid_dsn_t, invalid_json_t, request_failure_t>;

struct failed_t final {
  send_error_t reason;
};

using send_result_t =
    std::variant<accepted_t, unsampled_t, excluded_t, failed_t>;

/// Multi-line rendering of a fault: header line followed by the trace.
std::string format_fault(const fault_t& fault);

/// Short description for diagnostics and the command-line tool.
std::string describe(const send_result_t& result);

}  // namespace herald::schema
