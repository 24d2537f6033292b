#include <herald/schema/primitives.hpp>
#include <herald/schema/send_result.hpp>

#include <spdlog/fmt/fmt.h>

namespace herald::schema {

std::string format_fault(const fault_t& fault) {
  auto out = fmt::format("** ({}) {}", fault.kind, fault.message);
  for (const auto& line : fault.trace) {
    out.append("\n    ");
    out.append(line);
  }
  return out;
}

std::string describe(const send_result_t& result) {
  return std::visit(
      overloaded{
          [](const accepted_t& accepted) {
            if (accepted.event_id.empty()) {
              return std::string{"accepted"};
            }
            return fmt::format("accepted {}", accepted.event_id);
          },
          [](const unsampled_t&) { return std::string{"unsampled"}; },
          [](const excluded_t&) { return std::string{"excluded"}; },
          [](const failed_t& failed) {
            return std::visit(
                overloaded{
                    [](const invalid_dsn_t&) {
                      return std::string{"failed: invalid dsn"};
                    },
                    [](const invalid_json_t& error) {
                      return fmt::format("failed: invalid json ({})",
                                         error.error);
                    },
                    [](const request_failure_t& error) {
                      return std::visit(
                          overloaded{[](const std::string& reason) {
                                       return fmt::format(
                                           "failed: request failure ({})",
                                           reason);
                                     },
                                     [](const fault_t& fault) {
                                       return fmt::format(
                                           "failed: request failure ({}: {})",
                                           fault.kind, fault.message);
                                     }},
                          error.last_error);
                    }},
                failed.reason);
          }},
      result);
}

}  // namespace herald::schema
