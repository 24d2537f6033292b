#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <herald/client/client.hpp>
#include <herald/common/critical.hpp>
#include <herald/schema/completion_mode.hpp>
#include <herald/schema/encoding/json/encoder.hpp>
#include <herald/schema/event.hpp>
#include <herald/schema/level.hpp>
#include <herald/transport/async_sender.hpp>
#include <herald/transport/file_transport.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace {

namespace po = boost::program_options;

herald::schema::map_t parse_pairs(const std::vector<std::string>& pairs,
                                  const std::string_view option) {
  auto out = herald::schema::map_t{};
  for (const auto& pair : pairs) {
    auto separator = pair.find('=');
    if (separator == std::string::npos || separator == 0) {
      herald::common::critical(
          fmt::format("--{} expects key=value, got '{}'", option, pair));
    }
    out.insert_or_assign(pair.substr(0, separator),
                         herald::schema::value_t{pair.substr(separator + 1)});
  }
  return out;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);
  auto logger = std::make_shared<spdlog::logger>(
      "herald", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  spdlog::set_default_logger(logger);

  auto message = std::string{};
  auto level = std::string{};
  auto mode = std::string{};
  auto output = std::string{};
  auto sample_rate = 1.0;
  auto retries = uint32_t{};
  auto extras = std::vector<std::string>{};
  auto tags = std::vector<std::string>{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"herald_send"};
  description.add_options()("help,h", "Show the help message")(
      "message,m", po::value<std::string>(&message)->required(),
      "Event message")(
      "level,l", po::value<std::string>(&level)->default_value("error"),
      "Event level: debug, info, warning, error or fatal")(
      "extra,e", po::value<std::vector<std::string>>(&extras)->composing(),
      "Extra entry as key=value, repeatable")(
      "tag,t", po::value<std::vector<std::string>>(&tags)->composing(),
      "Tag as key=value, repeatable")(
      "mode", po::value<std::string>(&mode)->default_value("sync"),
      "Completion mode: sync or none")(
      "sample-rate", po::value<double>(&sample_rate)->default_value(1.0),
      "Probability in [0, 1] that the event is sent")(
      "retries", po::value<uint32_t>(&retries)->default_value(4),
      "Delivery attempts after the first failure")(
      "output,o", po::value<std::string>(&output)->default_value(""),
      "File receiving one JSON line per delivered event")(
      "render", "Print the rendered payload instead of sending it")(
      "verbose,v", "Enable debug logging");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 2;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto parsed_level = herald::schema::try_from_string<herald::schema::level_t>(level);
  if (!parsed_level) {
    herald::common::critical(
        fmt::format("unknown level '{}', expected one of {}", level,
                    herald::schema::joined_names(herald::schema::kLevelMappings)));
  }
  auto parsed_mode =
      herald::schema::try_from_string<herald::schema::completion_mode_t>(mode);
  if (!parsed_mode) {
    herald::common::critical(fmt::format(
        "unknown mode '{}', expected one of {}", mode,
        herald::schema::joined_names(herald::schema::kCompletionModeMappings)));
  }

  auto event = herald::schema::make_event();
  event.source = herald::schema::event_source_t::manual;
  event.level = *parsed_level;
  event.message = message;
  if (!extras.empty()) {
    event.extra = parse_pairs(extras, "extra");
  }
  if (!tags.empty()) {
    event.tags = parse_pairs(tags, "tag");
  }

  auto config = herald::client::client_config{};
  config.sample_rate = sample_rate;
  config.send_result = *parsed_mode;
  config.request_retries = retries;
  config.log_level = spdlog::level::err;

  auto encoder = herald::schema::encoding::json_encoder_t{};
  auto transport = herald::transport::file_transport{output};
  auto sender = herald::transport::async_sender{transport, retries};
  auto last_event = herald::client::last_event_store{};

  try {
    auto client = herald::client::client{config, encoder, transport, &sender,
                                         last_event};
    if (vm.contains("render")) {
      auto error = std::string{};
      auto encoded = encoder.try_encode(client.render_event(event), error);
      if (!encoded) {
        spdlog::error("Unable to encode rendered event: {}", error);
        return 1;
      }
      std::cout << *encoded << std::endl;
      return 0;
    }

    auto result = client.send_event(event);
    sender.flush();
    spdlog::info("{}", herald::schema::describe(result));
    if (std::holds_alternative<herald::schema::failed_t>(result)) {
      return 1;
    }
  } catch (const herald::common::configuration_error& ex) {
    herald::common::critical(ex.what());
  }

  spdlog::shutdown();
  return 0;
}
