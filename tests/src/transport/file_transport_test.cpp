#include <gtest/gtest.h>
#include <herald/testing/common.hpp>
#include <herald/transport/file_transport.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <variant>
#include <vector>

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
  auto input = std::ifstream{path};
  auto out = std::vector<std::string>{};
  auto line = std::string{};
  while (std::getline(input, line)) {
    out.push_back(line);
  }
  return out;
}

}  // namespace

TEST(file_transport, empty_destination_is_invalid_dsn) {
  auto transport = herald::transport::file_transport{""};
  auto error = transport.post(
      {herald::schema::value_t{herald::schema::map_t{}}}, 0);
  ASSERT_TRUE(error.has_value());
  EXPECT_TRUE(std::holds_alternative<herald::schema::invalid_dsn_t>(*error));
}

TEST(file_transport, appends_one_json_line_per_payload) {
  auto path = herald::testing::make_temp_path("herald_file_transport");
  auto transport = herald::transport::file_transport{path};

  auto first = transport.post(
      {herald::schema::value_t{herald::schema::map_t{
          {"event_id", herald::schema::value_t{"a"}}}}},
      0);
  auto second = transport.post(
      {herald::schema::value_t{herald::schema::map_t{
          {"event_id", herald::schema::value_t{"b"}}}}},
      0);

  EXPECT_FALSE(first.has_value());
  EXPECT_FALSE(second.has_value());
  auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("\"a\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"b\""), std::string::npos);
  herald::testing::remove_path(path);
}

TEST(file_transport, unencodable_payload_is_invalid_json) {
  auto path = herald::testing::make_temp_path("herald_file_transport");
  auto transport = herald::transport::file_transport{path};

  auto error = transport.post(
      {herald::schema::value_t{herald::schema::map_t{
          {"ratio",
           herald::schema::value_t{std::numeric_limits<double>::quiet_NaN()}}}}},
      2);

  ASSERT_TRUE(error.has_value());
  ASSERT_TRUE(std::holds_alternative<herald::schema::invalid_json_t>(*error));
  EXPECT_FALSE(std::get<herald::schema::invalid_json_t>(*error).error.empty());
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(file_transport, unwritable_destination_is_request_failure) {
  auto path = herald::testing::make_temp_path("herald_file_transport_dir");
  std::filesystem::create_directories(path);
  auto transport = herald::transport::file_transport{path};

  auto error = transport.post(
      {herald::schema::value_t{herald::schema::map_t{}}}, 1);

  ASSERT_TRUE(error.has_value());
  EXPECT_TRUE(
      std::holds_alternative<herald::schema::request_failure_t>(*error));
  herald::testing::remove_path(path);
}

TEST(file_transport, batch_is_written_once_in_order) {
  auto path = herald::testing::make_temp_path("herald_file_transport");
  auto transport = herald::transport::file_transport{path};

  auto error = transport.post(
      {herald::schema::value_t{herald::schema::map_t{
           {"n", herald::schema::value_t{1}}}},
       herald::schema::value_t{herald::schema::map_t{
           {"n", herald::schema::value_t{2}}}},
       herald::schema::value_t{herald::schema::map_t{
           {"n", herald::schema::value_t{3}}}}},
      3);

  EXPECT_FALSE(error.has_value());
  auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "{\"n\":1}");
  EXPECT_EQ(lines[1], "{\"n\":2}");
  EXPECT_EQ(lines[2], "{\"n\":3}");
  herald::testing::remove_path(path);
}

TEST(file_transport, failing_write_is_reported_as_fault) {
  if (!std::filesystem::exists("/dev/full")) {
    GTEST_SKIP() << "/dev/full is not available";
  }
  auto transport = herald::transport::file_transport{"/dev/full"};

  auto error = transport.post(
      {herald::schema::value_t{herald::schema::map_t{
          {"event_id", herald::schema::value_t{"a"}}}}},
      2);

  ASSERT_TRUE(error.has_value());
  ASSERT_TRUE(
      std::holds_alternative<herald::schema::request_failure_t>(*error));
  const auto& failure = std::get<herald::schema::request_failure_t>(*error);
  ASSERT_TRUE(std::holds_alternative<herald::schema::fault_t>(failure.last_error));
  EXPECT_EQ(std::get<herald::schema::fault_t>(failure.last_error).kind,
            "std::ios_base::failure");
}
