#include <gtest/gtest.h>
#include <herald/schema/encoding/json/encoder.hpp>
#include <herald/testing/common.hpp>

#include <limits>
#include <string>

namespace {

using encoder_t = herald::schema::encoding::json_encoder_t;

}  // namespace

TEST(json_encoder, encodes_lists_of_scalars) {
  auto encoder = encoder_t{};
  auto error = std::string{};
  auto encoded = encoder.try_encode(
      herald::schema::value_t{herald::schema::list_t{1, "ok", true, nullptr}},
      error);
  ASSERT_TRUE(encoded.has_value()) << error;
  EXPECT_EQ(*encoded, "[1,\"ok\",true,null]");
}

TEST(json_encoder, encodes_nested_maps) {
  auto encoder = encoder_t{};
  auto error = std::string{};
  auto encoded = encoder.try_encode(
      herald::schema::value_t{herald::schema::map_t{
          {"user", herald::schema::value_t{herald::schema::map_t{
                       {"id", herald::schema::value_t{"42"}}}}}}},
      error);
  ASSERT_TRUE(encoded.has_value()) << error;
  EXPECT_NE(encoded->find("\"user\""), std::string::npos);
  EXPECT_NE(encoded->find("\"id\""), std::string::npos);
  EXPECT_NE(encoded->find("\"42\""), std::string::npos);
}

TEST(json_encoder, encodes_objects_with_encodable_form) {
  auto encoder = encoder_t{};
  auto error = std::string{};
  auto encoded = encoder.try_encode(herald::testing::make_point(3, 4), error);
  ASSERT_TRUE(encoded.has_value()) << error;
  EXPECT_NE(encoded->find("\"x\""), std::string::npos);
}

TEST(json_encoder, rejects_objects_without_encodable_form) {
  auto encoder = encoder_t{};
  auto error = std::string{};
  auto encoded = encoder.try_encode(
      herald::schema::value_t{herald::schema::list_t{
          1, herald::testing::make_opaque("pid")}},
      error);
  EXPECT_FALSE(encoded.has_value());
  EXPECT_NE(error.find("opaque_object"), std::string::npos);
}

TEST(json_encoder, rejects_non_finite_numbers) {
  auto encoder = encoder_t{};
  auto error = std::string{};
  auto encoded = encoder.try_encode(
      herald::schema::value_t{std::numeric_limits<double>::infinity()}, error);
  EXPECT_FALSE(encoded.has_value());
  EXPECT_FALSE(error.empty());
}
