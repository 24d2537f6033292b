#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: sdk.
// Name and version of the reporting library, sent with every event.
namespace herald::schema {

template <uint16_t Version>
struct sdk;

template <>
struct sdk<1> final {
  uint16_t version{1};
  std::string name{"herald.cpp"};
  std::string sdk_version{"0.1.0"};
  std::vector<std::string> integrations;
};

using sdk_t = sdk<1>;

}  // namespace herald::schema
