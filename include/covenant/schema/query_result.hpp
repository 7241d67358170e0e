#pragma once

#include <covenant/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Settlement workflow: Read API envelope. Values are SCALE encoded and read
// from committed state only.
namespace covenant::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  int64_t height{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace covenant::schema
