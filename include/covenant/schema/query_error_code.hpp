#pragma once

#include <cstdint>

namespace covenant::schema {

enum class query_error_code : uint32_t {
  unsupported_path = 1,
  invalid_data = 2,
  not_found = 3,
};

}  // namespace covenant::schema
