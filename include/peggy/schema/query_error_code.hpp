#pragma once

#include <cstdint>

namespace peggy::schema {

enum class query_error_code : uint32_t {
  invalid_argument = 1,
  unsupported_path = 2,
};

}  // namespace peggy::schema
