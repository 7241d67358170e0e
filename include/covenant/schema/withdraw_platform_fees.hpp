#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct withdraw_platform_fees;

template <>
struct withdraw_platform_fees<1> final {
  uint16_t version{1};
};

using withdraw_platform_fees_t = withdraw_platform_fees<1>;

}  // namespace covenant::schema
