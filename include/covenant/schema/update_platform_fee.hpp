#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct update_platform_fee;

template <>
struct update_platform_fee<1> final {
  uint16_t version{1};
  basis_points_t fee_bps{};
};

using update_platform_fee_t = update_platform_fee<1>;

}  // namespace covenant::schema
