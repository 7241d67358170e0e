#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct approve_asset;

template <>
struct approve_asset<1> final {
  uint16_t version{1};
  account_id_t spender{};
  uint64_t token_id{};
};

using approve_asset_t = approve_asset<1>;

}  // namespace covenant::schema
