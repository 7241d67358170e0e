#pragma once
#include <covenant/schema/primitives.hpp>

// Schema type: transfer asset.
// Marketplace workflow: Ownership change outside the sale path; any active
// listing for the token is withdrawn.
namespace covenant::schema {

template <uint16_t Version>
struct transfer_asset;

template <>
struct transfer_asset<1> final {
  uint16_t version{1};
  account_id_t from{};
  account_id_t to{};
  uint64_t token_id{};
};

using transfer_asset_t = transfer_asset<1>;

}  // namespace covenant::schema
