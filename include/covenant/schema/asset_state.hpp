#pragma once
#include <covenant/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: asset state.
// Marketplace workflow: Non-fungible token record. The creator never changes
// and is the royalty recipient on secondary sales.
namespace covenant::schema {

template <uint16_t Version>
struct asset_state;

template <>
struct asset_state<1> final {
  uint16_t version{1};
  uint64_t token_id{};
  account_id_t owner{};
  account_id_t creator{};
  std::string uri;
  std::optional<account_id_t> approved;
};

using asset_state_t = asset_state<1>;

}  // namespace covenant::schema
