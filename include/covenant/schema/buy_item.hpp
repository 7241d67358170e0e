#pragma once
#include <covenant/schema/primitives.hpp>

// Schema type: buy item.
// Marketplace workflow: Attached value pays for the listing; any excess is
// returned to the buyer.
namespace covenant::schema {

template <uint16_t Version>
struct buy_item;

template <>
struct buy_item<1> final {
  uint16_t version{1};
  uint64_t token_id{};
};

using buy_item_t = buy_item<1>;

}  // namespace covenant::schema
