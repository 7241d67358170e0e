#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct listing_state;

template <>
struct listing_state<1> final {
  uint16_t version{1};
  uint64_t token_id{};
  account_id_t seller{};
  amount_t price{};
  bool active{};
};

using listing_state_t = listing_state<1>;

}  // namespace covenant::schema
