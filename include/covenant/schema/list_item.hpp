#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct list_item;

template <>
struct list_item<1> final {
  uint16_t version{1};
  uint64_t token_id{};
  amount_t price{};
};

using list_item_t = list_item<1>;

}  // namespace covenant::schema
