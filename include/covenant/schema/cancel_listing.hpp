#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct cancel_listing;

template <>
struct cancel_listing<1> final {
  uint16_t version{1};
  uint64_t token_id{};
};

using cancel_listing_t = cancel_listing<1>;

}  // namespace covenant::schema
