#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct register_voter;

template <>
struct register_voter<1> final {
  uint16_t version{1};
  account_id_t voter{};
};

using register_voter_t = register_voter<1>;

}  // namespace covenant::schema
