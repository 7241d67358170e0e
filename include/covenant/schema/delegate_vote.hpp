#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct delegate_vote;

template <>
struct delegate_vote<1> final {
  uint16_t version{1};
  account_id_t to{};
};

using delegate_vote_t = delegate_vote<1>;

}  // namespace covenant::schema
