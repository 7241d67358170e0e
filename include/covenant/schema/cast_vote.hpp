#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct cast_vote;

template <>
struct cast_vote<1> final {
  uint16_t version{1};
  uint64_t proposal_id{};
};

using cast_vote_t = cast_vote<1>;

}  // namespace covenant::schema
