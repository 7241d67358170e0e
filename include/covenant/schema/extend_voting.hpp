#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct extend_voting;

template <>
struct extend_voting<1> final {
  uint16_t version{1};
  timestamp_seconds_t new_end{};
};

using extend_voting_t = extend_voting<1>;

}  // namespace covenant::schema
