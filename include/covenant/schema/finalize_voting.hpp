#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct finalize_voting;

template <>
struct finalize_voting<1> final {
  uint16_t version{1};
};

using finalize_voting_t = finalize_voting<1>;

}  // namespace covenant::schema
