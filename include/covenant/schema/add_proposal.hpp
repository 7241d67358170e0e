#pragma once
#include <covenant/schema/primitives.hpp>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct add_proposal;

template <>
struct add_proposal<1> final {
  uint16_t version{1};
  std::string name;
  std::string description;
};

using add_proposal_t = add_proposal<1>;

}  // namespace covenant::schema
