#pragma once
#include <covenant/schema/primitives.hpp>

// Grants or revokes an operator over every token the caller owns, now or
// later.
namespace covenant::schema {

template <uint16_t Version>
struct set_approval_for_all;

template <>
struct set_approval_for_all<1> final {
  uint16_t version{1};
  account_id_t operator_account{};
  bool approved{};
};

using set_approval_for_all_t = set_approval_for_all<1>;

}  // namespace covenant::schema
