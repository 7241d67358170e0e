#pragma once
#include <covenant/schema/primitives.hpp>

// Schema type: withdraw.
// Settlement workflow: Pull-payment claim of the caller's pending balance.
namespace covenant::schema {

template <uint16_t Version>
struct withdraw;

template <>
struct withdraw<1> final {
  uint16_t version{1};
};

using withdraw_t = withdraw<1>;

}  // namespace covenant::schema
