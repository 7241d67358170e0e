#pragma once
#include <covenant/schema/primitives.hpp>
#include <string>

// Schema type: create escrow.
// Settlement workflow: Buyer opens and funds an agreement in one call; the
// attached transaction value is the escrowed amount.
namespace covenant::schema {

template <uint16_t Version>
struct create_escrow;

template <>
struct create_escrow<1> final {
  uint16_t version{1};
  account_id_t seller{};
  account_id_t arbiter{};
  duration_seconds_t duration{};
  std::string description;
};

using create_escrow_t = create_escrow<1>;

}  // namespace covenant::schema
