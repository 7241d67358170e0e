#pragma once
#include <covenant/schema/escrow_status.hpp>
#include <covenant/schema/primitives.hpp>
#include <string>

// Schema type: escrow state.
// Settlement workflow: Two-party agreement held by the engine until the buyer
// releases it, a refund is taken, or the arbiter resolves a dispute.
namespace covenant::schema {

template <uint16_t Version>
struct escrow_state;

template <>
struct escrow_state<1> final {
  uint16_t version{1};
  uint64_t escrow_id{};
  account_id_t buyer{};
  account_id_t seller{};
  account_id_t arbiter{};
  amount_t amount{};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t deadline{};
  escrow_status_t status{escrow_status_t::created};
  std::string description;
};

using escrow_state_t = escrow_state<1>;

}  // namespace covenant::schema
