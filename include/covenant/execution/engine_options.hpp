#pragma once

#include <covenant/schema/primitives.hpp>
#include <cstdint>

namespace covenant::execution {

/// Startup parameters of the settlement engine.
struct engine_options final {
  /// Receives escrow and marketplace platform fees and administers the
  /// marketplace fee.
  covenant::schema::account_id_t platform_account{};
  covenant::schema::basis_points_t escrow_fee_bps{100};
  covenant::schema::basis_points_t marketplace_fee_bps{250};
  covenant::schema::basis_points_t creator_royalty_bps{500};
  covenant::schema::basis_points_t max_marketplace_fee_bps{1000};
  uint32_t max_delegation_hops{50};
  covenant::schema::duration_seconds_t minimum_escrow_duration{86400};
};

/// Terminates through critical() when the options cannot run an engine.
void validate_options(const engine_options& options);

}  // namespace covenant::execution
