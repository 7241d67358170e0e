#pragma once

#include <covenant/execution/call_context.hpp>
#include <covenant/schema/create_escrow.hpp>
#include <covenant/schema/escrow_state.hpp>
#include <covenant/schema/raise_dispute.hpp>
#include <covenant/schema/refund_escrow.hpp>
#include <covenant/schema/release_escrow.hpp>
#include <covenant/schema/resolve_dispute.hpp>
#include <covenant/schema/transaction_result.hpp>
#include <covenant/schema/withdraw_platform_fees.hpp>
#include <optional>

namespace covenant::execution {

/// Two-party escrow with arbiter. Funded agreements leave the funded state
/// through release, refund or dispute; a disputed agreement leaves only
/// through arbitration.
class escrow_module final {
 public:
  explicit escrow_module(call_context& context);

  /// Open and fund an agreement with the attached value.
  covenant::schema::transaction_result_t create(
      const covenant::schema::create_escrow_t& payload);
  /// Buyer pays the seller, less the platform fee.
  covenant::schema::transaction_result_t release(
      const covenant::schema::release_escrow_t& payload);
  /// Seller at any time, buyer once the deadline is reached.
  covenant::schema::transaction_result_t refund(
      const covenant::schema::refund_escrow_t& payload);
  covenant::schema::transaction_result_t raise_dispute(
      const covenant::schema::raise_dispute_t& payload);
  covenant::schema::transaction_result_t resolve_dispute(
      const covenant::schema::resolve_dispute_t& payload);
  covenant::schema::transaction_result_t withdraw_platform_fees(
      const covenant::schema::withdraw_platform_fees_t& payload);

  static std::optional<covenant::schema::escrow_state_t> load(
      const state_overlay& state,
      uint64_t escrow_id);
  static uint64_t count(const state_overlay& state);
  static bool is_expired(const covenant::schema::escrow_state_t& escrow,
                         covenant::schema::timestamp_seconds_t now);

 private:
  void save(const covenant::schema::escrow_state_t& escrow);
  /// Credit recipient with the amount less the platform fee.
  void settle(const covenant::schema::escrow_state_t& escrow,
              const covenant::schema::account_id_t& recipient,
              covenant::schema::amount_t& payout,
              covenant::schema::amount_t& fee);

  call_context& context_;
  encoder_t encoder_;
};

}  // namespace covenant::execution
