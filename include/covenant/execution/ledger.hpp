#pragma once

#include <covenant/execution/state_overlay.hpp>
#include <covenant/execution/transfer_sink.hpp>
#include <covenant/schema/account_balance.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/transaction_error_code.hpp>

namespace covenant::execution {

/// Shared pull-payment ledger. The only state written by more than one
/// settlement module.
///
/// `held` tracks the currency the engine currently holds, `total_pending`
/// the sum of all pending withdrawal balances. Solvency means
/// total_pending <= held.
class ledger final {
 public:
  ledger(state_overlay& state, const transfer_sink_t& sink);

  /// Record currency attached to the current call.
  void receive(const covenant::schema::amount_t& amount);

  /// Add to an account's pending withdrawal balance. Zero is a no-op.
  void credit(const covenant::schema::account_id_t& account,
              const covenant::schema::amount_t& amount);

  /// Zero the pending balance and deliver it through the transfer sink.
  covenant::schema::transaction_error_code withdraw(
      const covenant::schema::account_id_t& account,
      covenant::schema::amount_t& withdrawn);

  /// Deliver held currency directly. State is updated before the sink runs.
  covenant::schema::transaction_error_code transfer(
      const covenant::schema::account_id_t& account,
      const covenant::schema::amount_t& amount);

  covenant::schema::account_balance_t balance(
      const covenant::schema::account_id_t& account) const;
  covenant::schema::amount_t held() const;
  covenant::schema::amount_t total_pending() const;
  bool solvent() const;

  static covenant::schema::account_balance_t load_balance(
      const state_overlay& state,
      const covenant::schema::account_id_t& account);
  static covenant::schema::amount_t load_held(const state_overlay& state);
  static covenant::schema::amount_t load_total_pending(
      const state_overlay& state);

 private:
  void save_balance(const covenant::schema::account_id_t& account,
                    const covenant::schema::account_balance_t& balance);

  state_overlay& state_;
  const transfer_sink_t& sink_;
  encoder_t encoder_;
};

}  // namespace covenant::execution
