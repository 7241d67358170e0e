#include <spdlog/spdlog.h>
#include <covenant/execution/ledger.hpp>
#include <covenant/schema/key/engine_keys.hpp>

using namespace covenant::schema;

namespace covenant::execution {

ledger::ledger(state_overlay& state, const transfer_sink_t& sink)
    : state_{state}, sink_{sink} {}

void ledger::receive(const amount_t& amount) {
  if (amount == 0) {
    return;
  }
  state_.put(key::make_prefix_key(encoder_, key::kHeldKey),
             amount_t{held() + amount});
}

void ledger::credit(const account_id_t& account, const amount_t& amount) {
  if (amount == 0) {
    return;
  }
  auto record = balance(account);
  record.pending_withdrawal += amount;
  save_balance(account, record);
  state_.put(key::make_prefix_key(encoder_, key::kTotalPendingKey),
             amount_t{total_pending() + amount});
}

transaction_error_code ledger::withdraw(const account_id_t& account,
                                        amount_t& withdrawn) {
  auto record = balance(account);
  if (record.pending_withdrawal == 0) {
    return transaction_error_code::no_pending_withdrawals;
  }
  withdrawn = record.pending_withdrawal;
  record.pending_withdrawal = 0;
  save_balance(account, record);

  auto pending = total_pending();
  if (pending < withdrawn) {
    return transaction_error_code::ledger_invariant_violated;
  }
  state_.put(key::make_prefix_key(encoder_, key::kTotalPendingKey),
             amount_t{pending - withdrawn});
  return transfer(account, withdrawn);
}

transaction_error_code ledger::transfer(const account_id_t& account,
                                        const amount_t& amount) {
  if (amount == 0) {
    return transaction_error_code::ok;
  }
  auto current_held = held();
  if (current_held < amount) {
    spdlog::error("Transfer of {} exceeds held balance {}", amount.str(),
                  current_held.str());
    return transaction_error_code::ledger_invariant_violated;
  }
  state_.put(key::make_prefix_key(encoder_, key::kHeldKey),
             amount_t{current_held - amount});
  auto record = balance(account);
  record.available += amount;
  save_balance(account, record);

  if (sink_ && !sink_(account, amount)) {
    spdlog::debug("Transfer sink rejected {} to {}", amount.str(),
                  to_hex(account));
    return transaction_error_code::transfer_failed;
  }
  return transaction_error_code::ok;
}

account_balance_t ledger::balance(const account_id_t& account) const {
  return load_balance(state_, account);
}

amount_t ledger::held() const {
  return load_held(state_);
}

amount_t ledger::total_pending() const {
  return load_total_pending(state_);
}

bool ledger::solvent() const {
  return total_pending() <= held();
}

account_balance_t ledger::load_balance(const state_overlay& state,
                                       const account_id_t& account) {
  auto encoder = encoder_t{};
  return state.get<account_balance_t>(key::make_balance_key(encoder, account))
      .value_or(account_balance_t{});
}

amount_t ledger::load_held(const state_overlay& state) {
  auto encoder = encoder_t{};
  return state.get<amount_t>(key::make_prefix_key(encoder, key::kHeldKey))
      .value_or(amount_t{0});
}

amount_t ledger::load_total_pending(const state_overlay& state) {
  auto encoder = encoder_t{};
  return state
      .get<amount_t>(key::make_prefix_key(encoder, key::kTotalPendingKey))
      .value_or(amount_t{0});
}

void ledger::save_balance(const account_id_t& account,
                          const account_balance_t& balance) {
  state_.put(key::make_balance_key(encoder_, account), balance);
}

}  // namespace covenant::execution
