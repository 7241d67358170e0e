#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <covenant/execution/escrow_module.hpp>
#include <covenant/schema/key/engine_keys.hpp>
#include <limits>

using namespace covenant::schema;

namespace covenant::execution {

escrow_module::escrow_module(call_context& context) : context_{context} {}

transaction_result_t escrow_module::create(const create_escrow_t& payload) {
  if (is_null(payload.seller) || is_null(payload.arbiter)) {
    return make_error_result(transaction_error_code::zero_address,
                             kEscrowCodespace,
                             is_null(payload.seller) ? "field=seller"
                                                     : "field=arbiter");
  }
  if (payload.duration < context_.options.minimum_escrow_duration) {
    return make_error_result(
        transaction_error_code::invalid_deadline, kEscrowCodespace,
        fmt::format("duration={} minimum={}", payload.duration,
                    context_.options.minimum_escrow_duration));
  }
  if (payload.duration >
      std::numeric_limits<timestamp_seconds_t>::max() - context_.block_time) {
    return make_error_result(
        transaction_error_code::invalid_deadline, kEscrowCodespace,
        fmt::format("duration={} block_time={} overflow", payload.duration,
                    context_.block_time));
  }
  if (context_.value == 0) {
    return make_error_result(transaction_error_code::invalid_amount,
                             kEscrowCodespace, "value=0");
  }

  auto escrow_id = count(context_.state);
  auto escrow = escrow_state_t{};
  escrow.escrow_id = escrow_id;
  escrow.buyer = context_.caller;
  escrow.seller = payload.seller;
  escrow.arbiter = payload.arbiter;
  escrow.amount = context_.value;
  escrow.created_at = context_.block_time;
  escrow.deadline = context_.block_time + payload.duration;
  escrow.status = escrow_status_t::funded;
  escrow.description = payload.description;
  save(escrow);
  context_.state.put(key::make_prefix_key(encoder_, key::kEscrowCountKey),
                     uint64_t{escrow_id + 1});

  context_.events.push_back(make_event(
      "EscrowCreated",
      {make_attribute("escrow_id", std::to_string(escrow_id), true),
       make_attribute("buyer", to_hex(escrow.buyer), true),
       make_attribute("seller", to_hex(escrow.seller), true),
       make_attribute("amount", escrow.amount.str())}));
  context_.events.push_back(make_event(
      "EscrowFunded",
      {make_attribute("escrow_id", std::to_string(escrow_id), true),
       make_attribute("amount", escrow.amount.str())}));

  auto result = make_success_result();
  result.data = encoder_.encode(escrow_id);
  return result;
}

transaction_result_t escrow_module::release(const release_escrow_t& payload) {
  auto escrow = load(context_.state, payload.escrow_id);
  if (!escrow) {
    return make_error_result(transaction_error_code::escrow_missing,
                             kEscrowCodespace,
                             fmt::format("escrow_id={}", payload.escrow_id));
  }
  if (context_.caller != escrow->buyer) {
    return make_error_result(transaction_error_code::unauthorized,
                             kEscrowCodespace,
                             unauthorized_info(context_.caller, "buyer"));
  }
  if (escrow->status != escrow_status_t::funded) {
    return make_error_result(
        transaction_error_code::invalid_state, kEscrowCodespace,
        invalid_state_info(escrow->status, escrow_status_t::funded));
  }

  escrow->status = escrow_status_t::released;
  save(*escrow);
  auto payout = amount_t{};
  auto fee = amount_t{};
  settle(*escrow, escrow->seller, payout, fee);

  context_.events.push_back(make_event(
      "EscrowReleased",
      {make_attribute("escrow_id", std::to_string(escrow->escrow_id), true),
       make_attribute("seller_amount", payout.str()),
       make_attribute("fee", fee.str())}));
  return make_success_result();
}

transaction_result_t escrow_module::refund(const refund_escrow_t& payload) {
  auto escrow = load(context_.state, payload.escrow_id);
  if (!escrow) {
    return make_error_result(transaction_error_code::escrow_missing,
                             kEscrowCodespace,
                             fmt::format("escrow_id={}", payload.escrow_id));
  }
  auto by_seller = context_.caller == escrow->seller;
  auto by_buyer = context_.caller == escrow->buyer;
  if (!by_seller && !by_buyer) {
    return make_error_result(
        transaction_error_code::unauthorized, kEscrowCodespace,
        unauthorized_info(context_.caller, "buyer_or_seller"));
  }
  if (escrow->status != escrow_status_t::funded) {
    return make_error_result(
        transaction_error_code::invalid_state, kEscrowCodespace,
        invalid_state_info(escrow->status, escrow_status_t::funded));
  }
  if (!by_seller && !is_expired(*escrow, context_.block_time)) {
    return make_error_result(
        transaction_error_code::deadline_not_reached, kEscrowCodespace,
        fmt::format("now={} deadline={}", context_.block_time,
                    escrow->deadline));
  }

  escrow->status = escrow_status_t::refunded;
  save(*escrow);
  context_.ledger.credit(escrow->buyer, escrow->amount);

  context_.events.push_back(make_event(
      "EscrowRefunded",
      {make_attribute("escrow_id", std::to_string(escrow->escrow_id), true),
       make_attribute("amount", escrow->amount.str())}));
  return make_success_result();
}

transaction_result_t escrow_module::raise_dispute(
    const raise_dispute_t& payload) {
  auto escrow = load(context_.state, payload.escrow_id);
  if (!escrow) {
    return make_error_result(transaction_error_code::escrow_missing,
                             kEscrowCodespace,
                             fmt::format("escrow_id={}", payload.escrow_id));
  }
  if (context_.caller != escrow->buyer && context_.caller != escrow->seller) {
    return make_error_result(
        transaction_error_code::unauthorized, kEscrowCodespace,
        unauthorized_info(context_.caller, "buyer_or_seller"));
  }
  if (escrow->status != escrow_status_t::funded) {
    return make_error_result(
        transaction_error_code::invalid_state, kEscrowCodespace,
        invalid_state_info(escrow->status, escrow_status_t::funded));
  }

  escrow->status = escrow_status_t::disputed;
  save(*escrow);

  context_.events.push_back(make_event(
      "DisputeRaised",
      {make_attribute("escrow_id", std::to_string(escrow->escrow_id), true),
       make_attribute("raised_by", to_hex(context_.caller), true)}));
  return make_success_result();
}

transaction_result_t escrow_module::resolve_dispute(
    const resolve_dispute_t& payload) {
  auto escrow = load(context_.state, payload.escrow_id);
  if (!escrow) {
    return make_error_result(transaction_error_code::escrow_missing,
                             kEscrowCodespace,
                             fmt::format("escrow_id={}", payload.escrow_id));
  }
  if (context_.caller != escrow->arbiter) {
    return make_error_result(transaction_error_code::unauthorized,
                             kEscrowCodespace,
                             unauthorized_info(context_.caller, "arbiter"));
  }
  if (escrow->status != escrow_status_t::disputed) {
    return make_error_result(
        transaction_error_code::invalid_state, kEscrowCodespace,
        invalid_state_info(escrow->status, escrow_status_t::disputed));
  }
  if (payload.recipient != escrow->buyer &&
      payload.recipient != escrow->seller) {
    return make_error_result(
        transaction_error_code::unauthorized, kEscrowCodespace,
        fmt::format("recipient={} required_role=buyer_or_seller",
                    to_hex(payload.recipient)));
  }

  escrow->status = escrow_status_t::resolved;
  save(*escrow);
  auto payout = amount_t{};
  auto fee = amount_t{};
  settle(*escrow, payload.recipient, payout, fee);

  context_.events.push_back(make_event(
      "DisputeResolved",
      {make_attribute("escrow_id", std::to_string(escrow->escrow_id), true),
       make_attribute("recipient", to_hex(payload.recipient), true),
       make_attribute("amount", payout.str())}));
  return make_success_result();
}

transaction_result_t escrow_module::withdraw_platform_fees(
    const withdraw_platform_fees_t&) {
  const auto& platform = context_.options.platform_account;
  if (context_.caller != platform) {
    return make_error_result(transaction_error_code::unauthorized,
                             kEscrowCodespace,
                             unauthorized_info(context_.caller, "platform"));
  }
  if (context_.ledger.balance(platform).pending_withdrawal == 0) {
    return make_error_result(transaction_error_code::invalid_amount,
                             kEscrowCodespace, "pending_withdrawal=0");
  }

  auto withdrawn = amount_t{};
  auto code = context_.ledger.withdraw(platform, withdrawn);
  if (code != transaction_error_code::ok) {
    return make_error_result(code, kLedgerCodespace,
                             fmt::format("account={}", to_hex(platform)));
  }

  context_.events.push_back(
      make_event("PlatformFeesWithdrawn",
                 {make_attribute("account", to_hex(platform), true),
                  make_attribute("amount", withdrawn.str())}));
  return make_success_result();
}

std::optional<escrow_state_t> escrow_module::load(const state_overlay& state,
                                                  uint64_t escrow_id) {
  auto encoder = encoder_t{};
  return state.get<escrow_state_t>(key::make_escrow_key(encoder, escrow_id));
}

uint64_t escrow_module::count(const state_overlay& state) {
  auto encoder = encoder_t{};
  return state
      .get<uint64_t>(key::make_prefix_key(encoder, key::kEscrowCountKey))
      .value_or(0);
}

bool escrow_module::is_expired(const escrow_state_t& escrow,
                               timestamp_seconds_t now) {
  return now >= escrow.deadline;
}

void escrow_module::save(const escrow_state_t& escrow) {
  context_.state.put(key::make_escrow_key(encoder_, escrow.escrow_id), escrow);
}

void escrow_module::settle(const escrow_state_t& escrow,
                           const account_id_t& recipient,
                           amount_t& payout,
                           amount_t& fee) {
  fee = apply_basis_points(escrow.amount, context_.options.escrow_fee_bps);
  payout = escrow.amount - fee;
  context_.ledger.credit(recipient, payout);
  context_.ledger.credit(context_.options.platform_account, fee);
  spdlog::debug("Escrow {} settled: {} to {}, fee {}", escrow.escrow_id,
                payout.str(), to_hex(recipient), fee.str());
}

}  // namespace covenant::execution
