#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction error code.
// Settlement workflow: Stable numeric failure taxonomy surfaced in
// transaction results. Ranges group envelope, authorization, state, input,
// integrity and transfer failures.
namespace covenant::schema {

enum class transaction_error_code : uint32_t {
  ok = 0,
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  value_not_accepted = 5,
  reentrancy_detected = 6,
  unauthorized = 10,
  not_chairperson = 11,
  not_token_owner = 12,
  not_owner_or_approved = 13,
  invalid_state = 20,
  already_voted = 21,
  already_finalized = 22,
  not_listed = 23,
  already_listed = 24,
  voting_not_active = 25,
  voting_still_active = 26,
  voter_not_registered = 27,
  voter_already_registered = 28,
  voting_session_exists = 29,
  voting_session_missing = 30,
  escrow_missing = 31,
  token_missing = 32,
  invalid_amount = 40,
  invalid_deadline = 41,
  zero_address = 42,
  insufficient_payment = 43,
  invalid_fee = 44,
  price_must_be_above_zero = 45,
  invalid_proposal = 46,
  invalid_time_range = 47,
  delegation_loop_detected = 50,
  self_delegation_not_allowed = 51,
  deadline_not_reached = 52,
  no_pending_withdrawals = 53,
  delegation_depth_exceeded = 54,
  ledger_invariant_violated = 55,
  transfer_failed = 60,
};

using transaction_error_code_t = transaction_error_code;

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    enum_mapping<transaction_error_code>{
        "ok", transaction_error_code::ok},
    enum_mapping<transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    enum_mapping<transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    enum_mapping<transaction_error_code>{
        "invalid_chain_id", transaction_error_code::invalid_chain_id},
    enum_mapping<transaction_error_code>{
        "invalid_nonce", transaction_error_code::invalid_nonce},
    enum_mapping<transaction_error_code>{
        "value_not_accepted", transaction_error_code::value_not_accepted},
    enum_mapping<transaction_error_code>{
        "reentrancy_detected", transaction_error_code::reentrancy_detected},
    enum_mapping<transaction_error_code>{
        "unauthorized", transaction_error_code::unauthorized},
    enum_mapping<transaction_error_code>{
        "not_chairperson", transaction_error_code::not_chairperson},
    enum_mapping<transaction_error_code>{
        "not_token_owner", transaction_error_code::not_token_owner},
    enum_mapping<transaction_error_code>{
        "not_owner_or_approved", transaction_error_code::not_owner_or_approved},
    enum_mapping<transaction_error_code>{
        "invalid_state", transaction_error_code::invalid_state},
    enum_mapping<transaction_error_code>{
        "already_voted", transaction_error_code::already_voted},
    enum_mapping<transaction_error_code>{
        "already_finalized", transaction_error_code::already_finalized},
    enum_mapping<transaction_error_code>{
        "not_listed", transaction_error_code::not_listed},
    enum_mapping<transaction_error_code>{
        "already_listed", transaction_error_code::already_listed},
    enum_mapping<transaction_error_code>{
        "voting_not_active", transaction_error_code::voting_not_active},
    enum_mapping<transaction_error_code>{
        "voting_still_active", transaction_error_code::voting_still_active},
    enum_mapping<transaction_error_code>{
        "voter_not_registered", transaction_error_code::voter_not_registered},
    enum_mapping<transaction_error_code>{
        "voter_already_registered",
        transaction_error_code::voter_already_registered},
    enum_mapping<transaction_error_code>{
        "voting_session_exists", transaction_error_code::voting_session_exists},
    enum_mapping<transaction_error_code>{
        "voting_session_missing",
        transaction_error_code::voting_session_missing},
    enum_mapping<transaction_error_code>{
        "escrow_missing", transaction_error_code::escrow_missing},
    enum_mapping<transaction_error_code>{
        "token_missing", transaction_error_code::token_missing},
    enum_mapping<transaction_error_code>{
        "invalid_amount", transaction_error_code::invalid_amount},
    enum_mapping<transaction_error_code>{
        "invalid_deadline", transaction_error_code::invalid_deadline},
    enum_mapping<transaction_error_code>{
        "zero_address", transaction_error_code::zero_address},
    enum_mapping<transaction_error_code>{
        "insufficient_payment", transaction_error_code::insufficient_payment},
    enum_mapping<transaction_error_code>{
        "invalid_fee", transaction_error_code::invalid_fee},
    enum_mapping<transaction_error_code>{
        "price_must_be_above_zero",
        transaction_error_code::price_must_be_above_zero},
    enum_mapping<transaction_error_code>{
        "invalid_proposal", transaction_error_code::invalid_proposal},
    enum_mapping<transaction_error_code>{
        "invalid_time_range", transaction_error_code::invalid_time_range},
    enum_mapping<transaction_error_code>{
        "delegation_loop_detected",
        transaction_error_code::delegation_loop_detected},
    enum_mapping<transaction_error_code>{
        "self_delegation_not_allowed",
        transaction_error_code::self_delegation_not_allowed},
    enum_mapping<transaction_error_code>{
        "deadline_not_reached", transaction_error_code::deadline_not_reached},
    enum_mapping<transaction_error_code>{
        "no_pending_withdrawals",
        transaction_error_code::no_pending_withdrawals},
    enum_mapping<transaction_error_code>{
        "delegation_depth_exceeded",
        transaction_error_code::delegation_depth_exceeded},
    enum_mapping<transaction_error_code>{
        "ledger_invariant_violated",
        transaction_error_code::ledger_invariant_violated},
    enum_mapping<transaction_error_code>{
        "transfer_failed", transaction_error_code::transfer_failed}};

template <>
inline std::optional<transaction_error_code>
try_from_string<transaction_error_code>(const std::string_view value) {
  return from_string(value, kTransactionErrorCodeMappings);
}

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return enum_name(value, kTransactionErrorCodeMappings);
}

inline constexpr uint32_t to_code(const transaction_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace covenant::schema
