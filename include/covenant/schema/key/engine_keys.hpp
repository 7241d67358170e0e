#pragma once

#include <covenant/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Settlement workflow: Canonical key prefixes for ledger, escrow, voting,
// marketplace and event log state. A key is the SCALE encoding of the prefix
// followed by the SCALE encoding of the record id.
namespace covenant::schema::key {

inline constexpr std::string_view kCommittedStateKey{"SYS|APP|COMMITTED"};
inline constexpr std::string_view kHeldKey{"SYS|ENGINE|HELD"};
inline constexpr std::string_view kTotalPendingKey{"SYS|ENGINE|TOTAL_PENDING"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|NONCE|"};
inline constexpr std::string_view kBalanceKeyPrefix{"LEDGER|BAL|"};
inline constexpr std::string_view kEscrowCountKey{"ESCROW|COUNT"};
inline constexpr std::string_view kEscrowKeyPrefix{"ESCROW|REC|"};
inline constexpr std::string_view kVotingSessionKey{"VOTE|SESSION"};
inline constexpr std::string_view kVoterKeyPrefix{"VOTE|VOTER|"};
inline constexpr std::string_view kProposalKeyPrefix{"VOTE|PROP|"};
inline constexpr std::string_view kMarketplaceFeeKey{"MKT|FEE"};
inline constexpr std::string_view kAssetCountKey{"MKT|COUNT"};
inline constexpr std::string_view kAssetKeyPrefix{"MKT|ASSET|"};
inline constexpr std::string_view kListingKeyPrefix{"MKT|LIST|"};
inline constexpr std::string_view kOperatorKeyPrefix{"MKT|OPERATOR|"};
inline constexpr std::string_view kHoldingKeyPrefix{"MKT|HOLDING|"};
inline constexpr std::string_view kEventCountKey{"EVENT|COUNT"};
inline constexpr std::string_view kEventKeyPrefix{"EVENT|REC|"};

template <typename Encoder>
covenant::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder, typename T>
covenant::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
covenant::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const covenant::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, account);
}

template <typename Encoder>
covenant::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const covenant::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, account);
}

template <typename Encoder>
covenant::schema::bytes_t make_escrow_key(Encoder& encoder,
                                          uint64_t escrow_id) {
  return make_prefixed_key(encoder, kEscrowKeyPrefix, escrow_id);
}

template <typename Encoder>
covenant::schema::bytes_t make_voter_key(
    Encoder& encoder,
    const covenant::schema::account_id_t& voter) {
  return make_prefixed_key(encoder, kVoterKeyPrefix, voter);
}

template <typename Encoder>
covenant::schema::bytes_t make_proposal_key(Encoder& encoder,
                                            uint64_t proposal_id) {
  return make_prefixed_key(encoder, kProposalKeyPrefix, proposal_id);
}

template <typename Encoder>
covenant::schema::bytes_t make_asset_key(Encoder& encoder, uint64_t token_id) {
  return make_prefixed_key(encoder, kAssetKeyPrefix, token_id);
}

template <typename Encoder>
covenant::schema::bytes_t make_listing_key(Encoder& encoder,
                                           uint64_t token_id) {
  return make_prefixed_key(encoder, kListingKeyPrefix, token_id);
}

template <typename Encoder>
covenant::schema::bytes_t make_operator_key(
    Encoder& encoder,
    const covenant::schema::account_id_t& owner,
    const covenant::schema::account_id_t& operator_account) {
  return make_prefixed_key(encoder, kOperatorKeyPrefix,
                           std::tuple{owner, operator_account});
}

template <typename Encoder>
covenant::schema::bytes_t make_holding_key(
    Encoder& encoder,
    const covenant::schema::account_id_t& owner) {
  return make_prefixed_key(encoder, kHoldingKeyPrefix, owner);
}

template <typename Encoder>
covenant::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventKeyPrefix, event_id);
}

}  // namespace covenant::schema::key
