#pragma once
#include <covenant/schema/add_proposal.hpp>
#include <covenant/schema/approve_asset.hpp>
#include <covenant/schema/buy_item.hpp>
#include <covenant/schema/cancel_listing.hpp>
#include <covenant/schema/cast_vote.hpp>
#include <covenant/schema/create_escrow.hpp>
#include <covenant/schema/delegate_vote.hpp>
#include <covenant/schema/extend_voting.hpp>
#include <covenant/schema/finalize_voting.hpp>
#include <covenant/schema/list_item.hpp>
#include <covenant/schema/mint_asset.hpp>
#include <covenant/schema/open_voting_session.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/raise_dispute.hpp>
#include <covenant/schema/refund_escrow.hpp>
#include <covenant/schema/register_voter.hpp>
#include <covenant/schema/register_voters_batch.hpp>
#include <covenant/schema/release_escrow.hpp>
#include <covenant/schema/resolve_dispute.hpp>
#include <covenant/schema/set_approval_for_all.hpp>
#include <covenant/schema/transfer_asset.hpp>
#include <covenant/schema/update_platform_fee.hpp>
#include <covenant/schema/withdraw.hpp>
#include <covenant/schema/withdraw_platform_fees.hpp>
#include <variant>

namespace covenant::schema {

using transaction_payload_t = std::variant<create_escrow_t,
                                           release_escrow_t,
                                           refund_escrow_t,
                                           raise_dispute_t,
                                           resolve_dispute_t,
                                           withdraw_platform_fees_t,
                                           open_voting_session_t,
                                           register_voter_t,
                                           register_voters_batch_t,
                                           add_proposal_t,
                                           cast_vote_t,
                                           delegate_vote_t,
                                           finalize_voting_t,
                                           extend_voting_t,
                                           mint_asset_t,
                                           approve_asset_t,
                                           transfer_asset_t,
                                           list_item_t,
                                           buy_item_t,
                                           cancel_listing_t,
                                           update_platform_fee_t,
                                           withdraw_t,
                                           set_approval_for_all_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  account_id_t caller{};
  amount_t value{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace covenant::schema
