#pragma once

#include <covenant/execution/call_context.hpp>
#include <covenant/schema/add_proposal.hpp>
#include <covenant/schema/cast_vote.hpp>
#include <covenant/schema/delegate_vote.hpp>
#include <covenant/schema/extend_voting.hpp>
#include <covenant/schema/finalize_voting.hpp>
#include <covenant/schema/open_voting_session.hpp>
#include <covenant/schema/proposal_state.hpp>
#include <covenant/schema/register_voter.hpp>
#include <covenant/schema/register_voters_batch.hpp>
#include <covenant/schema/transaction_result.hpp>
#include <covenant/schema/voter_state.hpp>
#include <covenant/schema/voting_session_state.hpp>
#include <covenant/schema/voting_summary.hpp>
#include <optional>

namespace covenant::execution {

/// Weighted ballot with transitive delegation. One session per engine; the
/// account that opens it is the chairperson.
class voting_module final {
 public:
  explicit voting_module(call_context& context);

  covenant::schema::transaction_result_t open_session(
      const covenant::schema::open_voting_session_t& payload);
  covenant::schema::transaction_result_t register_voter(
      const covenant::schema::register_voter_t& payload);
  /// Null and already registered entries are skipped.
  covenant::schema::transaction_result_t register_voters_batch(
      const covenant::schema::register_voters_batch_t& payload);
  covenant::schema::transaction_result_t add_proposal(
      const covenant::schema::add_proposal_t& payload);
  covenant::schema::transaction_result_t vote(
      const covenant::schema::cast_vote_t& payload);
  /// Follows the target's delegation chain to its final delegate. Weight goes
  /// to the delegate's chosen proposal when it already voted, otherwise to
  /// the delegate itself.
  covenant::schema::transaction_result_t delegate(
      const covenant::schema::delegate_vote_t& payload);
  covenant::schema::transaction_result_t finalize(
      const covenant::schema::finalize_voting_t& payload);
  covenant::schema::transaction_result_t extend_voting(
      const covenant::schema::extend_voting_t& payload);

  static std::optional<covenant::schema::voting_session_state_t> load_session(
      const state_overlay& state);
  static std::optional<covenant::schema::voter_state_t> load_voter(
      const state_overlay& state,
      const covenant::schema::account_id_t& voter);
  static std::optional<covenant::schema::proposal_state_t> load_proposal(
      const state_overlay& state,
      uint64_t proposal_id);
  /// Highest vote count, lowest id on ties; the frozen winner once
  /// finalized.
  static std::optional<covenant::schema::proposal_state_t> winner(
      const state_overlay& state);
  static covenant::schema::voting_summary_t summary(
      const state_overlay& state,
      covenant::schema::timestamp_seconds_t now);
  /// Inclusive window start <= now <= end of an open session.
  static bool is_active(const covenant::schema::voting_session_state_t& session,
                        covenant::schema::timestamp_seconds_t now);

 private:
  covenant::schema::transaction_result_t missing_session() const;
  covenant::schema::transaction_result_t not_chairperson() const;
  covenant::schema::transaction_result_t register_account(
      covenant::schema::voting_session_state_t& session,
      const covenant::schema::account_id_t& voter);
  void save_session(const covenant::schema::voting_session_state_t& session);
  void save_voter(const covenant::schema::account_id_t& account,
                  const covenant::schema::voter_state_t& voter);
  void save_proposal(const covenant::schema::proposal_state_t& proposal);
  void create_proposal(covenant::schema::voting_session_state_t& session,
                       const std::string& name,
                       const std::string& description);

  call_context& context_;
  encoder_t encoder_;
};

}  // namespace covenant::execution
