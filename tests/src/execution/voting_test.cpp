#include <covenant/execution/engine.hpp>
#include <covenant/schema/proposal_state.hpp>
#include <covenant/schema/voter_state.hpp>
#include <covenant/schema/voting_summary.hpp>
#include <covenant/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace {

using covenant::schema::transaction_error_code;
using covenant::testing::code_of;
using covenant::testing::kDay;

const auto kChair = covenant::testing::make_account(10);
const auto kAlice = covenant::testing::make_account(11);
const auto kBob = covenant::testing::make_account(12);
const auto kCarol = covenant::testing::make_account(13);
const auto kDave = covenant::testing::make_account(14);
const auto kOutsider = covenant::testing::make_account(15);

using winner_t = std::tuple<uint64_t, std::string, uint64_t>;

/// Open a one-day session with proposals "alpha" (0) and "beta" (1) and
/// register alice, bob, carol and dave.
void open_session(covenant::testing::execution_fixture& fixture) {
  auto opened = fixture.submit(
      kChair, covenant::schema::open_voting_session_t{
                  .title = "treasury",
                  .voting_start = fixture.now(),
                  .voting_end = fixture.now() + kDay,
                  .proposal_names = {"alpha", "beta"},
                  .proposal_descriptions = {"first", "second"}});
  ASSERT_EQ(opened.code, 0u) << opened.log << " " << opened.info;
  auto registered = fixture.submit(
      kChair, covenant::schema::register_voters_batch_t{
                  .voters = {kAlice, kBob, kCarol, kDave}});
  ASSERT_EQ(registered.code, 0u) << registered.log;
}

covenant::schema::proposal_state_t load_proposal(
    covenant::testing::execution_fixture& fixture,
    const uint64_t proposal_id) {
  return covenant::testing::query_value<covenant::schema::proposal_state_t>(
      fixture.engine(), "/voting/proposal",
      covenant::testing::query_key(proposal_id));
}

covenant::schema::voter_state_t load_voter(
    covenant::testing::execution_fixture& fixture,
    const covenant::schema::account_id_t& voter) {
  return covenant::testing::query_value<covenant::schema::voter_state_t>(
      fixture.engine(), "/voting/voter", covenant::testing::query_key(voter));
}

covenant::schema::voting_summary_t load_summary(
    covenant::testing::execution_fixture& fixture) {
  return covenant::testing::query_value<covenant::schema::voting_summary_t>(
      fixture.engine(), "/voting/summary");
}

}  // namespace

TEST(voting, open_session_registers_chair_and_numbers_proposals) {
  auto fixture = covenant::testing::execution_fixture{"covenant_voting_open"};
  open_session(fixture);

  auto summary = load_summary(fixture);
  EXPECT_EQ(summary.title, "treasury");
  EXPECT_EQ(summary.proposal_count, 2u);
  EXPECT_EQ(summary.registered_voters, 5u);
  EXPECT_EQ(summary.votes_cast, 0u);
  EXPECT_TRUE(summary.active);
  EXPECT_FALSE(summary.finalized);
  EXPECT_EQ(load_proposal(fixture, 1).name, "beta");
  EXPECT_EQ(load_voter(fixture, kChair).weight, 1u);

  auto again = fixture.submit(
      kChair, covenant::schema::open_voting_session_t{
                  .title = "again",
                  .voting_start = fixture.now(),
                  .voting_end = fixture.now() + 1});
  EXPECT_EQ(again.code, code_of(transaction_error_code::voting_session_exists));
}

TEST(voting, open_session_validates_window_and_proposals) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_open_input"};
  EXPECT_EQ(fixture
                .submit(kChair, covenant::schema::open_voting_session_t{
                                    .voting_start = 10, .voting_end = 10})
                .code,
            code_of(transaction_error_code::invalid_time_range));
  EXPECT_EQ(fixture
                .submit(kChair, covenant::schema::open_voting_session_t{
                                    .voting_start = 10,
                                    .voting_end = 20,
                                    .proposal_names = {"a", "b"},
                                    .proposal_descriptions = {"a"}})
                .code,
            code_of(transaction_error_code::invalid_proposal));
  EXPECT_EQ(fixture.engine()
                .query("/voting/summary", covenant::schema::bytes_view_t{})
                .code,
            3u);
}

TEST(voting, registration_is_chair_only_and_batches_skip_duplicates) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_register"};
  open_session(fixture);

  EXPECT_EQ(fixture
                .submit(kAlice,
                        covenant::schema::register_voter_t{.voter = kOutsider})
                .code,
            code_of(transaction_error_code::not_chairperson));
  EXPECT_EQ(
      fixture.submit(kChair, covenant::schema::register_voter_t{.voter = kAlice})
          .code,
      code_of(transaction_error_code::voter_already_registered));
  EXPECT_EQ(fixture
                .submit(kChair, covenant::schema::register_voter_t{
                                    .voter = covenant::schema::make_zero_hash()})
                .code,
            code_of(transaction_error_code::zero_address));

  auto batch = fixture.submit(
      kChair, covenant::schema::register_voters_batch_t{
                  .voters = {kAlice, covenant::schema::make_zero_hash(),
                             kOutsider, kOutsider}});
  ASSERT_EQ(batch.code, 0u);
  EXPECT_EQ(batch.info, "registered=1");
  ASSERT_EQ(batch.events.size(), 1u);
  EXPECT_EQ(covenant::testing::find_attribute(batch.events.front(), "count"),
            "1");
  EXPECT_EQ(load_summary(fixture).registered_voters, 6u);
}

TEST(voting, direct_votes_count_weight_once) {
  auto fixture = covenant::testing::execution_fixture{"covenant_voting_vote"};
  open_session(fixture);

  auto vote = fixture.submit(kAlice,
                             covenant::schema::cast_vote_t{.proposal_id = 1});
  ASSERT_EQ(vote.code, 0u) << vote.log;
  EXPECT_TRUE(covenant::testing::has_event(vote, "VoteCast"));
  EXPECT_EQ(fixture
                .submit(kAlice,
                        covenant::schema::cast_vote_t{.proposal_id = 0})
                .code,
            code_of(transaction_error_code::already_voted));
  EXPECT_EQ(fixture
                .submit(kOutsider,
                        covenant::schema::cast_vote_t{.proposal_id = 0})
                .code,
            code_of(transaction_error_code::voter_not_registered));
  EXPECT_EQ(fixture
                .submit(kBob, covenant::schema::cast_vote_t{.proposal_id = 2})
                .code,
            code_of(transaction_error_code::invalid_proposal));

  EXPECT_EQ(load_proposal(fixture, 1).vote_count, 1u);
  auto voter = load_voter(fixture, kAlice);
  EXPECT_TRUE(voter.voted);
  EXPECT_EQ(voter.proposal_id, 1u);
  EXPECT_EQ(load_summary(fixture).votes_cast, 1u);
}

TEST(voting, votes_outside_window_are_rejected) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_window"};
  auto opened = fixture.submit(
      kChair, covenant::schema::open_voting_session_t{
                  .title = "later",
                  .voting_start = fixture.now() + 100,
                  .voting_end = fixture.now() + 200,
                  .proposal_names = {"only"},
                  .proposal_descriptions = {"one"}});
  ASSERT_EQ(opened.code, 0u);
  EXPECT_EQ(
      fixture.submit(kChair, covenant::schema::cast_vote_t{.proposal_id = 0})
          .code,
      code_of(transaction_error_code::voting_not_active));

  fixture.advance(100);
  EXPECT_EQ(
      fixture.submit(kChair, covenant::schema::cast_vote_t{.proposal_id = 0})
          .code,
      0u);
}

TEST(voting, delegation_follows_chain_to_final_delegate) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_transitive"};
  open_session(fixture);

  ASSERT_EQ(
      fixture.submit(kAlice, covenant::schema::delegate_vote_t{.to = kBob})
          .code,
      0u);
  auto chained =
      fixture.submit(kCarol, covenant::schema::delegate_vote_t{.to = kAlice});
  ASSERT_EQ(chained.code, 0u) << chained.log << " " << chained.info;
  ASSERT_EQ(chained.events.size(), 1u);
  EXPECT_EQ(covenant::testing::find_attribute(chained.events.front(), "to"),
            covenant::schema::to_hex(kBob));

  EXPECT_EQ(load_voter(fixture, kBob).weight, 3u);
  EXPECT_EQ(load_voter(fixture, kCarol).delegate, kBob);
  EXPECT_TRUE(load_voter(fixture, kCarol).voted);

  ASSERT_EQ(
      fixture.submit(kBob, covenant::schema::cast_vote_t{.proposal_id = 0})
          .code,
      0u);
  EXPECT_EQ(load_proposal(fixture, 0).vote_count, 3u);
  EXPECT_EQ(load_summary(fixture).votes_cast, 1u);
}

TEST(voting, delegating_to_a_voter_who_voted_adds_to_their_proposal) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_late_delegate"};
  open_session(fixture);
  ASSERT_EQ(
      fixture.submit(kBob, covenant::schema::cast_vote_t{.proposal_id = 1})
          .code,
      0u);
  ASSERT_EQ(
      fixture.submit(kDave, covenant::schema::delegate_vote_t{.to = kBob})
          .code,
      0u);
  EXPECT_EQ(load_proposal(fixture, 1).vote_count, 2u);
  EXPECT_EQ(load_voter(fixture, kBob).weight, 1u);
}

TEST(voting, delegation_rejects_self_loops_and_voted_senders) {
  auto fixture = covenant::testing::execution_fixture{"covenant_voting_loop"};
  open_session(fixture);

  EXPECT_EQ(
      fixture.submit(kAlice, covenant::schema::delegate_vote_t{.to = kAlice})
          .code,
      code_of(transaction_error_code::self_delegation_not_allowed));
  EXPECT_EQ(
      fixture.submit(kAlice, covenant::schema::delegate_vote_t{.to = kOutsider})
          .code,
      code_of(transaction_error_code::voter_not_registered));

  ASSERT_EQ(
      fixture.submit(kAlice, covenant::schema::delegate_vote_t{.to = kBob})
          .code,
      0u);
  ASSERT_EQ(
      fixture.submit(kBob, covenant::schema::delegate_vote_t{.to = kCarol})
          .code,
      0u);
  EXPECT_EQ(
      fixture.submit(kCarol, covenant::schema::delegate_vote_t{.to = kAlice})
          .code,
      code_of(transaction_error_code::delegation_loop_detected));
  EXPECT_EQ(
      fixture.submit(kAlice, covenant::schema::delegate_vote_t{.to = kDave})
          .code,
      code_of(transaction_error_code::already_voted));
}

TEST(voting, failed_delegation_leaves_sender_free_to_vote) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_rollback"};
  open_session(fixture);
  ASSERT_EQ(
      fixture.submit(kAlice, covenant::schema::delegate_vote_t{.to = kBob})
          .code,
      0u);
  ASSERT_EQ(
      fixture.submit(kBob, covenant::schema::delegate_vote_t{.to = kCarol})
          .code,
      0u);
  ASSERT_EQ(
      fixture.submit(kCarol, covenant::schema::delegate_vote_t{.to = kAlice})
          .code,
      code_of(transaction_error_code::delegation_loop_detected));

  auto carol = load_voter(fixture, kCarol);
  EXPECT_FALSE(carol.voted);
  EXPECT_FALSE(carol.delegate.has_value());
  EXPECT_EQ(carol.weight, 3u);

  ASSERT_EQ(
      fixture.submit(kCarol, covenant::schema::cast_vote_t{.proposal_id = 1})
          .code,
      0u);
  EXPECT_EQ(load_proposal(fixture, 1).vote_count, 3u);
}

TEST(voting, delegation_chain_depth_is_bounded) {
  auto fixture = covenant::testing::execution_fixture{"covenant_voting_depth"};
  auto opened = fixture.submit(
      kChair, covenant::schema::open_voting_session_t{
                  .title = "deep",
                  .voting_start = fixture.now(),
                  .voting_end = fixture.now() + kDay,
                  .proposal_names = {"only"},
                  .proposal_descriptions = {"one"}});
  ASSERT_EQ(opened.code, 0u);

  // Chain of 52 voters: chain[0] -> chain[1] -> ... -> chain[51].
  auto chain = std::vector<covenant::schema::account_id_t>{};
  for (uint8_t i = 0; i < 52; ++i) {
    auto account = covenant::testing::make_account(0x40);
    account[1] = i;
    chain.push_back(account);
  }
  auto late = covenant::testing::make_account(0x41);
  auto voters = chain;
  voters.push_back(late);
  ASSERT_EQ(fixture
                .submit(kChair, covenant::schema::register_voters_batch_t{
                                    .voters = voters})
                .code,
            0u);

  auto delegations = std::vector<covenant::schema::transaction_t>{};
  for (size_t i = 0; i + 1 < chain.size(); ++i) {
    delegations.push_back(fixture.make_tx(
        chain[i], covenant::schema::delegate_vote_t{.to = chain[i + 1]}));
  }
  auto block = fixture.run_block(delegations);
  for (const auto& result : block.tx_results) {
    ASSERT_EQ(result.code, 0u) << result.log << " " << result.info;
  }
  EXPECT_EQ(load_voter(fixture, chain.back()).weight, 52u);

  // Reaching chain[51] from chain[0] takes 51 hops against a limit of 50.
  EXPECT_EQ(
      fixture.submit(late, covenant::schema::delegate_vote_t{.to = chain[0]})
          .code,
      code_of(transaction_error_code::delegation_depth_exceeded));
  auto refused = load_voter(fixture, late);
  EXPECT_FALSE(refused.voted);
  EXPECT_FALSE(refused.delegate.has_value());
  EXPECT_EQ(refused.weight, 1u);
  EXPECT_EQ(load_voter(fixture, chain.back()).weight, 52u);

  // From chain[1] it takes exactly 50.
  ASSERT_EQ(
      fixture.submit(late, covenant::schema::delegate_vote_t{.to = chain[1]})
          .code,
      0u);
  EXPECT_EQ(load_voter(fixture, chain.back()).weight, 53u);
}

TEST(voting, ties_go_to_the_lowest_proposal_id) {
  auto fixture = covenant::testing::execution_fixture{"covenant_voting_tie"};
  open_session(fixture);
  ASSERT_EQ(
      fixture.submit(kAlice, covenant::schema::cast_vote_t{.proposal_id = 1})
          .code,
      0u);
  ASSERT_EQ(
      fixture.submit(kBob, covenant::schema::cast_vote_t{.proposal_id = 0})
          .code,
      0u);
  auto leader = covenant::testing::query_value<winner_t>(fixture.engine(),
                                                         "/voting/winner");
  EXPECT_EQ(std::get<0>(leader), 0u);
  EXPECT_EQ(std::get<1>(leader), "alpha");
  EXPECT_EQ(std::get<2>(leader), 1u);

  ASSERT_EQ(
      fixture.submit(kCarol, covenant::schema::cast_vote_t{.proposal_id = 1})
          .code,
      0u);
  leader = covenant::testing::query_value<winner_t>(fixture.engine(),
                                                    "/voting/winner");
  EXPECT_EQ(std::get<0>(leader), 1u);
  EXPECT_EQ(std::get<2>(leader), 2u);
}

TEST(voting, proposals_can_be_added_until_the_window_closes) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_proposal"};
  open_session(fixture);
  EXPECT_EQ(fixture
                .submit(kAlice, covenant::schema::add_proposal_t{
                                    .name = "gamma", .description = "third"})
                .code,
            code_of(transaction_error_code::not_chairperson));

  auto added = fixture.submit(kChair, covenant::schema::add_proposal_t{
                                          .name = "gamma",
                                          .description = "third"});
  ASSERT_EQ(added.code, 0u);
  auto encoder = covenant::testing::scale_encoder_t{};
  EXPECT_EQ(encoder.decode<uint64_t>(
                covenant::schema::make_bytes_view(added.data)),
            2u);
  EXPECT_EQ(load_proposal(fixture, 2).proposer, kChair);

  fixture.advance(kDay + 1);
  EXPECT_EQ(fixture
                .submit(kChair, covenant::schema::add_proposal_t{
                                    .name = "late", .description = "late"})
                .code,
            code_of(transaction_error_code::voting_not_active));
}

TEST(voting, finalize_freezes_the_winner) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_finalize"};
  open_session(fixture);
  ASSERT_EQ(
      fixture.submit(kAlice, covenant::schema::cast_vote_t{.proposal_id = 1})
          .code,
      0u);

  EXPECT_EQ(
      fixture.submit(kChair, covenant::schema::finalize_voting_t{}).code,
      code_of(transaction_error_code::voting_still_active));
  fixture.advance(kDay);
  EXPECT_EQ(
      fixture.submit(kChair, covenant::schema::finalize_voting_t{}).code,
      code_of(transaction_error_code::voting_still_active));

  fixture.advance(1);
  EXPECT_EQ(
      fixture.submit(kAlice, covenant::schema::finalize_voting_t{}).code,
      code_of(transaction_error_code::not_chairperson));
  auto finalized =
      fixture.submit(kChair, covenant::schema::finalize_voting_t{});
  ASSERT_EQ(finalized.code, 0u) << finalized.log;
  ASSERT_EQ(finalized.events.size(), 1u);
  EXPECT_EQ(covenant::testing::find_attribute(finalized.events.front(),
                                              "winning_proposal_id"),
            "1");

  auto summary = load_summary(fixture);
  EXPECT_TRUE(summary.finalized);
  EXPECT_FALSE(summary.active);
  EXPECT_EQ(
      fixture.submit(kChair, covenant::schema::finalize_voting_t{}).code,
      code_of(transaction_error_code::already_finalized));
  EXPECT_EQ(
      fixture
          .submit(kChair, covenant::schema::extend_voting_t{
                              .new_end = fixture.now() + kDay})
          .code,
      code_of(transaction_error_code::already_finalized));
  EXPECT_EQ(std::get<0>(covenant::testing::query_value<winner_t>(
                fixture.engine(), "/voting/winner")),
            1u);
}

TEST(voting, finalize_requires_a_proposal) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_empty"};
  ASSERT_EQ(fixture
                .submit(kChair, covenant::schema::open_voting_session_t{
                                    .title = "empty",
                                    .voting_start = fixture.now(),
                                    .voting_end = fixture.now() + 10})
                .code,
            0u);
  EXPECT_EQ(fixture.engine()
                .query("/voting/winner", covenant::schema::bytes_view_t{})
                .code,
            3u);
  fixture.advance(11);
  EXPECT_EQ(
      fixture.submit(kChair, covenant::schema::finalize_voting_t{}).code,
      code_of(transaction_error_code::invalid_proposal));
}

TEST(voting, extend_moves_the_end_forward_only) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_voting_extend"};
  open_session(fixture);
  auto end = fixture.now() + kDay;

  EXPECT_EQ(fixture
                .submit(kAlice,
                        covenant::schema::extend_voting_t{.new_end = end + 1})
                .code,
            code_of(transaction_error_code::not_chairperson));
  EXPECT_EQ(
      fixture.submit(kChair, covenant::schema::extend_voting_t{.new_end = end})
          .code,
      code_of(transaction_error_code::invalid_time_range));
  auto extended = fixture.submit(
      kChair, covenant::schema::extend_voting_t{.new_end = end + kDay});
  ASSERT_EQ(extended.code, 0u);
  EXPECT_TRUE(covenant::testing::has_event(extended, "VotingPeriodExtended"));

  fixture.advance(kDay + 1);
  EXPECT_EQ(
      fixture.submit(kAlice, covenant::schema::cast_vote_t{.proposal_id = 0})
          .code,
      0u);
}
