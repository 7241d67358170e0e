#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <covenant/execution/voting_module.hpp>
#include <covenant/schema/key/engine_keys.hpp>

using namespace covenant::schema;

namespace covenant::execution {

voting_module::voting_module(call_context& context) : context_{context} {}

transaction_result_t voting_module::open_session(
    const open_voting_session_t& payload) {
  if (load_session(context_.state)) {
    return make_error_result(transaction_error_code::voting_session_exists,
                             kVotingCodespace);
  }
  if (payload.voting_end <= payload.voting_start) {
    return make_error_result(
        transaction_error_code::invalid_time_range, kVotingCodespace,
        fmt::format("start={} end={}", payload.voting_start,
                    payload.voting_end));
  }
  if (payload.proposal_names.size() != payload.proposal_descriptions.size()) {
    return make_error_result(
        transaction_error_code::invalid_proposal, kVotingCodespace,
        fmt::format("names={} descriptions={}", payload.proposal_names.size(),
                    payload.proposal_descriptions.size()));
  }

  auto session = voting_session_state_t{};
  session.title = payload.title;
  session.chairperson = context_.caller;
  session.voting_start = payload.voting_start;
  session.voting_end = payload.voting_end;
  save_voter(context_.caller, voter_state_t{});
  session.registered_voters = 1;

  context_.events.push_back(make_event(
      "VotingSessionOpened",
      {make_attribute("chairperson", to_hex(context_.caller), true),
       make_attribute("start", std::to_string(payload.voting_start)),
       make_attribute("end", std::to_string(payload.voting_end))}));
  for (size_t i = 0; i < payload.proposal_names.size(); ++i) {
    create_proposal(session, payload.proposal_names[i],
                    payload.proposal_descriptions[i]);
  }
  save_session(session);
  return make_success_result();
}

transaction_result_t voting_module::register_voter(
    const register_voter_t& payload) {
  auto session = load_session(context_.state);
  if (!session) {
    return missing_session();
  }
  if (context_.caller != session->chairperson) {
    return not_chairperson();
  }
  if (session->finalized) {
    return make_error_result(transaction_error_code::already_finalized,
                             kVotingCodespace);
  }
  if (is_null(payload.voter)) {
    return make_error_result(transaction_error_code::zero_address,
                             kVotingCodespace, "field=voter");
  }
  auto result = register_account(*session, payload.voter);
  if (result.code != 0) {
    return result;
  }
  save_session(*session);
  context_.events.push_back(
      make_event("VoterRegistered",
                 {make_attribute("voter", to_hex(payload.voter), true)}));
  return result;
}

transaction_result_t voting_module::register_voters_batch(
    const register_voters_batch_t& payload) {
  auto session = load_session(context_.state);
  if (!session) {
    return missing_session();
  }
  if (context_.caller != session->chairperson) {
    return not_chairperson();
  }
  if (session->finalized) {
    return make_error_result(transaction_error_code::already_finalized,
                             kVotingCodespace);
  }

  auto registered = uint64_t{};
  for (const auto& voter : payload.voters) {
    if (is_null(voter)) {
      continue;
    }
    if (register_account(*session, voter).code == 0) {
      ++registered;
    }
  }
  save_session(*session);
  context_.events.push_back(
      make_event("VotersBatchRegistered",
                 {make_attribute("count", std::to_string(registered))}));
  return make_success_result(fmt::format("registered={}", registered));
}

transaction_result_t voting_module::add_proposal(
    const add_proposal_t& payload) {
  auto session = load_session(context_.state);
  if (!session) {
    return missing_session();
  }
  if (context_.caller != session->chairperson) {
    return not_chairperson();
  }
  if (session->finalized || context_.block_time > session->voting_end) {
    return make_error_result(
        transaction_error_code::voting_not_active, kVotingCodespace,
        fmt::format("now={} end={}", context_.block_time, session->voting_end));
  }
  auto proposal_id = session->proposal_count;
  create_proposal(*session, payload.name, payload.description);
  save_session(*session);

  auto result = make_success_result();
  result.data = encoder_.encode(proposal_id);
  return result;
}

transaction_result_t voting_module::vote(const cast_vote_t& payload) {
  auto session = load_session(context_.state);
  if (!session) {
    return missing_session();
  }
  auto voter = load_voter(context_.state, context_.caller);
  if (!voter) {
    return make_error_result(transaction_error_code::voter_not_registered,
                             kVotingCodespace,
                             fmt::format("voter={}", to_hex(context_.caller)));
  }
  if (voter->voted) {
    return make_error_result(transaction_error_code::already_voted,
                             kVotingCodespace);
  }
  if (!is_active(*session, context_.block_time)) {
    return make_error_result(
        transaction_error_code::voting_not_active, kVotingCodespace,
        fmt::format("now={} start={} end={}", context_.block_time,
                    session->voting_start, session->voting_end));
  }
  auto proposal = load_proposal(context_.state, payload.proposal_id);
  if (!proposal) {
    return make_error_result(
        transaction_error_code::invalid_proposal, kVotingCodespace,
        fmt::format("proposal_id={} count={}", payload.proposal_id,
                    session->proposal_count));
  }

  voter->voted = true;
  voter->proposal_id = payload.proposal_id;
  save_voter(context_.caller, *voter);
  proposal->vote_count += voter->weight;
  save_proposal(*proposal);
  ++session->votes_cast;
  save_session(*session);

  context_.events.push_back(make_event(
      "VoteCast",
      {make_attribute("voter", to_hex(context_.caller), true),
       make_attribute("proposal_id", std::to_string(payload.proposal_id), true),
       make_attribute("weight", std::to_string(voter->weight))}));
  return make_success_result();
}

transaction_result_t voting_module::delegate(const delegate_vote_t& payload) {
  auto session = load_session(context_.state);
  if (!session) {
    return missing_session();
  }
  auto sender = load_voter(context_.state, context_.caller);
  if (!sender) {
    return make_error_result(transaction_error_code::voter_not_registered,
                             kVotingCodespace,
                             fmt::format("voter={}", to_hex(context_.caller)));
  }
  if (sender->voted) {
    return make_error_result(transaction_error_code::already_voted,
                             kVotingCodespace);
  }
  if (!is_active(*session, context_.block_time)) {
    return make_error_result(
        transaction_error_code::voting_not_active, kVotingCodespace,
        fmt::format("now={} start={} end={}", context_.block_time,
                    session->voting_start, session->voting_end));
  }
  if (payload.to == context_.caller) {
    return make_error_result(
        transaction_error_code::self_delegation_not_allowed, kVotingCodespace);
  }
  auto delegate_voter = load_voter(context_.state, payload.to);
  if (!delegate_voter) {
    return make_error_result(transaction_error_code::voter_not_registered,
                             kVotingCodespace,
                             fmt::format("voter={}", to_hex(payload.to)));
  }

  auto final_delegate = payload.to;
  auto hops = uint32_t{};
  while (delegate_voter->delegate.has_value()) {
    final_delegate = *delegate_voter->delegate;
    if (final_delegate == context_.caller) {
      return make_error_result(
          transaction_error_code::delegation_loop_detected, kVotingCodespace,
          fmt::format("from={} hops={}", to_hex(context_.caller), hops));
    }
    if (++hops > context_.options.max_delegation_hops) {
      return make_error_result(
          transaction_error_code::delegation_depth_exceeded, kVotingCodespace,
          fmt::format("max_hops={}", context_.options.max_delegation_hops));
    }
    delegate_voter = load_voter(context_.state, final_delegate);
    if (!delegate_voter) {
      return make_error_result(transaction_error_code::voter_not_registered,
                               kVotingCodespace,
                               fmt::format("voter={}", to_hex(final_delegate)));
    }
  }

  sender->voted = true;
  sender->delegate = final_delegate;
  save_voter(context_.caller, *sender);

  if (delegate_voter->voted) {
    auto proposal = load_proposal(context_.state, delegate_voter->proposal_id);
    if (!proposal) {
      return make_error_result(transaction_error_code::invalid_proposal,
                               kVotingCodespace);
    }
    proposal->vote_count += sender->weight;
    save_proposal(*proposal);
  } else {
    delegate_voter->weight += sender->weight;
    save_voter(final_delegate, *delegate_voter);
  }
  spdlog::debug("Delegation from {} resolved to {} after {} hop(s)",
                to_hex(context_.caller), to_hex(final_delegate), hops);

  context_.events.push_back(make_event(
      "VoteDelegated", {make_attribute("from", to_hex(context_.caller), true),
                        make_attribute("to", to_hex(final_delegate), true)}));
  return make_success_result();
}

transaction_result_t voting_module::finalize(const finalize_voting_t&) {
  auto session = load_session(context_.state);
  if (!session) {
    return missing_session();
  }
  if (context_.caller != session->chairperson) {
    return not_chairperson();
  }
  if (session->finalized) {
    return make_error_result(transaction_error_code::already_finalized,
                             kVotingCodespace);
  }
  if (context_.block_time <= session->voting_end) {
    return make_error_result(
        transaction_error_code::voting_still_active, kVotingCodespace,
        fmt::format("now={} end={}", context_.block_time, session->voting_end));
  }
  auto leader = winner(context_.state);
  if (!leader) {
    return make_error_result(transaction_error_code::invalid_proposal,
                             kVotingCodespace, "proposal_count=0");
  }

  session->finalized = true;
  session->winning_proposal_id = leader->proposal_id;
  save_session(*session);

  context_.events.push_back(make_event(
      "VotingFinalized",
      {make_attribute("winning_proposal_id",
                      std::to_string(leader->proposal_id), true),
       make_attribute("name", leader->name),
       make_attribute("votes", std::to_string(leader->vote_count))}));
  return make_success_result();
}

transaction_result_t voting_module::extend_voting(
    const extend_voting_t& payload) {
  auto session = load_session(context_.state);
  if (!session) {
    return missing_session();
  }
  if (context_.caller != session->chairperson) {
    return not_chairperson();
  }
  if (session->finalized) {
    return make_error_result(transaction_error_code::already_finalized,
                             kVotingCodespace);
  }
  if (payload.new_end <= session->voting_end) {
    return make_error_result(
        transaction_error_code::invalid_time_range, kVotingCodespace,
        fmt::format("end={} new_end={}", session->voting_end, payload.new_end));
  }

  session->voting_end = payload.new_end;
  save_session(*session);
  context_.events.push_back(make_event(
      "VotingPeriodExtended",
      {make_attribute("new_end", std::to_string(payload.new_end))}));
  return make_success_result();
}

std::optional<voting_session_state_t> voting_module::load_session(
    const state_overlay& state) {
  auto encoder = encoder_t{};
  return state.get<voting_session_state_t>(
      key::make_prefix_key(encoder, key::kVotingSessionKey));
}

std::optional<voter_state_t> voting_module::load_voter(
    const state_overlay& state,
    const account_id_t& voter) {
  auto encoder = encoder_t{};
  return state.get<voter_state_t>(key::make_voter_key(encoder, voter));
}

std::optional<proposal_state_t> voting_module::load_proposal(
    const state_overlay& state,
    uint64_t proposal_id) {
  auto encoder = encoder_t{};
  return state.get<proposal_state_t>(
      key::make_proposal_key(encoder, proposal_id));
}

std::optional<proposal_state_t> voting_module::winner(
    const state_overlay& state) {
  auto session = load_session(state);
  if (!session || session->proposal_count == 0) {
    return std::nullopt;
  }
  if (session->finalized) {
    return load_proposal(state, session->winning_proposal_id);
  }
  auto leader = std::optional<proposal_state_t>{};
  for (uint64_t id = 0; id < session->proposal_count; ++id) {
    auto proposal = load_proposal(state, id);
    if (!proposal) {
      continue;
    }
    if (!leader || proposal->vote_count > leader->vote_count) {
      leader = std::move(proposal);
    }
  }
  return leader;
}

voting_summary_t voting_module::summary(const state_overlay& state,
                                        timestamp_seconds_t now) {
  auto result = voting_summary_t{};
  auto session = load_session(state);
  if (!session) {
    return result;
  }
  result.title = session->title;
  result.proposal_count = session->proposal_count;
  result.registered_voters = session->registered_voters;
  result.votes_cast = session->votes_cast;
  result.active = is_active(*session, now);
  result.finalized = session->finalized;
  return result;
}

bool voting_module::is_active(const voting_session_state_t& session,
                              timestamp_seconds_t now) {
  return !session.finalized && now >= session.voting_start &&
         now <= session.voting_end;
}

transaction_result_t voting_module::missing_session() const {
  return make_error_result(transaction_error_code::voting_session_missing,
                           kVotingCodespace);
}

transaction_result_t voting_module::not_chairperson() const {
  return make_error_result(transaction_error_code::not_chairperson,
                           kVotingCodespace,
                           unauthorized_info(context_.caller, "chairperson"));
}

transaction_result_t voting_module::register_account(
    voting_session_state_t& session,
    const account_id_t& voter) {
  if (load_voter(context_.state, voter)) {
    return make_error_result(transaction_error_code::voter_already_registered,
                             kVotingCodespace,
                             fmt::format("voter={}", to_hex(voter)));
  }
  save_voter(voter, voter_state_t{});
  ++session.registered_voters;
  return make_success_result();
}

void voting_module::save_session(const voting_session_state_t& session) {
  context_.state.put(key::make_prefix_key(encoder_, key::kVotingSessionKey),
                     session);
}

void voting_module::save_voter(const account_id_t& account,
                               const voter_state_t& voter) {
  context_.state.put(key::make_voter_key(encoder_, account), voter);
}

void voting_module::save_proposal(const proposal_state_t& proposal) {
  context_.state.put(key::make_proposal_key(encoder_, proposal.proposal_id),
                     proposal);
}

void voting_module::create_proposal(voting_session_state_t& session,
                                    const std::string& name,
                                    const std::string& description) {
  auto proposal = proposal_state_t{};
  proposal.proposal_id = session.proposal_count++;
  proposal.name = name;
  proposal.description = description;
  proposal.proposer = context_.caller;
  proposal.created_at = context_.block_time;
  save_proposal(proposal);

  context_.events.push_back(make_event(
      "ProposalCreated",
      {make_attribute("proposal_id", std::to_string(proposal.proposal_id),
                      true),
       make_attribute("name", proposal.name),
       make_attribute("proposer", to_hex(proposal.proposer), true)}));
}

}  // namespace covenant::execution
