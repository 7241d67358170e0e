#pragma once
#include <covenant/schema/primitives.hpp>
#include <string>

// Schema type: voting session state.
// Governance workflow: The single ballot owned by the engine, its window,
// counters and the frozen result once finalized.
namespace covenant::schema {

template <uint16_t Version>
struct voting_session_state;

template <>
struct voting_session_state<1> final {
  uint16_t version{1};
  std::string title;
  account_id_t chairperson{};
  timestamp_seconds_t voting_start{};
  timestamp_seconds_t voting_end{};
  uint64_t proposal_count{};
  uint64_t registered_voters{};
  uint64_t votes_cast{};
  bool finalized{};
  uint64_t winning_proposal_id{};
};

using voting_session_state_t = voting_session_state<1>;

}  // namespace covenant::schema
