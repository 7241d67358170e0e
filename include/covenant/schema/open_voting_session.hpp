#pragma once
#include <covenant/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: open voting session.
// Governance workflow: Creates the ballot; the caller becomes chairperson and
// the initial proposals are numbered from zero.
namespace covenant::schema {

template <uint16_t Version>
struct open_voting_session;

template <>
struct open_voting_session<1> final {
  uint16_t version{1};
  std::string title;
  timestamp_seconds_t voting_start{};
  timestamp_seconds_t voting_end{};
  std::vector<std::string> proposal_names;
  std::vector<std::string> proposal_descriptions;
};

using open_voting_session_t = open_voting_session<1>;

}  // namespace covenant::schema
