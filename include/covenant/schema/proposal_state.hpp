#pragma once
#include <covenant/schema/primitives.hpp>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  uint64_t proposal_id{};
  std::string name;
  std::string description;
  uint64_t vote_count{};
  account_id_t proposer{};
  timestamp_seconds_t created_at{};
};

using proposal_state_t = proposal_state<1>;

}  // namespace covenant::schema
