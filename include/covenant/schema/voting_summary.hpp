#pragma once
#include <cstdint>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct voting_summary;

template <>
struct voting_summary<1> final {
  uint16_t version{1};
  std::string title;
  uint64_t proposal_count{};
  uint64_t registered_voters{};
  uint64_t votes_cast{};
  bool active{};
  bool finalized{};
};

using voting_summary_t = voting_summary<1>;

}  // namespace covenant::schema
