#pragma once
#include <covenant/schema/primitives.hpp>
#include <optional>

namespace covenant::schema {

template <uint16_t Version>
struct voter_state;

template <>
struct voter_state<1> final {
  uint16_t version{1};
  uint64_t weight{1};
  bool voted{};
  std::optional<account_id_t> delegate;
  uint64_t proposal_id{};  // meaningful only when voted without delegate
};

using voter_state_t = voter_state<1>;

}  // namespace covenant::schema
