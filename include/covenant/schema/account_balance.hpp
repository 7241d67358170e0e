#pragma once
#include <covenant/schema/primitives.hpp>

// Schema type: account balance.
// Settlement workflow: Pull-payment ledger row shared by every engine module.
namespace covenant::schema {

template <uint16_t Version>
struct account_balance;

template <>
struct account_balance<1> final {
  uint16_t version{1};
  amount_t available{};           // delivered through the transfer sink
  amount_t pending_withdrawal{};  // owed, claimable through withdraw
};

using account_balance_t = account_balance<1>;

}  // namespace covenant::schema
