#pragma once

#include <covenant/execution/engine_options.hpp>
#include <covenant/execution/ledger.hpp>
#include <covenant/execution/state_overlay.hpp>
#include <covenant/schema/escrow_status.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/transaction_error_code.hpp>
#include <covenant/schema/transaction_event.hpp>
#include <covenant/schema/transaction_result.hpp>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace covenant::execution {

inline constexpr auto kCheckTxCodespace = std::string_view{"covenant.checktx"};
inline constexpr auto kFinalizeCodespace =
    std::string_view{"covenant.finalize"};
inline constexpr auto kEscrowCodespace = std::string_view{"covenant.escrow"};
inline constexpr auto kVotingCodespace = std::string_view{"covenant.voting"};
inline constexpr auto kMarketplaceCodespace =
    std::string_view{"covenant.marketplace"};
inline constexpr auto kLedgerCodespace = std::string_view{"covenant.ledger"};

/// Everything one operation may touch: its transaction overlay, the shared
/// ledger bound to that overlay, and the call's principal and attached value.
struct call_context final {
  state_overlay& state;
  covenant::execution::ledger& ledger;
  const engine_options& options;
  int64_t height{};
  covenant::schema::timestamp_seconds_t block_time{};
  covenant::schema::account_id_t caller{};
  covenant::schema::amount_t value{};
  std::vector<covenant::schema::transaction_event_t> events;
};

covenant::schema::transaction_result_t make_error_result(
    covenant::schema::transaction_error_code code,
    std::string_view codespace,
    std::string info = {});

covenant::schema::transaction_result_t make_success_result(
    std::string info = {});

/// `caller=<hex> required_role=<role>`
std::string unauthorized_info(const covenant::schema::account_id_t& caller,
                              std::string_view required_role);

/// `current=<status> expected=<status>`
std::string invalid_state_info(covenant::schema::escrow_status_t current,
                               covenant::schema::escrow_status_t expected);

covenant::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    std::string value,
    bool index = false);

covenant::schema::transaction_event_t make_event(
    std::string type,
    std::initializer_list<covenant::schema::transaction_event_attribute_t>
        attributes);

}  // namespace covenant::execution
