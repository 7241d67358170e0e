#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <covenant/blake3/hash.hpp>
#include <covenant/execution/engine.hpp>
#include <covenant/execution/escrow_module.hpp>
#include <covenant/execution/ledger.hpp>
#include <covenant/execution/marketplace_module.hpp>
#include <covenant/execution/reentrancy_guard.hpp>
#include <covenant/execution/voting_module.hpp>
#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/event_record.hpp>
#include <covenant/schema/key/engine_keys.hpp>
#include <covenant/schema/query_error_code.hpp>
#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

using namespace covenant::schema;

namespace {

inline constexpr auto kChainIdSeed =
    std::string_view{"covenant-settlement-chain"};
inline constexpr auto kQueryCodespace = std::string_view{"covenant.query"};
inline constexpr auto kMaxEventRange = uint64_t{1000};

covenant::schema::hash32_t fold_state_root(
    const covenant::schema::hash32_t& seed,
    const covenant::schema::bytes_t& tx,
    int64_t height,
    uint64_t index) {
  auto encoder = covenant::execution::encoder_t{};
  auto position = encoder.encode(std::tuple{height, index});
  return covenant::blake3::hasher{}
      .update(covenant::schema::bytes_view_t{seed.data(), seed.size()})
      .update(covenant::schema::bytes_view_t{tx.data(), tx.size()})
      .update(covenant::schema::bytes_view_t{position.data(), position.size()})
      .finalize();
}

std::optional<covenant::schema::transaction_t> decode_transaction(
    const covenant::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = covenant::execution::encoder_t{};
  auto tx = encoder.try_decode<covenant::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed transaction bytes";
  }
  return tx;
}

bool is_payable(const covenant::schema::transaction_payload_t& payload) {
  return std::holds_alternative<covenant::schema::create_escrow_t>(payload) ||
         std::holds_alternative<covenant::schema::buy_item_t>(payload);
}

uint64_t next_nonce(const covenant::execution::state_overlay& state,
                    const covenant::schema::account_id_t& account) {
  auto encoder = covenant::execution::encoder_t{};
  return state.get<uint64_t>(key::make_nonce_key(encoder, account))
             .value_or(0) +
         1;
}

covenant::schema::query_result_t make_query_error(
    covenant::schema::query_error_code code,
    std::string log,
    int64_t height) {
  auto result = covenant::schema::query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace

namespace covenant::execution {

covenant::schema::hash32_t make_chain_id() {
  return covenant::blake3::hash(kChainIdSeed);
}

engine::engine(encoder_t& encoder, storage_t& storage, engine_options options)
    : encoder_{encoder}, storage_{storage}, options_{std::move(options)} {
  auto lock = std::scoped_lock{mutex_};
  validate_options(options_);
  chain_id_ = make_chain_id();
  load_persisted_state();
  spdlog::info(
      "Settlement engine ready at height {} (escrow fee {} bps, marketplace "
      "fee {} bps, platform account {})",
      last_committed_height_, options_.escrow_fee_bps,
      options_.marketplace_fee_bps, to_hex(options_.platform_account));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             kCheckTxCodespace, decode_error);
  }
  auto committed = state_overlay{storage_};
  auto result = validate_transaction(*maybe_tx, kCheckTxCodespace, committed);
  if (result.code != 0) {
    return result;
  }
  if (maybe_tx->value > 0 && !is_payable(maybe_tx->payload)) {
    return make_error_result(transaction_error_code::value_not_accepted,
                             kCheckTxCodespace,
                             fmt::format("value={}", maybe_tx->value.str()));
  }
  return result;
}

block_result_t engine::finalize_block(int64_t height,
                                      timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto guard = reentrancy_guard{entered_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  if (!guard.acquired()) {
    spdlog::warn("Rejected nested finalize_block at height {} ({} tx)", height,
                 txs.size());
    for (size_t i = 0; i < txs.size(); ++i) {
      result.tx_results.push_back(
          make_error_result(transaction_error_code::reentrancy_detected,
                            kFinalizeCodespace, "engine call in progress"));
    }
    result.state_root = last_committed_state_root_;
    return result;
  }

  pending_state_.emplace(storage_);
  auto& block_state = *pending_state_;
  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        bytes_view_t{txs[i].data(), txs[i].size()}, decode_error);
    if (!maybe_tx) {
      spdlog::warn("Rejected undecodable transaction {} at height {}: {}", i,
                   height, decode_error);
      result.tx_results.push_back(
          make_error_result(transaction_error_code::invalid_transaction,
                            kFinalizeCodespace, decode_error));
      continue;
    }

    auto validation =
        validate_transaction(*maybe_tx, kFinalizeCodespace, block_state);
    if (validation.code != 0) {
      spdlog::warn("Rejected transaction {} at height {}: {} {}", i, height,
                   validation.log, validation.info);
      result.tx_results.push_back(std::move(validation));
      continue;
    }

    auto tx_state = block_state.nest();
    auto tx_result =
        execute_transaction(*maybe_tx, tx_state, height, block_time);
    if (tx_result.code == 0) {
      tx_state.put(key::make_nonce_key(encoder_, maybe_tx->caller),
                   maybe_tx->nonce);
      append_events(tx_state, height, static_cast<uint32_t>(i),
                    tx_result.events);
      block_state.absorb(std::move(tx_state));
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
      spdlog::debug("Transaction {} at height {} succeeded with {} event(s)",
                    i, height, tx_result.events.size());
    } else {
      spdlog::debug("Transaction {} at height {} failed: {} {}", i, height,
                    tx_result.log, tx_result.info);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = height;
  pending_block_time_ = block_time;
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  auto guard = reentrancy_guard{entered_};
  auto result = commit_result_t{};
  if (!guard.acquired()) {
    spdlog::warn("Ignored nested commit");
  } else if (pending_state_.has_value()) {
    storage_.commit_batch(
        pending_state_->entries(),
        covenant::storage::committed_state{.height = pending_height_,
                                           .state_root = pending_state_root_,
                                           .block_time = pending_block_time_});
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    last_committed_block_time_ = pending_block_time_;
    pending_state_.reset();
    spdlog::info("Committed height {} with state root {}",
                 last_committed_height_, to_hex(last_committed_state_root_));
  }

  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto committed = state_overlay{storage_};
  auto height = last_committed_height_;

  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  auto respond = [&](const auto& value) {
    result.value = encoder_.encode(value);
    return result;
  };
  auto invalid_data = [&]() {
    return make_query_error(query_error_code::invalid_data,
                            "malformed query data", height);
  };
  auto not_found = [&](std::string log) {
    return make_query_error(query_error_code::not_found, std::move(log),
                            height);
  };

  if (path == "/engine/info") {
    return respond(std::tuple{last_committed_height_,
                              last_committed_state_root_, chain_id_});
  }
  if (path == "/engine/nonce") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return invalid_data();
    }
    return respond(next_nonce(committed, *account));
  }
  if (path == "/ledger/balance") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return invalid_data();
    }
    return respond(ledger::load_balance(committed, *account));
  }
  if (path == "/ledger/held") {
    return respond(ledger::load_held(committed));
  }
  if (path == "/escrow/get" || path == "/escrow/expired") {
    auto escrow_id = encoder_.try_decode<uint64_t>(data);
    if (!escrow_id) {
      return invalid_data();
    }
    auto escrow = escrow_module::load(committed, *escrow_id);
    if (!escrow) {
      return not_found("escrow not found");
    }
    if (path == "/escrow/expired") {
      return respond(
          escrow_module::is_expired(*escrow, last_committed_block_time_));
    }
    return respond(*escrow);
  }
  if (path == "/escrow/platform_balance") {
    return respond(
        ledger::load_balance(committed, options_.platform_account)
            .pending_withdrawal);
  }
  if (path == "/escrow/count") {
    return respond(escrow_module::count(committed));
  }
  if (path == "/voting/winner") {
    auto leader = voting_module::winner(committed);
    if (!leader) {
      return not_found("no proposals");
    }
    return respond(
        std::tuple{leader->proposal_id, leader->name, leader->vote_count});
  }
  if (path == "/voting/summary") {
    if (!voting_module::load_session(committed)) {
      return not_found("voting session not opened");
    }
    return respond(
        voting_module::summary(committed, last_committed_block_time_));
  }
  if (path == "/voting/proposal") {
    auto proposal_id = encoder_.try_decode<uint64_t>(data);
    if (!proposal_id) {
      return invalid_data();
    }
    auto proposal = voting_module::load_proposal(committed, *proposal_id);
    if (!proposal) {
      return not_found("proposal not found");
    }
    return respond(*proposal);
  }
  if (path == "/voting/voter") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return invalid_data();
    }
    auto voter = voting_module::load_voter(committed, *account);
    if (!voter) {
      return not_found("voter not registered");
    }
    return respond(*voter);
  }
  if (path == "/marketplace/listing" || path == "/marketplace/asset") {
    auto token_id = encoder_.try_decode<uint64_t>(data);
    if (!token_id) {
      return invalid_data();
    }
    auto asset = marketplace_module::load_asset(committed, *token_id);
    if (!asset) {
      return not_found("token not found");
    }
    if (path == "/marketplace/asset") {
      return respond(*asset);
    }
    return respond(marketplace_module::load_listing(committed, *token_id)
                       .value_or(listing_state_t{.token_id = *token_id}));
  }
  if (path == "/marketplace/token_uri") {
    auto token_id = encoder_.try_decode<uint64_t>(data);
    if (!token_id) {
      return invalid_data();
    }
    auto asset = marketplace_module::load_asset(committed, *token_id);
    if (!asset) {
      return not_found("token not found");
    }
    return respond(asset->uri);
  }
  if (path == "/marketplace/balance") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return invalid_data();
    }
    return respond(marketplace_module::balance_of(committed, *account));
  }
  if (path == "/marketplace/total_supply") {
    return respond(marketplace_module::asset_count(committed));
  }
  if (path == "/marketplace/operator") {
    auto pair =
        encoder_.try_decode<std::tuple<account_id_t, account_id_t>>(data);
    if (!pair) {
      return invalid_data();
    }
    return respond(marketplace_module::is_approved_for_all(
        committed, std::get<0>(*pair), std::get<1>(*pair)));
  }
  if (path == "/marketplace/fee") {
    return respond(marketplace_module::platform_fee(committed, options_));
  }
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range || std::get<1>(*range) < std::get<0>(*range)) {
      return invalid_data();
    }
    auto count =
        committed
            .get<uint64_t>(key::make_prefix_key(encoder_, key::kEventCountKey))
            .value_or(0);
    auto from = std::get<0>(*range);
    auto to = std::min({std::get<1>(*range), from + kMaxEventRange - 1,
                        count == 0 ? uint64_t{0} : count - 1});
    auto records = std::vector<event_record_t>{};
    for (auto id = from; id < count && id <= to; ++id) {
      auto record =
          committed.get<event_record_t>(key::make_event_key(encoder_, id));
      if (record) {
        records.push_back(std::move(*record));
      }
    }
    return respond(records);
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", height);
}

void engine::set_transfer_sink(transfer_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  transfer_sink_ = std::move(sink);
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

const engine_options& engine::options() const {
  return options_;
}

transaction_result_t engine::validate_transaction(const transaction_t& tx,
                                                  std::string_view codespace,
                                                  const state_overlay& state) {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version, codespace,
        fmt::format("version={} expected=1", tx.version));
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             codespace,
                             fmt::format("chain_id={}", to_hex(tx.chain_id)));
  }
  if (is_null(tx.caller)) {
    return make_error_result(transaction_error_code::zero_address, codespace,
                             "field=caller");
  }
  auto expected = next_nonce(state, tx.caller);
  if (tx.nonce != expected) {
    return make_error_result(
        transaction_error_code::invalid_nonce, codespace,
        fmt::format("nonce={} expected={}", tx.nonce, expected));
  }
  return make_success_result();
}

transaction_result_t engine::execute_transaction(
    const transaction_t& tx,
    state_overlay& state,
    int64_t height,
    timestamp_seconds_t block_time) {
  if (tx.value > 0 && !is_payable(tx.payload)) {
    return make_error_result(transaction_error_code::value_not_accepted,
                             kFinalizeCodespace,
                             fmt::format("value={}", tx.value.str()));
  }

  auto accounts = ledger{state, transfer_sink_};
  auto context = call_context{.state = state,
                              .ledger = accounts,
                              .options = options_,
                              .height = height,
                              .block_time = block_time,
                              .caller = tx.caller,
                              .value = tx.value,
                              .events = {}};
  accounts.receive(tx.value);

  auto result = execute_operation(tx, context);
  if (result.code != 0) {
    return result;
  }
  if (!accounts.solvent()) {
    spdlog::error("Ledger invariant violated: pending {} exceeds held {}",
                  accounts.total_pending().str(), accounts.held().str());
    return make_error_result(
        transaction_error_code::ledger_invariant_violated, kLedgerCodespace,
        fmt::format("total_pending={} held={}",
                    accounts.total_pending().str(), accounts.held().str()));
  }
  result.events = std::move(context.events);
  return result;
}

transaction_result_t engine::execute_operation(const transaction_t& tx,
                                               call_context& context) {
  auto escrow = escrow_module{context};
  auto voting = voting_module{context};
  auto marketplace = marketplace_module{context};
  return std::visit(
      overloaded{
          [&](const create_escrow_t& payload) {
            return escrow.create(payload);
          },
          [&](const release_escrow_t& payload) {
            return escrow.release(payload);
          },
          [&](const refund_escrow_t& payload) {
            return escrow.refund(payload);
          },
          [&](const raise_dispute_t& payload) {
            return escrow.raise_dispute(payload);
          },
          [&](const resolve_dispute_t& payload) {
            return escrow.resolve_dispute(payload);
          },
          [&](const withdraw_platform_fees_t& payload) {
            return escrow.withdraw_platform_fees(payload);
          },
          [&](const open_voting_session_t& payload) {
            return voting.open_session(payload);
          },
          [&](const register_voter_t& payload) {
            return voting.register_voter(payload);
          },
          [&](const register_voters_batch_t& payload) {
            return voting.register_voters_batch(payload);
          },
          [&](const add_proposal_t& payload) {
            return voting.add_proposal(payload);
          },
          [&](const cast_vote_t& payload) { return voting.vote(payload); },
          [&](const delegate_vote_t& payload) {
            return voting.delegate(payload);
          },
          [&](const finalize_voting_t& payload) {
            return voting.finalize(payload);
          },
          [&](const extend_voting_t& payload) {
            return voting.extend_voting(payload);
          },
          [&](const mint_asset_t& payload) {
            return marketplace.mint(payload);
          },
          [&](const approve_asset_t& payload) {
            return marketplace.approve(payload);
          },
          [&](const transfer_asset_t& payload) {
            return marketplace.transfer(payload);
          },
          [&](const list_item_t& payload) { return marketplace.list(payload); },
          [&](const buy_item_t& payload) { return marketplace.buy(payload); },
          [&](const cancel_listing_t& payload) {
            return marketplace.cancel(payload);
          },
          [&](const update_platform_fee_t& payload) {
            return marketplace.update_platform_fee(payload);
          },
          [&](const withdraw_t& payload) {
            return marketplace.withdraw(payload);
          },
          [&](const set_approval_for_all_t& payload) {
            return marketplace.set_approval_for_all(payload);
          }},
      tx.payload);
}

void engine::append_events(state_overlay& state,
                           int64_t height,
                           uint32_t tx_index,
                           const std::vector<transaction_event_t>& events) {
  if (events.empty()) {
    return;
  }
  auto count_key = key::make_prefix_key(encoder_, key::kEventCountKey);
  auto next_id = state.get<uint64_t>(count_key).value_or(0);
  for (const auto& event : events) {
    state.put(key::make_event_key(encoder_, next_id),
              event_record_t{.event_id = next_id,
                             .height = height,
                             .tx_index = tx_index,
                             .event = event});
    ++next_id;
  }
  state.put(std::move(count_key), next_id);
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    last_committed_block_time_ = committed->block_time;
    return;
  }
  last_committed_state_root_ = make_zero_hash();
  storage_.save_committed_state(covenant::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_,
      .block_time = last_committed_block_time_});
}

}  // namespace covenant::execution
