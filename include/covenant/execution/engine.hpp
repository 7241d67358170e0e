#pragma once

#include <covenant/execution/call_context.hpp>
#include <covenant/execution/engine_options.hpp>
#include <covenant/execution/state_overlay.hpp>
#include <covenant/execution/transfer_sink.hpp>
#include <covenant/schema/app_info.hpp>
#include <covenant/schema/block_result.hpp>
#include <covenant/schema/commit_result.hpp>
#include <covenant/schema/encoding/encoder.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/query_result.hpp>
#include <covenant/schema/transaction.hpp>
#include <covenant/schema/transaction_error_code.hpp>
#include <covenant/schema/transaction_result.hpp>
#include <covenant/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace covenant::execution {

/// Deterministic settlement and governance state machine.
///
/// The host drives the engine in blocks: finalize_block executes transactions
/// in order against a block-local overlay, commit persists it atomically.
/// Each transaction runs on its own nested overlay and is rolled back in full
/// when it fails.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// Terminates through critical() when `options` are invalid. Loads the last
  /// committed checkpoint from storage.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  engine_options options = {});

  /// Admit a transaction for inclusion (CheckTx semantics).
  ///
  /// Performs decode and envelope validation against committed state only;
  /// does not mutate anything.
  covenant::schema::transaction_result_t check_transaction(
      const covenant::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state root.
  ///
  /// Transactions are processed in order; one result is returned per
  /// transaction, failures included. A call made while another
  /// finalize_block is running on this engine (for example from the transfer
  /// sink) touches no state and rejects every transaction with
  /// `reentrancy_detected`.
  covenant::schema::block_result_t finalize_block(
      int64_t height,
      covenant::schema::timestamp_seconds_t block_time,
      const std::vector<covenant::schema::bytes_t>& txs);

  /// Persist the latest finalized block in one storage write batch.
  covenant::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state root).
  covenant::schema::app_info_t info() const;

  /// Execute a read-path query against committed state.
  covenant::schema::query_result_t query(
      std::string_view path,
      const covenant::schema::bytes_view_t& data);

  /// Install the host's outgoing transfer callback.
  void set_transfer_sink(transfer_sink_t sink);

  const covenant::schema::hash32_t& chain_id() const;
  const engine_options& options() const;

 private:
  /// Validate version, chain id, caller and nonce.
  covenant::schema::transaction_result_t validate_transaction(
      const covenant::schema::transaction_t& tx,
      std::string_view codespace,
      const state_overlay& state);

  /// Run one validated transaction on `state`, including the payability and
  /// solvency checks.
  covenant::schema::transaction_result_t execute_transaction(
      const covenant::schema::transaction_t& tx,
      state_overlay& state,
      int64_t height,
      covenant::schema::timestamp_seconds_t block_time);

  /// Dispatch a payload to its settlement module.
  covenant::schema::transaction_result_t execute_operation(
      const covenant::schema::transaction_t& tx,
      call_context& context);

  /// Append the transaction's events to the persisted event log.
  void append_events(
      state_overlay& state,
      int64_t height,
      uint32_t tx_index,
      const std::vector<covenant::schema::transaction_event_t>& events);

  void load_persisted_state();

  mutable std::recursive_mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  engine_options options_;
  bool entered_{false};
  int64_t last_committed_height_{};
  covenant::schema::hash32_t last_committed_state_root_{};
  covenant::schema::timestamp_seconds_t last_committed_block_time_{};
  int64_t pending_height_{};
  covenant::schema::hash32_t pending_state_root_{};
  covenant::schema::timestamp_seconds_t pending_block_time_{};
  std::optional<state_overlay> pending_state_;
  covenant::schema::hash32_t chain_id_{};
  transfer_sink_t transfer_sink_;
};

/// Chain id every transaction must carry.
covenant::schema::hash32_t make_chain_id();

}  // namespace covenant::execution
