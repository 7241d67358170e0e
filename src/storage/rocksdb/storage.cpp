#include <covenant/common/critical.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

namespace covenant::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    covenant::common::critical("Failed to open RocksDB at {}: {}", path,
                               status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<covenant::schema::bytes_t> storage<rocksdb_storage_tag>::load(
    const covenant::schema::bytes_view_t& key) const {
  if (!database) {
    covenant::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    covenant::common::critical("Failed to get value from RocksDB: {}",
                               status.ToString());
  }
  return covenant::schema::bytes_t{std::begin(value), std::end(value)};
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto encoder = detail::encoder_t{};
  auto key = covenant::schema::key::make_prefix_key(
      encoder, covenant::schema::key::kCommittedStateKey);
  auto raw = load(covenant::schema::bytes_view_t{key.data(), key.size()});
  if (!raw) {
    return std::nullopt;
  }

  auto decoded = encoder.try_decode<
      std::tuple<int64_t, covenant::schema::hash32_t,
                 covenant::schema::timestamp_seconds_t>>(
      covenant::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    covenant::common::critical("Failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value()),
                         .block_time = std::get<2>(decoded.value())};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  commit_batch({}, state);
}

void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    covenant::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(
            covenant::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            covenant::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      covenant::common::critical("Failed writing key into commit batch: {}",
                                 put_status.ToString());
    }
  }

  auto state_key = covenant::schema::key::make_prefix_key(
      encoder, covenant::schema::key::kCommittedStateKey);
  auto state_value = detail::encode_committed_state(state);
  auto state_status = batch.Put(
      detail::to_slice(
          covenant::schema::bytes_view_t{state_key.data(), state_key.size()}),
      detail::to_slice(covenant::schema::bytes_view_t{state_value.data(),
                                                      state_value.size()}));
  if (!state_status.ok()) {
    covenant::common::critical(
        "Failed writing committed state into batch: {}",
        state_status.ToString());
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    covenant::common::critical("Failed to commit block state at height {}: {}",
                               state.height, write_status.ToString());
  }
}

}  // namespace covenant::storage
