#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/key/engine_keys.hpp>
#include <covenant/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace covenant::storage {

namespace detail {

using encoder_t = covenant::schema::encoding::encoder<
    covenant::schema::encoding::scale_encoder_tag>;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const covenant::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline covenant::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(
      std::tuple{state.height, state.state_root, state.block_time});
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const covenant::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const covenant::schema::bytes_view_t& key,
           const T& value);

  std::optional<covenant::schema::bytes_t> load(
      const covenant::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const covenant::schema::bytes_view_t& key) const {
  auto value = load(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      covenant::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const covenant::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    covenant::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
                    detail::to_slice(covenant::schema::bytes_view_t{
                        encoded_value.data(), encoded_value.size()}));
  if (!status.ok()) {
    covenant::common::critical("Failed to put value into RocksDB: {}",
                               status.ToString());
  }
}

}  // namespace covenant::storage
