#pragma once

#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace covenant::execution {

using encoder_t = covenant::schema::encoding::encoder<
    covenant::schema::encoding::scale_encoder_tag>;
using storage_t =
    covenant::storage::storage<covenant::storage::rocksdb_storage_tag>;

/// Copy-on-write view over committed storage.
///
/// Reads fall through this overlay's writes, then the parent overlay, then
/// storage. Writes stay local until the owner either absorbs them into the
/// parent or drops the overlay, which discards them.
class state_overlay final {
 public:
  explicit state_overlay(const storage_t& storage,
                         const state_overlay* parent = nullptr);

  /// Child overlay stacked on this one.
  state_overlay nest() const;

  std::optional<covenant::schema::bytes_t> read(
      const covenant::schema::bytes_view_t& key) const;
  void write(covenant::schema::bytes_t key, covenant::schema::bytes_t value);

  template <typename T>
  std::optional<T> get(const covenant::schema::bytes_t& key) const {
    auto raw = read(covenant::schema::bytes_view_t{key.data(), key.size()});
    if (!raw) {
      return std::nullopt;
    }
    return encoder_.decode<T>(
        covenant::schema::bytes_view_t{raw->data(), raw->size()});
  }

  template <typename T>
  void put(covenant::schema::bytes_t key, const T& value) {
    write(std::move(key), encoder_.encode(value));
  }

  /// Merge a child overlay's writes into this overlay.
  void absorb(state_overlay&& child);

  const std::map<covenant::schema::bytes_t, covenant::schema::bytes_t>&
  writes() const;
  std::vector<covenant::storage::key_value_entry_t> entries() const;

 private:
  const storage_t* storage_;
  const state_overlay* parent_;
  mutable encoder_t encoder_;
  std::map<covenant::schema::bytes_t, covenant::schema::bytes_t> writes_;
};

}  // namespace covenant::execution
