#pragma once
#include <covenant/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace covenant::storage {

using key_value_entry_t =
    std::pair<covenant::schema::bytes_t, covenant::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  covenant::schema::hash32_t state_root{};
  covenant::schema::timestamp_seconds_t block_time{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const covenant::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const covenant::schema::bytes_view_t& key,
           const T& value);

  /// Return the raw encoded value at key, or std::nullopt when missing.
  std::optional<covenant::schema::bytes_t> load(
      const covenant::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint.
  void save_committed_state(const committed_state& state) const;

  /// Atomically write entries together with the new committed checkpoint.
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace covenant::storage
