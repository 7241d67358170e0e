#include <covenant/execution/state_overlay.hpp>
#include <iterator>
#include <utility>

namespace covenant::execution {

state_overlay::state_overlay(const storage_t& storage,
                             const state_overlay* parent)
    : storage_{&storage}, parent_{parent} {}

state_overlay state_overlay::nest() const {
  return state_overlay{*storage_, this};
}

std::optional<covenant::schema::bytes_t> state_overlay::read(
    const covenant::schema::bytes_view_t& key) const {
  auto it = writes_.find(covenant::schema::bytes_t{std::begin(key),
                                                   std::end(key)});
  if (it != std::end(writes_)) {
    return it->second;
  }
  if (parent_ != nullptr) {
    return parent_->read(key);
  }
  return storage_->load(key);
}

void state_overlay::write(covenant::schema::bytes_t key,
                          covenant::schema::bytes_t value) {
  writes_.insert_or_assign(std::move(key), std::move(value));
}

void state_overlay::absorb(state_overlay&& child) {
  for (auto& [key, value] : child.writes_) {
    writes_.insert_or_assign(key, std::move(value));
  }
  child.writes_.clear();
}

const std::map<covenant::schema::bytes_t, covenant::schema::bytes_t>&
state_overlay::writes() const {
  return writes_;
}

std::vector<covenant::storage::key_value_entry_t> state_overlay::entries()
    const {
  return {std::begin(writes_), std::end(writes_)};
}

}  // namespace covenant::execution
