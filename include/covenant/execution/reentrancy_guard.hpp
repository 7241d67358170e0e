#pragma once

namespace covenant::execution {

/// Scoped single-entry lock over an engine-wide flag. A guard constructed
/// while the flag is already set does not acquire and leaves it untouched.
class reentrancy_guard final {
 public:
  explicit reentrancy_guard(bool& entered)
      : entered_{entered}, acquired_{!entered} {
    if (acquired_) {
      entered_ = true;
    }
  }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;
  reentrancy_guard(reentrancy_guard&&) = delete;
  reentrancy_guard& operator=(reentrancy_guard&&) = delete;

  ~reentrancy_guard() {
    if (acquired_) {
      entered_ = false;
    }
  }

  bool acquired() const { return acquired_; }

 private:
  bool& entered_;
  bool acquired_;
};

}  // namespace covenant::execution
