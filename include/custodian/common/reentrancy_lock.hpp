#pragma once

#include <atomic>
#include <optional>

namespace custodian::common {

class reentrancy_lock;

/// Proof that the owning call holds a `reentrancy_lock`.
///
/// Move-only; the lock is released when the last owner is destroyed, on every
/// exit path of the guarded body.
class reentrancy_guard final {
 public:
  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;
  reentrancy_guard(reentrancy_guard&& other) noexcept;
  reentrancy_guard& operator=(reentrancy_guard&&) = delete;
  ~reentrancy_guard();

 private:
  friend class reentrancy_lock;
  explicit reentrancy_guard(reentrancy_lock& lock) noexcept;

  reentrancy_lock* lock_;
};

/// Single-flag mutual exclusion for mutating entry points.
///
/// Acquisition never blocks: a second attempt while held fails immediately,
/// whether it comes from a callback on the same thread or from another thread.
class reentrancy_lock final {
 public:
  reentrancy_lock() = default;
  reentrancy_lock(const reentrancy_lock&) = delete;
  reentrancy_lock& operator=(const reentrancy_lock&) = delete;

  /// Idle -> Locked. Returns std::nullopt if already Locked.
  std::optional<reentrancy_guard> try_acquire();

  bool held() const;

 private:
  friend class reentrancy_guard;
  void release() noexcept;

  std::atomic<bool> held_{false};
};

}  // namespace custodian::common
