#include <custodian/common/reentrancy_lock.hpp>

namespace custodian::common {

reentrancy_guard::reentrancy_guard(reentrancy_lock& lock) noexcept
    : lock_{&lock} {}

reentrancy_guard::reentrancy_guard(reentrancy_guard&& other) noexcept
    : lock_{other.lock_} {
  other.lock_ = nullptr;
}

reentrancy_guard::~reentrancy_guard() {
  if (lock_ != nullptr) {
    lock_->release();
  }
}

std::optional<reentrancy_guard> reentrancy_lock::try_acquire() {
  auto expected = false;
  if (!held_.compare_exchange_strong(expected, true,
                                     std::memory_order_acq_rel)) {
    return std::nullopt;
  }
  return reentrancy_guard{*this};
}

bool reentrancy_lock::held() const {
  return held_.load(std::memory_order_acquire);
}

void reentrancy_lock::release() noexcept {
  held_.store(false, std::memory_order_release);
}

}  // namespace custodian::common
