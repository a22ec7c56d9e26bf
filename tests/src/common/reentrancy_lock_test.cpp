#include <gtest/gtest.h>
#include <custodian/common/reentrancy_lock.hpp>

#include <stdexcept>
#include <utility>

TEST(reentrancy_lock, second_acquire_fails_while_held) {
  auto lock = custodian::common::reentrancy_lock{};
  auto first = lock.try_acquire();
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(lock.held());
  EXPECT_FALSE(lock.try_acquire().has_value());
}

TEST(reentrancy_lock, guard_release_returns_to_idle) {
  auto lock = custodian::common::reentrancy_lock{};
  {
    auto guard = lock.try_acquire();
    ASSERT_TRUE(guard.has_value());
  }
  EXPECT_FALSE(lock.held());
  EXPECT_TRUE(lock.try_acquire().has_value());
}

TEST(reentrancy_lock, moved_guard_releases_once) {
  auto lock = custodian::common::reentrancy_lock{};
  auto guard = lock.try_acquire();
  ASSERT_TRUE(guard.has_value());
  {
    auto moved = std::move(*guard);
    EXPECT_TRUE(lock.held());
  }
  EXPECT_FALSE(lock.held());
  guard.reset();
  EXPECT_FALSE(lock.held());
}

TEST(reentrancy_lock, released_when_body_throws) {
  auto lock = custodian::common::reentrancy_lock{};
  auto body = [&] {
    auto guard = lock.try_acquire();
    ASSERT_TRUE(guard.has_value());
    throw std::runtime_error{"body failed"};
  };
  EXPECT_THROW(body(), std::runtime_error);
  EXPECT_FALSE(lock.held());
}
