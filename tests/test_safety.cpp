/**
 * @file test_safety.cpp
 * @brief Tests for SafetyToken and the checked/unchecked policies.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

#include "pinview/obs/observability.hpp"
#include "pinview/safety/safety_token.hpp"

using pinview::Error;
using pinview::config::SafetyMode;
using pinview::safety::SafetyToken;
using pinview::safety::make_policy;

TEST(SafetyToken, Checked_ValidUntilInvalidated) {
  auto obs = pinview::obs::make_counting_observer();
  auto policy = make_policy(SafetyMode::Checked, obs.get());
  EXPECT_EQ(policy->mode(), SafetyMode::Checked);

  SafetyToken t = policy->issue(7);
  EXPECT_TRUE(t.checked());
  EXPECT_EQ(t.id(), 7u);
  EXPECT_TRUE(t.valid());
  EXPECT_TRUE(t.validate());
  EXPECT_EQ(obs->snapshot().use_after_release, 0u);

  t.invalidate();
  auto r = t.validate();
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), Error::UseAfterRelease);
  EXPECT_EQ(obs->snapshot().use_after_release, 1u);
}

/**
 * @test Checked_CopiesShareState
 * @brief Invalidation through one copy is seen by every copy and never undone.
 */
TEST(SafetyToken, Checked_CopiesShareState) {
  auto policy = make_policy(SafetyMode::Checked);
  SafetyToken owner = policy->issue(1);
  SafetyToken reader = owner;

  owner.invalidate();
  owner.invalidate(); // idempotent
  EXPECT_FALSE(reader.valid());
  EXPECT_FALSE(reader.validate());

  // A fresh token is independent.
  SafetyToken other = policy->issue(2);
  EXPECT_TRUE(other.valid());
}

TEST(SafetyToken, Unchecked_NeverFails) {
  auto policy = make_policy(SafetyMode::Unchecked);
  EXPECT_EQ(policy->mode(), SafetyMode::Unchecked);

  SafetyToken t = policy->issue(3);
  EXPECT_FALSE(t.checked());
  EXPECT_EQ(t.id(), 0u);
  t.invalidate();
  EXPECT_TRUE(t.valid());
  EXPECT_TRUE(t.validate());
}

TEST(SafetyToken, Invalidation_VisibleAcrossThreads) {
  auto policy = make_policy(SafetyMode::Checked);
  SafetyToken t = policy->issue(1);
  std::atomic<bool> seen{false};

  std::thread reader([copy = t, &seen]{
    while (copy.valid()) std::this_thread::yield();
    seen.store(true);
  });
  t.invalidate();
  reader.join();
  EXPECT_TRUE(seen.load());
}
