/**
 * @file ReadinessPoller_uTest.cpp
 * @brief Unit tests for opssetup::readiness::pollUntil.
 *
 * Notes:
 *  - Intervals are kept at a few milliseconds so the suite stays fast.
 */

#include "src/readiness/inc/ReadinessPoller.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

using opssetup::SetupStatus;
using opssetup::readiness::DEFAULT_POLL_INTERVAL;
using opssetup::readiness::DEFAULT_POLL_TIMEOUT;
using opssetup::readiness::PollPolicy;
using opssetup::readiness::PollResult;
using opssetup::readiness::pollUntil;

using std::chrono::milliseconds;

namespace {

PollPolicy fastPolicy(int intervalMs, int timeoutMs) {
  PollPolicy p{};
  p.interval = milliseconds(intervalMs);
  p.timeout = milliseconds(timeoutMs);
  return p;
}

} // namespace

/* ----------------------------- PollPolicy ----------------------------- */

/** @test Default budget is 1200 probes of 100 ms. */
TEST(PollPolicyTest, Defaults) {
  const PollPolicy P{};
  EXPECT_EQ(P.interval, DEFAULT_POLL_INTERVAL);
  EXPECT_EQ(P.timeout, DEFAULT_POLL_TIMEOUT);
  EXPECT_EQ(P.maxProbes(), 1200U);
}

/** @test maxProbes floors the ratio and tolerates a zero interval. */
TEST(PollPolicyTest, MaxProbes) {
  EXPECT_EQ(fastPolicy(3, 10).maxProbes(), 3U);
  EXPECT_EQ(fastPolicy(10, 5).maxProbes(), 0U);
  EXPECT_EQ(fastPolicy(0, 5).maxProbes(), 5U);
  EXPECT_EQ(fastPolicy(1, 0).maxProbes(), 0U);
}

/* ----------------------------- pollUntil ----------------------------- */

/** @test A predicate that holds at once needs a single probe. */
TEST(PollUntilTest, ImmediateSuccess) {
  int calls = 0;
  const PollResult RES = pollUntil(
      "always", [&calls]() { return ++calls > 0; }, "never", fastPolicy(1, 50));

  EXPECT_TRUE(RES.ok());
  EXPECT_EQ(RES.probes, 1U);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(RES.message.empty());
}

/** @test A predicate that turns true after k failures is evaluated k+1 times. */
TEST(PollUntilTest, SuccessAfterRetries) {
  constexpr int FAILURES = 4;
  int calls = 0;
  const PollResult RES = pollUntil(
      "eventually", [&calls]() { return ++calls > FAILURES; }, "never", fastPolicy(1, 100));

  ASSERT_TRUE(RES.ok()) << RES.toString();
  EXPECT_EQ(RES.probes, static_cast<std::size_t>(FAILURES + 1));
  EXPECT_EQ(calls, FAILURES + 1);
}

/** @test Exhaustion reports BOOT_TIMEOUT after exactly maxProbes evaluations. */
TEST(PollUntilTest, TimeoutAfterBudget) {
  const PollPolicy POLICY = fastPolicy(20, 100);
  int calls = 0;
  const PollResult RES = pollUntil(
      "db socket", [&calls]() {
        ++calls;
        return false;
      },
      "socket missing", POLICY);

  EXPECT_EQ(RES.status, SetupStatus::BOOT_TIMEOUT);
  EXPECT_EQ(static_cast<std::size_t>(calls), POLICY.maxProbes());
  EXPECT_EQ(RES.probes, POLICY.maxProbes());
  EXPECT_NE(RES.message.find("db socket"), std::string::npos);
  EXPECT_NE(RES.message.find("socket missing"), std::string::npos);
  // Sleeps happen between probes only: (probes - 1) intervals at least.
  EXPECT_GE(RES.elapsed.count(), static_cast<long>((POLICY.maxProbes() - 1) * 20));
}

/** @test A zero budget never evaluates the predicate. */
TEST(PollUntilTest, ZeroBudget) {
  int calls = 0;
  const PollResult RES = pollUntil(
      "nothing", [&calls]() { return ++calls > 0; }, "no budget", fastPolicy(10, 5));

  EXPECT_EQ(RES.status, SetupStatus::BOOT_TIMEOUT);
  EXPECT_EQ(calls, 0);
  EXPECT_EQ(RES.probes, 0U);
}

/** @test Slow predicates stop the poll once the timeout has elapsed. */
TEST(PollUntilTest, SlowPredicateBoundedByTimeout) {
  const PollPolicy POLICY = fastPolicy(10, 100);
  int calls = 0;
  const PollResult RES = pollUntil(
      "slow", [&calls]() {
        ++calls;
        std::this_thread::sleep_for(milliseconds(60));
        return false;
      },
      "never ready", POLICY);

  EXPECT_EQ(RES.status, SetupStatus::BOOT_TIMEOUT);
  EXPECT_LT(RES.probes, POLICY.maxProbes());
  EXPECT_EQ(static_cast<std::size_t>(calls), RES.probes);
  EXPECT_GE(RES.elapsed.count(), 100);
  // Overrun is at most one probe plus one interval.
  EXPECT_LT(RES.elapsed.count(), 100 + 60 + 10 + 200);
}
