/**
 * @file ServiceProbes_uTest.cpp
 * @brief Unit tests for opssetup::boot service and hostname probes.
 */

#include "src/boot/inc/ServiceProbes.hpp"
#include "src/exec/utst/FakeCommandRunner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using opssetup::SetupStatus;
using opssetup::boot::currentHostname;
using opssetup::boot::ensureServiceActive;
using opssetup::boot::isServiceActive;
using opssetup::exec::FakeCommandRunner;
using opssetup::readiness::PollPolicy;
using opssetup::readiness::PollResult;

namespace {

PollPolicy fastPolicy() {
  PollPolicy p{};
  p.interval = std::chrono::milliseconds(1);
  p.timeout = std::chrono::milliseconds(10);
  return p;
}

} // namespace

/* ----------------------------- isServiceActive ----------------------------- */

/** @test Only the exact "active" state counts, regardless of exit status. */
TEST(ServiceProbesTest, IsServiceActive) {
  FakeCommandRunner runner;
  runner.on("systemctl is-active switchd", FakeCommandRunner::success("active\n"));
  runner.on("systemctl is-active restd", FakeCommandRunner::failure(3, "inactive\n"));
  runner.on("systemctl is-active other", FakeCommandRunner::failure(3, "activating\n"));

  EXPECT_TRUE(isServiceActive(runner, "switchd"));
  EXPECT_FALSE(isServiceActive(runner, "restd"));
  EXPECT_FALSE(isServiceActive(runner, "other"));
}

/** @test A host name is available on any Linux system. */
TEST(ServiceProbesTest, CurrentHostname) { EXPECT_FALSE(currentHostname().empty()); }

/* ----------------------------- ensureServiceActive ----------------------------- */

/** @test An active unit is not started again. */
TEST(ServiceProbesTest, AlreadyActive) {
  FakeCommandRunner runner;
  runner.on("systemctl is-active restd", FakeCommandRunner::success("active\n"));

  const PollResult RES = ensureServiceActive(runner, "restd", fastPolicy());

  EXPECT_TRUE(RES.ok());
  EXPECT_EQ(runner.count("systemctl start restd"), 0U);
}

/** @test An inactive unit is started and then polled until active. */
TEST(ServiceProbesTest, StartsInactiveUnit) {
  FakeCommandRunner runner;
  runner.on("systemctl is-active restd", FakeCommandRunner::failure(3, "inactive\n"));
  runner.on("systemctl is-active restd", FakeCommandRunner::failure(3, "activating\n"));
  runner.on("systemctl is-active restd", FakeCommandRunner::success("active\n"));

  const PollResult RES = ensureServiceActive(runner, "restd", fastPolicy());

  ASSERT_TRUE(RES.ok()) << RES.toString();
  EXPECT_EQ(runner.count("systemctl start restd"), 1U);
  EXPECT_EQ(runner.count("systemctl is-active restd"), 3U);
}

/** @test A failing start is SERVICE_START_ERROR. */
TEST(ServiceProbesTest, StartFails) {
  FakeCommandRunner runner;
  runner.on("systemctl is-active restd", FakeCommandRunner::failure(3, "inactive\n"));
  runner.on("systemctl start restd", FakeCommandRunner::failure(5, "Unit restd.service not found."));

  const PollResult RES = ensureServiceActive(runner, "restd", fastPolicy());

  EXPECT_EQ(RES.status, SetupStatus::SERVICE_START_ERROR);
  EXPECT_NE(RES.message.find("not found"), std::string::npos);
}

/** @test A unit that never becomes active after start is SERVICE_START_ERROR. */
TEST(ServiceProbesTest, NeverActive) {
  FakeCommandRunner runner;
  runner.on("systemctl is-active restd", FakeCommandRunner::failure(3, "failed\n"));

  const PollResult RES = ensureServiceActive(runner, "restd", fastPolicy());

  EXPECT_EQ(RES.status, SetupStatus::SERVICE_START_ERROR);
  EXPECT_EQ(runner.count("systemctl start restd"), 1U);
}
