/**
 * @file NamespaceDiscovery_uTest.cpp
 * @brief Unit tests for opssetup::netns discovery.
 *
 * Notes:
 *  - The namespace runtime directory and /sys/class/net are replaced by
 *    scratch directories; `ip netns exec` goes to a scripted runner.
 */

#include "src/exec/utst/FakeCommandRunner.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/utst/TempDir.hpp"
#include "src/netns/inc/NamespaceDiscovery.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using opssetup::SetupStatus;
using opssetup::exec::FakeCommandRunner;
using opssetup::exec::formatArgv;
using opssetup::helpers::TempDir;
using opssetup::netns::detectNamespaceMode;
using opssetup::netns::discoverNamespaces;
using opssetup::netns::Discovery;
using opssetup::netns::listDevicesArgv;
using opssetup::netns::NamespaceLayout;
using opssetup::netns::NamespaceMode;

class NamespaceDiscoveryTest : public ::testing::Test {
protected:
  TempDir dir_;
  NamespaceLayout layout_{};
  FakeCommandRunner runner_;

  void SetUp() override {
    layout_.netnsDir = dir_.mkdir("netns");
    layout_.sysClassNet = dir_.mkdir("net");
    ASSERT_TRUE(opssetup::helpers::files::touchFile(layout_.netnsDir + "/swns"));
    for (const char* dev : {"lo", "eth0", "2", "1"}) {
      dir_.mkdir(std::string("net/") + dev);
    }
  }

  std::string listCommand(const std::string& ns) const {
    return formatArgv(listDevicesArgv(layout_, ns));
  }
};

/* ----------------------------- Mode ----------------------------- */

/** @test Mode follows presence of the secondary namespace. */
TEST(NamespaceModeTest, Detect) {
  const NamespaceLayout LAYOUT{};
  EXPECT_EQ(detectNamespaceMode({"swns"}, LAYOUT), NamespaceMode::SINGLE);
  EXPECT_EQ(detectNamespaceMode({"emulns", "swns"}, LAYOUT), NamespaceMode::DUAL);
  EXPECT_EQ(detectNamespaceMode({}, LAYOUT), NamespaceMode::SINGLE);
  EXPECT_STREQ(opssetup::netns::toString(NamespaceMode::DUAL), "dual");
  EXPECT_EQ(LAYOUT.activeNamespace(NamespaceMode::SINGLE), "swns");
  EXPECT_EQ(LAYOUT.activeNamespace(NamespaceMode::DUAL), "emulns");
}

/* ----------------------------- Discovery ----------------------------- */

/** @test Single mode lists root devices sorted and bound devices from swns. */
TEST_F(NamespaceDiscoveryTest, SingleMode) {
  runner_.on(listCommand("swns"), FakeCommandRunner::success("lo\n53\n"));

  const Discovery DISC = discoverNamespaces(layout_, runner_);

  ASSERT_TRUE(DISC.ok()) << DISC.message;
  EXPECT_EQ(DISC.mode, NamespaceMode::SINGLE);
  EXPECT_EQ(DISC.unbound, (std::vector<std::string>{"1", "2", "eth0", "lo"}));
  EXPECT_EQ(DISC.bound, (std::vector<std::string>{"lo", "53"}));
  EXPECT_TRUE(DISC.isBound("53"));
  EXPECT_FALSE(DISC.isBound("49"));
  ASSERT_EQ(runner_.calls.size(), 1U);
}

/** @test Dual mode inspects the emulation namespace. */
TEST_F(NamespaceDiscoveryTest, DualMode) {
  ASSERT_TRUE(opssetup::helpers::files::touchFile(layout_.netnsDir + "/emulns"));
  runner_.on(listCommand("emulns"), FakeCommandRunner::success("lo"));

  const Discovery DISC = discoverNamespaces(layout_, runner_);

  ASSERT_TRUE(DISC.ok());
  EXPECT_EQ(DISC.mode, NamespaceMode::DUAL);
  EXPECT_EQ(runner_.count(listCommand("emulns")), 1U);
  EXPECT_EQ(runner_.count(listCommand("swns")), 0U);
}

/** @test Inspection failures are PROVISIONING_ERROR with the command output. */
TEST_F(NamespaceDiscoveryTest, CommandFailure) {
  runner_.on(listCommand("swns"), FakeCommandRunner::failure(1, "Cannot open network namespace"));

  const Discovery DISC = discoverNamespaces(layout_, runner_);

  EXPECT_EQ(DISC.status, SetupStatus::PROVISIONING_ERROR);
  EXPECT_NE(DISC.message.find("Cannot open network namespace"), std::string::npos);
  EXPECT_NE(DISC.message.find(listCommand("swns")), std::string::npos);
}

/** @test A missing namespace directory is PROVISIONING_ERROR without running commands. */
TEST_F(NamespaceDiscoveryTest, MissingRuntimeDir) {
  layout_.netnsDir = dir_.sub("absent");

  const Discovery DISC = discoverNamespaces(layout_, runner_);

  EXPECT_EQ(DISC.status, SetupStatus::PROVISIONING_ERROR);
  EXPECT_TRUE(runner_.calls.empty());
}
