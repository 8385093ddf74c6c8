/**
 * @file BootOrchestrator_uTest.cpp
 * @brief Unit tests for opssetup::boot step sequencing and the boot gates.
 *
 * Notes:
 *  - Every path of the boot sequence is redirected into a scratch directory.
 *  - The database is FakeDbServer; systemctl goes to a scripted runner.
 */

#include "src/boot/inc/BootOrchestrator.hpp"
#include "src/exec/utst/FakeCommandRunner.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/utst/TempDir.hpp"
#include "src/ovsdb/utst/FakeDbServer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using opssetup::SetupStatus;
using opssetup::boot::BootOrchestrator;
using opssetup::boot::BootReport;
using opssetup::boot::BootStep;
using opssetup::boot::makeGate;
using opssetup::boot::runSteps;
using opssetup::boot::SetupConfig;
using opssetup::boot::StepOutcome;
using opssetup::exec::FakeCommandRunner;
using opssetup::helpers::TempDir;
using opssetup::ovsdb::DbClient;
using opssetup::ovsdb::FakeDbServer;
using opssetup::ovsdb::flagReply;
using opssetup::ovsdb::Reply;
using opssetup::ovsdb::requestId;
using opssetup::readiness::PollPolicy;

namespace files = opssetup::helpers::files;

namespace {

PollPolicy fastPolicy() {
  PollPolicy p{};
  p.interval = std::chrono::milliseconds(1);
  p.timeout = std::chrono::milliseconds(20);
  return p;
}

BootStep fixedStep(const std::string& name, SetupStatus status, int& calls) {
  return BootStep{name, [status, &calls]() {
                    ++calls;
                    StepOutcome out{};
                    out.status = status;
                    out.message = status == SetupStatus::OK ? "" : "broken";
                    return out;
                  }};
}

} // namespace

/* ----------------------------- runSteps ----------------------------- */

/** @test Steps run in order and stop at the first failure. */
TEST(RunStepsTest, StopsAtFirstFailure) {
  int a = 0;
  int b = 0;
  int c = 0;
  const std::vector<BootStep> STEPS = {fixedStep("a", SetupStatus::OK, a),
                                       fixedStep("b", SetupStatus::IO_ERROR, b),
                                       fixedStep("c", SetupStatus::OK, c)};

  const BootReport REPORT = runSteps(STEPS);

  EXPECT_EQ(REPORT.status, SetupStatus::IO_ERROR);
  EXPECT_EQ(REPORT.failedStep, "b");
  EXPECT_EQ(REPORT.message, "broken");
  EXPECT_EQ(REPORT.completedSteps, (std::vector<std::string>{"a"}));
  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(c, 0);
  EXPECT_NE(REPORT.toString().find("'b'"), std::string::npos);
}

/** @test A gate reports BOOT_TIMEOUT with its message. */
TEST(RunStepsTest, GateTimeout) {
  const BootStep GATE = makeGate("never", []() { return false; }, "never happens", fastPolicy());
  const StepOutcome OUT = GATE.run();

  EXPECT_EQ(GATE.name, "never");
  EXPECT_EQ(OUT.status, SetupStatus::BOOT_TIMEOUT);
  EXPECT_NE(OUT.message.find("never happens"), std::string::npos);
}

/* ----------------------------- BootOrchestrator ----------------------------- */

class BootOrchestratorTest : public ::testing::Test {
protected:
  TempDir dir_;
  SetupConfig config_{};
  FakeCommandRunner runner_;
  std::atomic<int> cfgValue_{1};
  std::unique_ptr<FakeDbServer> server_;
  std::string hostname_{"switch"};

  void SetUp() override {
    config_.poll = fastPolicy();
    config_.binder.linkPoll = fastPolicy();

    config_.binder.layout.netnsDir = dir_.mkdir("netns");
    config_.binder.layout.sysClassNet = dir_.mkdir("net");
    dir_.mkdir("net/1");
    dir_.mkdir("net/lo");
    ASSERT_TRUE(files::touchFile(config_.primaryNetnsPath()));

    config_.hwdescDir = dir_.mkdir("hwdesc");
    config_.binder.descriptorPath = config_.hwdescDir + "/ports.yaml";
    ASSERT_TRUE(files::writeFile(config_.binder.descriptorPath, "ports:\n  - name: 49\n"));
    config_.binder.mappingPath = dir_.sub("port_mapping.json");
    config_.binder.readyMarkerPath = dir_.sub("ops-virt-ports-ready");

    config_.dbSocketPath = dir_.sub("db.sock");
    config_.switchdPidPath = dir_.sub("ops-switchd.pid");
    ASSERT_TRUE(files::touchFile(config_.switchdPidPath));

    runner_.on("systemctl is-active switchd", FakeCommandRunner::success("active\n"));
    runner_.on("systemctl is-active restd", FakeCommandRunner::failure(3, "inactive\n"));
    runner_.on("systemctl is-active restd", FakeCommandRunner::success("active\n"));
  }

  void startDb() {
    server_ = std::make_unique<FakeDbServer>(config_.dbSocketPath, [this](const std::string& req) {
      const bool HW = req.find("cur_hw") != std::string::npos;
      return Reply{flagReply(requestId(req), HW ? "cur_hw" : "cur_cfg", HW ? 1 : cfgValue_.load())};
    });
  }

  BootReport runBoot() {
    DbClient db(config_.dbSocketPath, config_.dbName, std::chrono::milliseconds(200));
    BootOrchestrator orchestrator(config_, runner_, db, [this]() { return hostname_; });
    return orchestrator.run();
  }
};

/** @test Ten steps in the documented order. */
TEST_F(BootOrchestratorTest, StepOrder) {
  DbClient db(config_.dbSocketPath);
  BootOrchestrator orchestrator(config_, runner_, db, [this]() { return hostname_; });
  const std::vector<BootStep> STEPS = orchestrator.buildSteps();

  ASSERT_EQ(STEPS.size(), 10U);
  EXPECT_EQ(STEPS[0].name, "swns netns");
  EXPECT_EQ(STEPS[1].name, "hardware descriptor");
  EXPECT_EQ(STEPS[2].name, "interface binding");
  EXPECT_EQ(STEPS[3].name, "database socket");
  EXPECT_EQ(STEPS[4].name, "cur_hw flag");
  EXPECT_EQ(STEPS[5].name, "cur_cfg flag");
  EXPECT_EQ(STEPS[6].name, "switchd pid");
  EXPECT_EQ(STEPS[7].name, "switchd active");
  EXPECT_EQ(STEPS[8].name, "hostname");
  EXPECT_EQ(STEPS[9].name, "restd active");
}

/** @test A healthy system passes every gate; restd is started once. */
TEST_F(BootOrchestratorTest, FullBoot) {
  startDb();
  const BootReport REPORT = runBoot();

  ASSERT_TRUE(REPORT.ok()) << REPORT.toString();
  EXPECT_EQ(REPORT.completedSteps.size(), 10U);
  ASSERT_NE(REPORT.binding.mapping.find("1"), nullptr);
  EXPECT_EQ(*REPORT.binding.mapping.find("1"), "49");
  EXPECT_TRUE(files::pathExists(config_.binder.readyMarkerPath));
  EXPECT_TRUE(files::pathExists(config_.binder.mappingPath));
  EXPECT_EQ(runner_.count("systemctl start restd"), 1U);
}

/** @test A missing switch namespace stops the boot before any command. */
TEST_F(BootOrchestratorTest, MissingSwitchNamespace) {
  config_.binder.layout.netnsDir = dir_.sub("absent");
  const BootReport REPORT = runBoot();

  EXPECT_EQ(REPORT.status, SetupStatus::BOOT_TIMEOUT);
  EXPECT_EQ(REPORT.failedStep, "swns netns");
  EXPECT_TRUE(REPORT.completedSteps.empty());
  EXPECT_TRUE(runner_.calls.empty());
}

/** @test Binder failures surface with their own status. */
TEST_F(BootOrchestratorTest, BinderFailure) {
  ASSERT_TRUE(files::writeFile(config_.binder.descriptorPath, "ports: []\n"));
  const BootReport REPORT = runBoot();

  EXPECT_EQ(REPORT.status, SetupStatus::EXHAUSTED_PORTS);
  EXPECT_EQ(REPORT.failedStep, "interface binding");
  EXPECT_EQ(REPORT.completedSteps.size(), 2U);
}

/** @test Without a database socket the boot times out at that gate. */
TEST_F(BootOrchestratorTest, NoDatabase) {
  const BootReport REPORT = runBoot();

  EXPECT_EQ(REPORT.status, SetupStatus::BOOT_TIMEOUT);
  EXPECT_EQ(REPORT.failedStep, "database socket");
}

/** @test An unset configuration flag times out at its gate. */
TEST_F(BootOrchestratorTest, ConfigFlagNeverSet) {
  cfgValue_.store(0);
  startDb();
  const BootReport REPORT = runBoot();

  EXPECT_EQ(REPORT.status, SetupStatus::BOOT_TIMEOUT);
  EXPECT_EQ(REPORT.failedStep, "cur_cfg flag");
  EXPECT_EQ(REPORT.completedSteps.size(), 5U);
}

/** @test A wrong hostname times out at the hostname gate. */
TEST_F(BootOrchestratorTest, WrongHostname) {
  hostname_ = "localhost";
  startDb();
  const BootReport REPORT = runBoot();

  EXPECT_EQ(REPORT.status, SetupStatus::BOOT_TIMEOUT);
  EXPECT_EQ(REPORT.failedStep, "hostname");
  EXPECT_EQ(REPORT.completedSteps.size(), 8U);
}

/** @test restd that cannot be started is SERVICE_START_ERROR. */
TEST_F(BootOrchestratorTest, RestdStartFailure) {
  FakeCommandRunner runner;
  runner.on("systemctl is-active switchd", FakeCommandRunner::success("active\n"));
  runner.on("systemctl is-active restd", FakeCommandRunner::failure(3, "inactive\n"));
  runner.on("systemctl start restd", FakeCommandRunner::failure(1, "Job failed"));
  startDb();

  DbClient db(config_.dbSocketPath, config_.dbName, std::chrono::milliseconds(200));
  BootOrchestrator orchestrator(config_, runner, db, [this]() { return hostname_; });
  const BootReport REPORT = orchestrator.run();

  EXPECT_EQ(REPORT.status, SetupStatus::SERVICE_START_ERROR);
  EXPECT_EQ(REPORT.failedStep, "restd active");
  EXPECT_EQ(REPORT.completedSteps.size(), 9U);
}
