// Keel-Prod headers
#include "core/DeploySettings.hpp"
#include "core/HealthVerifier.hpp"
#include "core/Logger.hpp"

// Keel-Fake headers
#include "FakeComposeClient.hpp"
#include "FakeHttpProbe.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <sstream>

namespace keel::test {

  using namespace std::chrono_literals;
  using keel::core::HealthPolicy;
  using keel::core::HealthStatus;
  using keel::core::HealthVerifier;
  using keel::core::Logger;

  class HealthVerifierTest : public ::testing::Test {
  protected:
    void SetUp() override {
      policy.url = "http://localhost:8000/";
      policy.settleWindow = 60ms;
      policy.pollInterval = 10ms;
      policy.maxWait = 150ms;
      policy.probeTimeout = 20ms;
    }

    core::HealthReport verify() {
      HealthVerifier verifier(compose, probe, policy, log);
      return verifier.verify("lendingwise");
    }

    HealthPolicy policy;
    FakeComposeClient compose;
    FakeHttpProbe probe;
    std::ostringstream sink;
    Logger log{ sink };
  };

  TEST_F(HealthVerifierTest, runningAndAnswering_isHealthy) {
    auto report = verify();

    EXPECT_EQ(report.status, HealthStatus::Healthy);
    EXPECT_EQ(report.probeAttempts, 1);
    EXPECT_EQ(report.lastHttpStatus, 200);
    EXPECT_EQ(probe.lastUrl, policy.url);
    ASSERT_EQ(report.running.size(), 1u);
    EXPECT_EQ(report.running[0], "api");
  }

  TEST_F(HealthVerifierTest, notFoundStillCountsAsAlive) {
    probe.script = { FakeHttpProbe::ok(404) };

    EXPECT_EQ(verify().status, HealthStatus::Healthy);
  }

  TEST_F(HealthVerifierTest, answersAfterRetries_isHealthy) {
    probe.script = { FakeHttpProbe::refused(), FakeHttpProbe::refused(), FakeHttpProbe::ok(200) };

    auto report = verify();

    EXPECT_EQ(report.status, HealthStatus::Healthy);
    EXPECT_EQ(report.probeAttempts, 3);
    EXPECT_NE(report.detail.find("3 attempt(s)"), std::string::npos);
  }

  TEST_F(HealthVerifierTest, longestAllowedWait_stillRetriesUntilAnswered) {
    policy.maxWait = core::kMaxDuration;
    policy.settleWindow = core::kMaxDuration;
    probe.script = { FakeHttpProbe::refused(), FakeHttpProbe::refused(), FakeHttpProbe::ok(200) };

    auto report = verify();

    EXPECT_EQ(report.status, HealthStatus::Healthy);
    EXPECT_EQ(report.probeAttempts, 3);
  }

  TEST_F(HealthVerifierTest, serverErrorIsNotAlive) {
    probe.script = { FakeHttpProbe::ok(503) };

    auto report = verify();

    EXPECT_EQ(report.status, HealthStatus::TimedOut);
    EXPECT_EQ(report.lastHttpStatus, 503);
    EXPECT_NE(report.detail.find("HTTP 503"), std::string::npos);
  }

  TEST_F(HealthVerifierTest, neverAnswering_timesOutAfterSeveralAttempts) {
    probe.script = { FakeHttpProbe::refused() };
    auto begin = std::chrono::steady_clock::now();

    auto report = verify();

    auto elapsed = std::chrono::steady_clock::now() - begin;
    EXPECT_EQ(report.status, HealthStatus::TimedOut);
    EXPECT_GT(report.probeAttempts, 1);
    EXPECT_LT(elapsed, 2s);
    EXPECT_NE(report.detail.find("Connection refused"), std::string::npos);
  }

  TEST_F(HealthVerifierTest, everyServiceExited_isUnhealthyWithoutProbing) {
    compose.psScript = { FakeComposeClient::stackInState("exited") };

    auto report = verify();

    EXPECT_EQ(report.status, HealthStatus::Unhealthy);
    EXPECT_EQ(probe.calls, 0);
    EXPECT_EQ(compose.count("ps"), 1u);
    EXPECT_NE(report.detail.find("exited"), std::string::npos);
  }

  TEST_F(HealthVerifierTest, nothingListed_isUnhealthyAfterSettleWindow) {
    compose.psScript = { protocols::Response{} };

    auto report = verify();

    EXPECT_EQ(report.status, HealthStatus::Unhealthy);
    EXPECT_EQ(report.detail, "no service of the stack is running");
    EXPECT_EQ(probe.calls, 0);
  }

  TEST_F(HealthVerifierTest, listingUnavailable_isUnhealthy) {
    compose.psScript.clear();

    auto report = verify();

    EXPECT_EQ(report.status, HealthStatus::Unhealthy);
    EXPECT_NE(report.detail.find("could not be obtained"), std::string::npos);
  }

  TEST_F(HealthVerifierTest, stuckRestarting_namesTheService) {
    compose.psScript = { FakeComposeClient::stackInState("restarting") };

    auto report = verify();

    EXPECT_EQ(report.status, HealthStatus::Unhealthy);
    EXPECT_NE(report.detail.find("api (restarting)"), std::string::npos);
  }

  TEST_F(HealthVerifierTest, slowStarter_isPickedUpWithinSettleWindow) {
    compose.psScript = { FakeComposeClient::stackInState("created"),
                         FakeComposeClient::runningStack() };

    auto report = verify();

    EXPECT_EQ(report.status, HealthStatus::Healthy);
    EXPECT_EQ(compose.count("ps"), 2u);
  }

  TEST_F(HealthVerifierTest, neverStopsOrRestartsAnything) {
    probe.script = { FakeHttpProbe::refused() };

    verify();

    EXPECT_TRUE(compose.lifecycleCalls().empty());
  }

} // namespace keel::test
