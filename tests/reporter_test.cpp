// Keel-Prod headers
#include "core/DeploySettings.hpp"
#include "core/DirectoryBootstrapper.hpp"
#include "core/Reporter.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

namespace keel::test {

  using keel::core::CheckStatus;
  using keel::core::DeploymentOutcome;
  using keel::core::DeploySettings;
  using keel::core::Failure;
  using keel::core::HealthStatus;
  using keel::core::LifecycleStage;
  using keel::core::Reporter;
  using keel::core::StageStatus;
  using ::testing::HasSubstr;
  using ::testing::Not;

  namespace {
    DeploymentOutcome deployed(HealthStatus health) {
      DeploymentOutcome o;
      o.preflight.add({ "platform", CheckStatus::Pass, "Linux", "" });
      for (auto& s : o.stages)
        s.status = StageStatus::Succeeded;
      o.health.status = health;
      return o;
    }
  } // namespace

  TEST(ExitCode, healthyIsZero) {
    EXPECT_EQ(Reporter::exitCodeFor(deployed(HealthStatus::Healthy)), 0);
  }

  TEST(ExitCode, unhealthyAndTimedOutAreOne) {
    EXPECT_EQ(Reporter::exitCodeFor(deployed(HealthStatus::Unhealthy)), 1);
    EXPECT_EQ(Reporter::exitCodeFor(deployed(HealthStatus::TimedOut)), 1);
  }

  TEST(ExitCode, failedPreflightIsOne) {
    DeploymentOutcome o;
    o.preflight.add({ "key:DB_HOST", CheckStatus::Fail, "DB_HOST is not set", "" });

    EXPECT_EQ(Reporter::exitCodeFor(o), 1);
  }

  TEST(ExitCode, failedStopAloneDoesNotFailTheRun) {
    auto o = deployed(HealthStatus::Healthy);
    o.stage(LifecycleStage::Stop).status = StageStatus::Failed;

    EXPECT_EQ(Reporter::exitCodeFor(o), 0);
  }

  TEST(ExitCode, failedBuildIsOne) {
    auto o = deployed(HealthStatus::Pending);
    o.stage(LifecycleStage::Build).status = StageStatus::Failed;
    o.stage(LifecycleStage::Start).status = StageStatus::Skipped;

    EXPECT_EQ(Reporter::exitCodeFor(o), 1);
  }

  TEST(ExitCode, declineIsZero) {
    DeploymentOutcome o;
    o.cancelled = true;

    EXPECT_EQ(Reporter::exitCodeFor(o), 0);
  }

  TEST(ScanLogs, recognisesKnownMarkersCaseInsensitively) {
    auto hints = Reporter::scanLogs("api-1 | TRACEBACK (most recent call last):\n"
                                    "api-1 | OSError: [Errno 98] Address already in use\n");

    ASSERT_EQ(hints.size(), 2u);
    EXPECT_THAT(hints[0], HasSubstr("traceback"));
    EXPECT_THAT(hints[1], HasSubstr("port conflict"));
  }

  TEST(ScanLogs, quietLogsGiveNoHints) {
    EXPECT_TRUE(Reporter::scanLogs("api-1 | INFO: Application startup complete.").empty());
  }

  class ReporterTest : public ::testing::Test {
  protected:
    DeploySettings settings = DeploySettings::defaults();
    std::ostringstream out;
    Reporter reporter{ out, settings };
  };

  TEST_F(ReporterTest, successSummaryListsEndpointsAndCommands) {
    int code = reporter.summary(deployed(HealthStatus::Healthy), {});

    EXPECT_EQ(code, 0);
    EXPECT_THAT(out.str(), HasSubstr("Deployment complete!"));
    EXPECT_THAT(out.str(), HasSubstr("http://localhost:8000/docs"));
    EXPECT_THAT(out.str(), HasSubstr("docker compose -p lendingwise logs -f"));
    EXPECT_THAT(out.str(), HasSubstr("docker compose -p lendingwise down"));
  }

  TEST_F(ReporterTest, failureSummaryCarriesEveryHint) {
    DeploymentOutcome o;
    o.preflight.add({ "key:DB_HOST", CheckStatus::Fail, "DB_HOST is not set", "" });
    std::vector<Failure> failures{ { "key:DB_HOST: DB_HOST is not set", "set DB_HOST in .env" },
                                   { "platform: Darwin", "run on a Linux host" } };

    int code = reporter.summary(o, failures);

    EXPECT_EQ(code, 1);
    EXPECT_THAT(out.str(), HasSubstr("Deployment FAILED"));
    EXPECT_THAT(out.str(), HasSubstr("set DB_HOST in .env"));
    EXPECT_THAT(out.str(), HasSubstr("run on a Linux host"));
    EXPECT_THAT(out.str(), Not(HasSubstr("logs -f")));
  }

  TEST_F(ReporterTest, timedOutStackIsReportedAsLeftRunning) {
    reporter.summary(deployed(HealthStatus::TimedOut), {});

    EXPECT_THAT(out.str(), HasSubstr("left running"));
    EXPECT_THAT(out.str(), HasSubstr("logs -f"));
  }

  TEST_F(ReporterTest, legacyCliIsUsedInCommands) {
    Reporter legacy(out, settings, "docker-compose");

    legacy.summary(deployed(HealthStatus::Healthy), {});

    EXPECT_THAT(out.str(), HasSubstr("docker-compose -p lendingwise logs -f"));
  }

  TEST_F(ReporterTest, diagnosticsShowTailOfBuildOutput) {
    auto o = deployed(HealthStatus::Pending);
    o.stage(LifecycleStage::Build).status = StageStatus::Failed;
    std::string output;
    for (int i = 0; i < 100; ++i)
      output += "step " + std::to_string(i) + "\n";
    o.stage(LifecycleStage::Build).output = output;

    reporter.diagnostics(o);

    EXPECT_THAT(out.str(), HasSubstr("step 99"));
    EXPECT_THAT(out.str(), Not(HasSubstr("step 10\n")));
    EXPECT_THAT(out.str(), HasSubstr("60 earlier lines omitted"));
  }

  TEST_F(ReporterTest, diagnosticsScanTheLogTail) {
    auto o = deployed(HealthStatus::Unhealthy);
    o.logTail = "api-1 | ModuleNotFoundError: No module named 'boto3'";

    reporter.diagnostics(o);

    EXPECT_THAT(out.str(), HasSubstr("No module named 'boto3'"));
    EXPECT_THAT(out.str(), HasSubstr("requirements.txt"));
  }

  TEST_F(ReporterTest, healthShowsLastHttpStatusWhenNotHealthy) {
    core::HealthReport timedOut;
    timedOut.status = HealthStatus::TimedOut;
    timedOut.detail = "http://localhost:8000/ did not answer within 90s (last: HTTP 503)";
    timedOut.probeAttempts = 45;
    timedOut.lastHttpStatus = 503;

    reporter.health(timedOut);

    EXPECT_THAT(out.str(), HasSubstr("last HTTP status: 503 after 45 attempt(s)"));
  }

  TEST_F(ReporterTest, healthWithoutAnyAnswerSaysNoResponse) {
    core::HealthReport refused;
    refused.status = HealthStatus::TimedOut;
    refused.probeAttempts = 3;

    reporter.health(refused);

    EXPECT_THAT(out.str(), HasSubstr("last HTTP status: no response after 3 attempt(s)"));
  }

  TEST_F(ReporterTest, healthyReportOmitsLastHttpStatus) {
    core::HealthReport healthy;
    healthy.status = HealthStatus::Healthy;
    healthy.probeAttempts = 1;
    healthy.lastHttpStatus = 200;

    reporter.health(healthy);

    EXPECT_THAT(out.str(), Not(HasSubstr("last HTTP status")));
  }

  TEST_F(ReporterTest, cancelledRunSaysNoContainersWereTouched) {
    reporter.cancelled();

    EXPECT_THAT(out.str(), HasSubstr("no containers were touched"));
    EXPECT_THAT(out.str(), Not(HasSubstr("nothing was changed")));
  }

  TEST_F(ReporterTest, preflightPrintsHintsForFailuresOnly) {
    core::PreflightResult r;
    r.add({ "platform", CheckStatus::Pass, "Linux", "never shown" });
    r.add({ "group:docker", CheckStatus::Warn, "not in group", "sudo usermod -aG docker $USER" });

    reporter.preflight(r);

    EXPECT_THAT(out.str(), Not(HasSubstr("never shown")));
    EXPECT_THAT(out.str(), HasSubstr("usermod"));
    EXPECT_THAT(out.str(), HasSubstr("1 passed, 1 warning(s), 0 failed"));
  }

} // namespace keel::test
