#pragma once
/** @file  Reporter.hpp
 *  @brief Operator-facing console output and exit-code mapping.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <iosfwd>
#include <string>
#include <vector>

#include "core/DeploySettings.hpp"
#include "core/DeploymentTypes.hpp"
#include "core/ErrorMonitor.hpp"

namespace keel::core {

  struct BootstrapReport;

  /**
 * @class Reporter
 * @brief Renders each stage as it resolves, the log tail on fatal outcomes and
 *        a final summary.
 *
 *  * Writes to the stream given at construction (stdout in production).
 *  * Log scraping in `scanLogs()` is a diagnostic aid only; health is decided
 *    by HealthVerifier.
 */
  class Reporter {
  public:
    Reporter(std::ostream& out, const DeploySettings& settings,
             std::string composeCli = "docker compose");

    void banner();
    void preflight(const PreflightResult& result);
    void bootstrap(const BootstrapReport& report);
    void bootstrapFailed(const std::string& error);
    void stageBegin(LifecycleStage stage);
    void stage(const StageOutcome& outcome);
    void verifying();
    void health(const HealthReport& report);
    void cancelled();

    /// Builder output and/or recent service logs, for fatal outcomes.
    void diagnostics(const DeploymentOutcome& outcome);

    /// Final block; returns `exitCodeFor(outcome)`.
    int summary(const DeploymentOutcome& outcome, const std::vector<Failure>& failures);

    /// 0 for healthy or operator decline, 1 for everything else.
    static int exitCodeFor(const DeploymentOutcome& outcome);

    /// Best-effort hints from known log markers (tracebacks, bind errors...).
    static std::vector<std::string> scanLogs(const std::string& logTail);

  private:
    void rule(char c = '=');
    void printIndented(const std::string& text, std::size_t maxLines);

    std::ostream& out_;
    const DeploySettings& settings_;
    std::string composeCli_;
  };

} // namespace keel::core
