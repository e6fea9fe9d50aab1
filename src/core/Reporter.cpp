/* @file Reporter.cpp
 * @brief console rendering of a deployment run
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cctype>
#include <ostream>
#include <sstream>
#include <utility>

// Keel headers
#include "core/DirectoryBootstrapper.hpp"
#include "core/ExitCodes.hpp"
#include "core/Reporter.hpp"

using namespace keel::core;

namespace {

  constexpr std::size_t kWidth = 80;
  constexpr std::size_t kMaxBuildLines = 40;

  std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  const char* mark(StageStatus s) {
    switch (s) {
    case StageStatus::Succeeded:
      return "[ OK ]";
    case StageStatus::Failed:
      return "[FAIL]";
    case StageStatus::Skipped:
      return "[SKIP]";
    default:
      return "[ .. ]";
    }
  }

  // marker (lower-case) → hint
  const std::array<std::pair<const char*, const char*>, 6> kLogMarkers{ {
      { "uvicorn running on",
        "the API process reports it is listening; it may need more time, try a larger --timeout" },
      { "traceback (most recent call last)",
        "a Python traceback appears in the service logs, see the log tail above" },
      { "address already in use", "port conflict: another process already holds the API port" },
      { "port is already allocated",
        "port conflict: another container already publishes the API port" },
      { "modulenotfounderror",
        "a Python module is missing from the image; check requirements.txt and rebuild" },
      { "permission denied", "a service hit 'permission denied'; check volume and file ownership" },
  } };

} // namespace

Reporter::Reporter(std::ostream& out, const DeploySettings& settings, std::string composeCli)
    : out_(out), settings_(settings), composeCli_(std::move(composeCli)) {}

void Reporter::rule(char c) { out_ << std::string(kWidth, c) << '\n'; }

void Reporter::printIndented(const std::string& text, std::size_t maxLines) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line);)
    lines.push_back(std::move(line));

  std::size_t first = lines.size() > maxLines ? lines.size() - maxLines : 0;
  if (first > 0)
    out_ << "    ... (" << first << " earlier lines omitted)\n";
  for (std::size_t i = first; i < lines.size(); ++i)
    out_ << "    " << lines[i] << '\n';
}

void Reporter::banner() {
  rule();
  out_ << "  " << settings_.stackName << " - deploy\n";
  rule();
  out_ << '\n';
}

void Reporter::preflight(const PreflightResult& result) {
  out_ << "Preflight checks\n";
  for (const auto& c : result.checks) {
    out_ << "  [" << toString(c.status) << "] " << c.name << ": " << c.message << '\n';
    if (c.status != CheckStatus::Pass && !c.hint.empty())
      out_ << "         -> " << c.hint << '\n';
  }
  out_ << "  " << result.count(CheckStatus::Pass) << " passed, " << result.count(CheckStatus::Warn)
       << " warning(s), " << result.count(CheckStatus::Fail) << " failed\n\n";
}

void Reporter::bootstrap(const BootstrapReport& report) {
  out_ << "Directories: " << report.created.size() << " created, " << report.existing.size()
       << " already present\n";
  for (const auto& d : report.created)
    out_ << "  + " << d << '\n';
  out_ << '\n';
}

void Reporter::bootstrapFailed(const std::string& error) {
  out_ << "Directories: [FAIL] " << error << "\n\n";
}

void Reporter::stageBegin(LifecycleStage stage) {
  switch (stage) {
  case LifecycleStage::Stop:
    out_ << "Stopping previous deployment...\n";
    break;
  case LifecycleStage::Build:
    out_ << "Building images (this can take a while)...\n";
    break;
  case LifecycleStage::Start:
    out_ << "Starting services in detached mode...\n";
    break;
  default:
    break;
  }
}

void Reporter::stage(const StageOutcome& outcome) {
  out_ << "  " << mark(outcome.status) << ' ' << toString(outcome.stage);
  if (!outcome.reason.empty())
    out_ << ": " << outcome.reason;
  if (outcome.stage == LifecycleStage::Stop && outcome.status == StageStatus::Failed)
    out_ << " (continuing)";
  out_ << "\n\n";
}

void Reporter::verifying() {
  out_ << "Verifying health (up to "
       << std::chrono::duration_cast<std::chrono::seconds>(settings_.health.maxWait).count()
       << "s, probing " << settings_.health.url << ")...\n";
}

void Reporter::health(const HealthReport& report) {
  out_ << "  [" << toString(report.status) << "] " << report.detail << '\n';
  if (report.status != HealthStatus::Healthy && report.probeAttempts > 0)
    out_ << "  last HTTP status: "
         << (report.lastHttpStatus > 0 ? std::to_string(report.lastHttpStatus) : "no response")
         << " after " << report.probeAttempts << " attempt(s)\n";
  if (!report.running.empty()) {
    out_ << "  running:";
    for (const auto& s : report.running)
      out_ << ' ' << s;
    out_ << '\n';
  }
  if (!report.notRunning.empty()) {
    out_ << "  not running:";
    for (const auto& s : report.notRunning)
      out_ << ' ' << s;
    out_ << '\n';
  }
  out_ << '\n';
}

void Reporter::cancelled() { out_ << "Deployment cancelled by operator, no containers were touched.\n"; }

void Reporter::diagnostics(const DeploymentOutcome& outcome) {
  const auto& build = outcome.stage(LifecycleStage::Build);
  if (build.status == StageStatus::Failed && !build.output.empty()) {
    rule('-');
    out_ << "Build output (last " << kMaxBuildLines << " lines):\n";
    printIndented(build.output, kMaxBuildLines);
  }

  const auto& start = outcome.stage(LifecycleStage::Start);
  if (start.status == StageStatus::Failed && !start.output.empty()) {
    rule('-');
    out_ << "Start output:\n";
    printIndented(start.output, kMaxBuildLines);
  }

  if (!outcome.logTail.empty()) {
    rule('-');
    out_ << "Recent service logs (last " << settings_.logTailLines << " lines):\n";
    printIndented(outcome.logTail, settings_.logTailLines);
    for (const auto& hint : scanLogs(outcome.logTail))
      out_ << "  hint: " << hint << '\n';
  }
}

int Reporter::summary(const DeploymentOutcome& outcome, const std::vector<Failure>& failures) {
  const int code = exitCodeFor(outcome);
  const std::string logsCmd = composeCli_ + " -p " + settings_.stackName + " logs -f";
  const std::string downCmd = composeCli_ + " -p " + settings_.stackName + " down";

  out_ << '\n';
  rule();
  if (outcome.cancelled) {
    out_ << "  Deployment cancelled\n";
    rule();
    return code;
  }

  out_ << (code == 0 ? "  Deployment complete!\n" : "  Deployment FAILED\n");
  rule();

  out_ << "  preflight : " << (outcome.preflight.passed() ? "passed" : "failed") << '\n';
  if (!outcome.bootstrapError.empty())
    out_ << "  dirs      : failed\n";
  for (const auto& s : outcome.stages)
    out_ << "  " << toString(s.stage) << std::string(10 - std::string(toString(s.stage)).size(), ' ')
         << ": " << toString(s.status) << '\n';
  out_ << "  health    : " << toString(outcome.health.status) << '\n';

  if (!failures.empty()) {
    out_ << "\nWhat to do:\n";
    for (const auto& f : failures) {
      out_ << "  - " << f.message << '\n';
      if (!f.hint.empty())
        out_ << "      " << f.hint << '\n';
    }
  }

  const bool deployed = outcome.stage(LifecycleStage::Start).status == StageStatus::Succeeded;
  if (deployed) {
    out_ << "\nServices:\n";
    for (const auto& ep : settings_.endpoints)
      out_ << "  - " << ep.label << ": " << ep.location << '\n';
    out_ << "\nView logs: " << logsCmd << '\n';
    out_ << "Stop all:  " << downCmd << '\n';
    if (code != 0)
      out_ << "(the deployment was left running for inspection)\n";
  }
  rule();
  return code;
}

int Reporter::exitCodeFor(const DeploymentOutcome& outcome) {
  if (outcome.cancelled)
    return toInt(ExitCode::kSuccess);
  if (!outcome.preflight.passed() || !outcome.bootstrapError.empty())
    return toInt(ExitCode::kFailure);
  for (const auto& s : outcome.stages)
    if (s.status == StageStatus::Failed && s.stage != LifecycleStage::Stop)
      return toInt(ExitCode::kFailure);
  return toInt(outcome.health.status == HealthStatus::Healthy ? ExitCode::kSuccess
                                                              : ExitCode::kFailure);
}

std::vector<std::string> Reporter::scanLogs(const std::string& logTail) {
  std::vector<std::string> hints;
  const std::string haystack = lower(logTail);
  for (const auto& [marker, hint] : kLogMarkers)
    if (haystack.find(marker) != std::string::npos)
      hints.emplace_back(hint);
  return hints;
}
