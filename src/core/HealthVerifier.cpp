/* @file HealthVerifier.cpp
 * @brief status + liveness polling with fixed backoff and an overall deadline
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <thread>

// Keel headers
#include "core/HealthVerifier.hpp"
#include "core/Logger.hpp"
#include "io/ComposeClient.hpp"
#include "io/HttpProbe.hpp"

using namespace keel::core;

namespace {
  constexpr const char* kComponent = "Health";

  std::string joined(const std::vector<std::string>& v) {
    std::string out;
    for (const auto& s : v) {
      if (!out.empty())
        out += ", ";
      out += s;
    }
    return out;
  }

  bool terminalState(const std::string& state) { return state == "exited" || state == "dead"; }
} // namespace

HealthVerifier::HealthVerifier(io::ComposeClient& compose, io::HttpProbe& probe,
                               HealthPolicy policy, Logger& log)
    : compose_(compose), probe_(probe), policy_(std::move(policy)), log_(log) {}

void HealthVerifier::resolve(HealthReport& report, HealthStatus status, std::string detail) {
  if (report.status != HealthStatus::Pending)
    throw std::logic_error("[HealthVerifier] health already resolved");
  report.status = status;
  report.detail = std::move(detail);
  log_.log({ status == HealthStatus::Healthy ? LogLevel::Info : LogLevel::Error, kComponent,
             std::string(toString(status)) + ": " + report.detail });
}

HealthReport HealthVerifier::verify(const std::string& stack) {
  HealthReport report;
  const auto begin = Clock::now();
  const auto deadline = begin + policy_.maxWait;
  const auto settleDeadline = std::min(begin + policy_.settleWindow, deadline);

  if (!waitForRunning(stack, report, settleDeadline))
    return report;

  probeLiveness(report, deadline);
  return report;
}

bool HealthVerifier::waitForRunning(const std::string& stack, HealthReport& report,
                                    Clock::time_point settleDeadline) {
  bool listed = false;

  for (;;) {
    if (auto ps = compose_.ps(stack)) {
      listed = true;
      report.running.clear();
      report.notRunning.clear();
      bool allTerminal = !ps->services.empty();
      for (const auto& svc : ps->services) {
        if (svc.running()) {
          report.running.push_back(svc.service);
        } else {
          report.notRunning.push_back(svc.service + " (" + svc.state + ")");
        }
        allTerminal = allTerminal && terminalState(svc.state);
      }

      if (ps->runningCount() > 0) {
        log_.info(kComponent, std::to_string(ps->runningCount()) + " of " +
                                  std::to_string(ps->services.size()) +
                                  " services running: " + joined(report.running));
        return true;
      }
      if (allTerminal) {
        resolve(report, HealthStatus::Unhealthy,
                "every service exited: " + joined(report.notRunning));
        return false;
      }
    }

    if (Clock::now() + policy_.pollInterval > settleDeadline)
      break;
    std::this_thread::sleep_for(policy_.pollInterval);
  }

  if (!listed) {
    resolve(report, HealthStatus::Unhealthy, "service status listing could not be obtained");
  } else if (report.notRunning.empty()) {
    resolve(report, HealthStatus::Unhealthy, "no service of the stack is running");
  } else {
    resolve(report, HealthStatus::Unhealthy,
            "no service reached 'running': " + joined(report.notRunning));
  }
  return false;
}

void HealthVerifier::probeLiveness(HealthReport& report, Clock::time_point deadline) {
  std::string lastError;

  for (;;) {
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    auto timeout = std::max(std::chrono::milliseconds{ 1 }, std::min(policy_.probeTimeout, remaining));

    ++report.probeAttempts;
    auto r = probe_.get(policy_.url, timeout);
    report.lastHttpStatus = r.httpStatus;

    if (r.alive()) {
      resolve(report, HealthStatus::Healthy,
              policy_.url + " answered HTTP " + std::to_string(r.httpStatus) + " after " +
                  std::to_string(report.probeAttempts) + " attempt(s)");
      return;
    }
    lastError = r.reachable ? "HTTP " + std::to_string(r.httpStatus) : r.error;
    log_.debug(kComponent, "probe " + std::to_string(report.probeAttempts) + ": " + lastError);

    if (Clock::now() + policy_.pollInterval >= deadline)
      break;
    std::this_thread::sleep_for(policy_.pollInterval);
  }

  auto waited = std::chrono::duration_cast<std::chrono::seconds>(policy_.maxWait).count();
  resolve(report, HealthStatus::TimedOut,
          policy_.url + " did not answer within " + std::to_string(waited) + "s (last: " +
              (lastError.empty() ? "no response" : lastError) + ")");
}
