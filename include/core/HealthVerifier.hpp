#pragma once
/** @file  HealthVerifier.hpp
 *  @brief Post-start gate: service status poll, then HTTP liveness poll.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

#include "core/DeploySettings.hpp"
#include "core/DeploymentTypes.hpp"

namespace keel {
  namespace io {
    class ComposeClient;
    class HttpProbe;
  } // namespace io

  namespace core {

    class Logger;

    /**
 * @class HealthVerifier
 * @brief Resolves a HealthReport from PENDING to exactly one terminal status.
 *
 *  1. `ps` until a service is running, within the settle window. None
 *     running by then (or all of them exited) → UNHEALTHY at once.
 *  2. GET the health URL until any non-5xx answer → HEALTHY.
 *  3. Overall budget exhausted first → TIMED_OUT.
 *
 *  * Retries are spaced by a fixed interval.
 *  * Read-only: never stops or restarts anything.
 */
    class HealthVerifier {
    public:
      HealthVerifier(io::ComposeClient& compose, io::HttpProbe& probe, HealthPolicy policy,
                     Logger& log);

      HealthReport verify(const std::string& stack);

    private:
      using Clock = std::chrono::steady_clock;

      bool waitForRunning(const std::string& stack, HealthReport& report,
                          Clock::time_point settleDeadline);
      void probeLiveness(HealthReport& report, Clock::time_point deadline);
      void resolve(HealthReport& report, HealthStatus status, std::string detail);

      io::ComposeClient& compose_;
      io::HttpProbe& probe_;
      HealthPolicy policy_;
      Logger& log_;
    };

  } // namespace core
} // namespace keel
