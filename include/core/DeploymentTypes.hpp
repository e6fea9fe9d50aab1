#pragma once
/** @file  DeploymentTypes.hpp
 *  @brief Value types shared by every deployment stage (preflight, lifecycle, health).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace keel {
  namespace core {

    //---preflight------------------------------------------------------------

    enum class CheckStatus : std::uint8_t { Pass, Warn, Fail };

    inline const char* toString(CheckStatus s) {
      switch (s) {
      case CheckStatus::Pass:
        return "PASS";
      case CheckStatus::Warn:
        return "WARN";
      case CheckStatus::Fail:
        return "FAIL";
      default:
        return "UNKNOWN";
      }
    }

    /// One named preflight check, e.g. "tool:docker" or "key:DB_HOST".
    struct CheckResult {
      std::string name;
      CheckStatus status{ CheckStatus::Pass };
      std::string message;
      std::string hint; ///< remediation, empty for PASS
    };

    /**
 * @struct PreflightResult
 * @brief Ordered list of check outcomes.
 *
 *  * Any FAIL aborts the run, WARN never does.
 */
    struct PreflightResult {
      std::vector<CheckResult> checks;

      void add(CheckResult r) { checks.push_back(std::move(r)); }

      bool passed() const {
        for (const auto& c : checks)
          if (c.status == CheckStatus::Fail)
            return false;
        return true;
      }

      std::size_t count(CheckStatus s) const {
        std::size_t n = 0;
        for (const auto& c : checks)
          if (c.status == s)
            ++n;
        return n;
      }
    };

    //---lifecycle------------------------------------------------------------

    enum class LifecycleStage : std::uint8_t { Stop, Build, Start, Count };
    static_assert(static_cast<std::uint8_t>(LifecycleStage::Count) == 3,
                  "Stage count changed please update code that depends on it");

    inline const char* toString(LifecycleStage s) {
      switch (s) {
      case LifecycleStage::Stop:
        return "stop";
      case LifecycleStage::Build:
        return "build";
      case LifecycleStage::Start:
        return "start";
      default:
        return "unknown";
      }
    }

    enum class StageStatus : std::uint8_t { Pending, Succeeded, Skipped, Failed };

    inline const char* toString(StageStatus s) {
      switch (s) {
      case StageStatus::Pending:
        return "pending";
      case StageStatus::Succeeded:
        return "succeeded";
      case StageStatus::Skipped:
        return "skipped";
      case StageStatus::Failed:
        return "failed";
      default:
        return "unknown";
      }
    }

    struct StageOutcome {
      LifecycleStage stage{ LifecycleStage::Stop };
      StageStatus status{ StageStatus::Pending };
      std::string reason; ///< set when FAILED or SKIPPED
      std::string output; ///< captured stdout/stderr of the compose call
    };

    //---health---------------------------------------------------------------

    enum class HealthStatus : std::uint8_t { Pending, Healthy, Unhealthy, TimedOut };

    inline const char* toString(HealthStatus s) {
      switch (s) {
      case HealthStatus::Pending:
        return "PENDING";
      case HealthStatus::Healthy:
        return "HEALTHY";
      case HealthStatus::Unhealthy:
        return "UNHEALTHY";
      case HealthStatus::TimedOut:
        return "TIMED_OUT";
      default:
        return "UNKNOWN";
      }
    }

    struct HealthReport {
      HealthStatus status{ HealthStatus::Pending };
      std::string detail;                  ///< human explanation of the verdict
      std::vector<std::string> running;    ///< services seen in "running" state
      std::vector<std::string> notRunning; ///< services seen exited/dead/created
      int probeAttempts{ 0 };
      long lastHttpStatus{ 0 }; ///< 0 = no response received
    };

    //---aggregate------------------------------------------------------------

    /**
 * @struct DeploymentOutcome
 * @brief Everything one run produced, owned by DeployCoordinator.
 *
 *  * Built up stage by stage, then handed to Reporter once.
 */
    struct DeploymentOutcome {
      PreflightResult preflight;
      std::string bootstrapError; ///< empty = bootstrap ok or not reached
      std::array<StageOutcome, 3> stages{ { { LifecycleStage::Stop },
                                            { LifecycleStage::Build },
                                            { LifecycleStage::Start } } };
      HealthReport health;
      std::string logTail; ///< recent service logs, fetched on fatal outcomes
      bool cancelled{ false };
      int exitCode{ 0 };

      StageOutcome& stage(LifecycleStage s) { return stages[static_cast<std::size_t>(s)]; }
      const StageOutcome& stage(LifecycleStage s) const {
        return stages[static_cast<std::size_t>(s)];
      }
    };

  } // namespace core
} // namespace keel
