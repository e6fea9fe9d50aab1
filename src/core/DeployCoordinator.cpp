/* @file DeployCoordinator.cpp
 * @brief explicit state machine for one deployment run
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <optional>
#include <stdexcept>

// Keel headers
#include "core/DeployCoordinator.hpp"
#include "core/DeployErrors.hpp"
#include "core/DirectoryBootstrapper.hpp"
#include "core/EnvFile.hpp"
#include "core/EnvironmentValidator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/HealthVerifier.hpp"
#include "core/LifecycleDriver.hpp"
#include "core/Logger.hpp"
#include "core/Reporter.hpp"
#include "io/ComposeClient.hpp"
#include "io/Console.hpp"
#include "io/HostEnvironment.hpp"

namespace keel {
  namespace core {

    namespace {
      constexpr const char* kComponent = "Coordinator";

      bool allowed(SystemState from, SystemState to) {
        switch (from) {
        case SystemState::Boot:
          return to == SystemState::Preflight;
        case SystemState::Preflight:
          return to == SystemState::Bootstrap || to == SystemState::Aborted;
        case SystemState::Bootstrap:
          return to == SystemState::Confirm || to == SystemState::Aborted;
        case SystemState::Confirm:
          return to == SystemState::Stopping || to == SystemState::Cancelled;
        case SystemState::Stopping:
          return to == SystemState::Building; // stop is best-effort
        case SystemState::Building:
          return to == SystemState::Starting || to == SystemState::Aborted;
        case SystemState::Starting:
          return to == SystemState::Verifying || to == SystemState::Aborted;
        case SystemState::Verifying:
          return to == SystemState::Succeeded || to == SystemState::Aborted;
        default:
          return false; // terminal
        }
      }
    } // namespace

    const char* toString(SystemState s) {
      switch (s) {
      case SystemState::Boot:
        return "BOOT";
      case SystemState::Preflight:
        return "PREFLIGHT";
      case SystemState::Bootstrap:
        return "BOOTSTRAP";
      case SystemState::Confirm:
        return "CONFIRM";
      case SystemState::Stopping:
        return "STOPPING";
      case SystemState::Building:
        return "BUILDING";
      case SystemState::Starting:
        return "STARTING";
      case SystemState::Verifying:
        return "VERIFYING";
      case SystemState::Succeeded:
        return "SUCCEEDED";
      case SystemState::Aborted:
        return "ABORTED";
      case SystemState::Cancelled:
        return "CANCELLED";
      default:
        return "UNKNOWN";
      }
    }

    DeployCoordinator::DeployCoordinator(const DeploySettings& settings, Collaborators io,
                                         Reporter& reporter, Logger& log,
                                         std::shared_ptr<ErrorMonitor> errMonitor)
        : settings_(settings), io_(io), reporter_(reporter), log_(log),
          errorMonitor_(std::move(errMonitor)) {
      assert(errorMonitor_ && "[DeployCoordinator] error monitor is nullptr");
    }

    void DeployCoordinator::transitionTo(SystemState next) {
      if (!allowed(currentState_, next))
        throw std::logic_error(std::string("[DeployCoordinator] illegal transition ") +
                               toString(currentState_) + " -> " + toString(next));
      log_.debug(kComponent, std::string(toString(currentState_)) + " -> " + toString(next));
      currentState_ = next;
    }

    DeploymentOutcome DeployCoordinator::run(const RunOptions& options) {
      DeploymentOutcome outcome;
      reporter_.banner();
      log_.info(kComponent, "deploying stack '" + settings_.stackName + "' from " +
                                settings_.projectDir);

      try {
        transitionTo(SystemState::Preflight);
        runPreflight(outcome);

        transitionTo(SystemState::Bootstrap);
        runBootstrap(outcome);

        transitionTo(SystemState::Confirm);
        if (!runConfirm(options)) {
          outcome.cancelled = true;
          transitionTo(SystemState::Cancelled);
          reporter_.cancelled();
        } else {
          runLifecycle(outcome);
          transitionTo(SystemState::Verifying);
          runVerify(outcome);
          transitionTo(SystemState::Succeeded);
        }
      } catch (const PreflightError& e) {
        log_.error(kComponent, e.what());
        transitionTo(SystemState::Aborted);
      } catch (const BootstrapError& e) {
        outcome.bootstrapError = e.what();
        log_.error(kComponent, e.what());
        transitionTo(SystemState::Aborted);
      } catch (const LifecycleError& e) {
        log_.error(kComponent, e.what());
        collectLogs(outcome);
        transitionTo(SystemState::Aborted);
      } catch (const HealthError& e) {
        // no teardown: a slow start must stay inspectable
        log_.error(kComponent, e.what());
        collectLogs(outcome);
        transitionTo(SystemState::Aborted);
      }

      reporter_.diagnostics(outcome);
      outcome.exitCode = reporter_.summary(outcome, errorMonitor_->failures());
      log_.info(kComponent, std::string("finished in state ") + toString(currentState_) +
                                ", exit code " + std::to_string(outcome.exitCode));
      return outcome;
    }

    void DeployCoordinator::runPreflight(DeploymentOutcome& outcome) {
      const std::string envPath = settings_.envFilePath();

      std::optional<ConfigSource> config;
      if (io_.host.fileAccess(envPath) == io::FileAccess::Readable) {
        try {
          config = EnvFile(envPath).load();
          log_.debug(kComponent, "loaded " + std::to_string(config->size()) + " keys from " + envPath);
        } catch (const std::runtime_error& e) {
          log_.warn(kComponent, e.what());
        }
      }

      EnvironmentValidator validator(io_.host, settings_);
      outcome.preflight = validator.run(config ? &*config : nullptr);
      reporter_.preflight(outcome.preflight);

      for (const auto& c : outcome.preflight.checks) {
        if (c.status == CheckStatus::Fail)
          errorMonitor_->notifyFailure(c.name + ": " + c.message, c.hint);
        else if (c.status == CheckStatus::Warn)
          log_.warn("Validator", c.name + ": " + c.message);
      }

      if (!outcome.preflight.passed())
        throw PreflightError(outcome.preflight);
    }

    void DeployCoordinator::runBootstrap(DeploymentOutcome&) {
      DirectoryBootstrapper bootstrapper(settings_.projectDir, settings_.directories);
      try {
        auto report = bootstrapper.ensure();
        reporter_.bootstrap(report);
        log_.info("Bootstrap", std::to_string(report.created.size()) + " directories created");
      } catch (const BootstrapError& e) {
        reporter_.bootstrapFailed(e.what());
        errorMonitor_->notifyFailure(e.what(), "check ownership and permissions of " + e.path() +
                                                   " or its parent directory");
        throw;
      }
    }

    bool DeployCoordinator::runConfirm(const RunOptions& options) {
      if (options.assumeYes || !io_.console.interactive()) {
        log_.debug(kComponent, "non-interactive run, confirmation skipped");
        return true;
      }
      LifecycleDriver driver(io_.compose, settings_, log_, errorMonitor_);
      return driver.confirm(io_.console);
    }

    void DeployCoordinator::runLifecycle(DeploymentOutcome& outcome) {
      LifecycleDriver driver(io_.compose, settings_, log_, errorMonitor_);

      LifecycleDriver::Observer observer;
      observer.onBegin = [this](LifecycleStage stage) {
        switch (stage) {
        case LifecycleStage::Stop:
          transitionTo(SystemState::Stopping);
          break;
        case LifecycleStage::Build:
          transitionTo(SystemState::Building);
          break;
        case LifecycleStage::Start:
          transitionTo(SystemState::Starting);
          break;
        default:
          break;
        }
        reporter_.stageBegin(stage);
      };
      observer.onEnd = [this](const StageOutcome& stage) { reporter_.stage(stage); };

      driver.run(outcome, observer);
    }

    void DeployCoordinator::runVerify(DeploymentOutcome& outcome) {
      reporter_.verifying();
      HealthVerifier verifier(io_.compose, io_.probe, settings_.health, log_);
      outcome.health = verifier.verify(settings_.stackName);
      reporter_.health(outcome.health);

      switch (outcome.health.status) {
      case HealthStatus::Healthy:
        return;
      case HealthStatus::TimedOut:
        errorMonitor_->notifyFailure("health check timed out: " + outcome.health.detail,
                                     "the stack is still up; re-check " + settings_.health.url +
                                         " shortly or re-run with a larger --timeout");
        break;
      default:
        errorMonitor_->notifyFailure("stack is unhealthy: " + outcome.health.detail,
                                     "services are exiting at startup; read the log tail "
                                     "above and verify the values in " +
                                         settings_.envFile);
        break;
      }
      throw HealthError(outcome.health.status, outcome.health.detail);
    }

    void DeployCoordinator::collectLogs(DeploymentOutcome& outcome) {
      outcome.logTail = io_.compose.logs(settings_.stackName, settings_.logTailLines);
    }

  } // namespace core
} // namespace keel
