#pragma once

/** @file  DeployCoordinator.hpp
 *  @brief Public API for keel::core::DeployCoordinator, the one-shot deploy FSM.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <memory>
#include <string>

#include "core/DeploySettings.hpp"
#include "core/DeploymentTypes.hpp"

namespace keel {
  namespace io {
    class ComposeClient;
    class Console;
    class HostEnvironment;
    class HttpProbe;
  } // namespace io

  namespace core {

    class ErrorMonitor;
    class Logger;
    class Reporter;

    enum class SystemState {
      Boot,
      Preflight,
      Bootstrap,
      Confirm,
      Stopping,
      Building,
      Starting,
      Verifying,
      Succeeded,
      Aborted,
      Cancelled
    };

    const char* toString(SystemState s);

    struct RunOptions {
      bool assumeYes{ false }; ///< skip the go/no-go prompt
    };

    /// External collaborators, all owned by the caller.
    struct Collaborators {
      io::HostEnvironment& host;
      io::ComposeClient& compose;
      io::HttpProbe& probe;
      io::Console& console;
    };

    /**
 * @class DeployCoordinator
 * @brief Drives Preflight → Bootstrap → Confirm → Stop → Build → Start →
 *        Verify, one explicit state per step.
 *
 *  * Each stage either advances or lands in a terminal state
 *    (Succeeded / Aborted / Cancelled); terminal states are final.
 *  * Owns the DeploymentOutcome for the run and hands it to Reporter.
 */
    class DeployCoordinator {

    public:
      DeployCoordinator(const DeploySettings& settings, Collaborators io, Reporter& reporter,
                        Logger& log, std::shared_ptr<ErrorMonitor> errMonitor);
      ~DeployCoordinator() = default;

      // ---- public API ----------------------------------------------------------
      DeploymentOutcome run(const RunOptions& options); ///< one full deployment
      SystemState state() const { return currentState_; }

    private:
      void transitionTo(SystemState next);

      void runPreflight(DeploymentOutcome& outcome);
      void runBootstrap(DeploymentOutcome& outcome);
      bool runConfirm(const RunOptions& options);
      void runLifecycle(DeploymentOutcome& outcome);
      void runVerify(DeploymentOutcome& outcome);
      void collectLogs(DeploymentOutcome& outcome);

      const DeploySettings& settings_;
      Collaborators io_;
      Reporter& reporter_;
      Logger& log_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;

      SystemState currentState_{ SystemState::Boot };
    };

  } // namespace core
} // namespace keel
