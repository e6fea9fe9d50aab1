#pragma once
/** @file  LifecycleDriver.hpp
 *  @brief Confirmation gate plus ordered stop → build → start against compose.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <memory>
#include <string>

// Keel headers
#include "core/DeploySettings.hpp"
#include "core/DeploymentTypes.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "io/ComposeClient.hpp"
#include "io/Console.hpp"

namespace keel {
  namespace core {

    /**
 * @class LifecycleDriver
 * @brief Issues the three mutating compose operations in enum order.
 *
 *  * Stop is best-effort: its failure is logged and the run continues.
 *  * Build/Start failures are reported to ErrorMonitor, remaining stages are
 *    marked SKIPPED and LifecycleError is thrown.
 */
    class LifecycleDriver {
    public:
      /// Called before a stage begins and after it resolves.
      struct Observer {
        std::function<void(LifecycleStage)> onBegin;
        std::function<void(const StageOutcome&)> onEnd;
      };

      LifecycleDriver(io::ComposeClient& compose, const DeploySettings& settings, Logger& log,
                      std::shared_ptr<ErrorMonitor> errMonitor);

      //---public APIs------------------------------------------------------
      /// Go/no-go prompt; true = proceed.
      bool confirm(io::Console& console);

      StageOutcome stop();
      StageOutcome build();
      StageOutcome start();

      /// stop, build, start into \p outcome; throws LifecycleError on a fatal stage.
      void run(DeploymentOutcome& outcome, const Observer& observer = {});

    private:
      void removeLegacyContainers();
      StageOutcome fatalStage(LifecycleStage stage, const io::ComposeResult& r);

      io::ComposeClient& compose_;
      const DeploySettings& settings_;
      Logger& log_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
    };

  } // namespace core
} // namespace keel
