/* @file LifecycleDriver.cpp
 * @brief drives stop/build/start through the compose interface
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <iterator>
#include <string>

// Keel headers
#include "core/DeployErrors.hpp"
#include "core/LifecycleDriver.hpp"

using namespace keel::core;

namespace {
  constexpr const char* kComponent = "Lifecycle";

  std::string firstLine(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
      return {};
    auto end = text.find('\n', start);
    return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
  }
} // namespace

LifecycleDriver::LifecycleDriver(io::ComposeClient& compose, const DeploySettings& settings,
                                 Logger& log, std::shared_ptr<ErrorMonitor> errMonitor)
    : compose_(compose), settings_(settings), log_(log), errorMonitor_(std::move(errMonitor)) {
  assert(errorMonitor_ && "[LifecycleDriver] error monitor is nullptr");
}

bool LifecycleDriver::confirm(io::Console& console) {
  bool go = console.confirm("Proceed with deployment of " + settings_.stackName + "?");
  log_.info(kComponent, go ? "operator confirmed deployment" : "operator declined deployment");
  return go;
}

StageOutcome LifecycleDriver::stop() {
  StageOutcome out{ LifecycleStage::Stop };
  auto r = compose_.down(settings_.stackName);

  if (r.ok) {
    out.status = StageStatus::Succeeded;
    out.reason = r.nothingToDo ? "nothing to stop" : "previous deployment removed";
  } else {
    // stale state must not block a fresh deploy
    out.status = StageStatus::Failed;
    out.reason = "down exited with " + std::to_string(r.exitCode) + ": " + firstLine(r.output);
    log_.warn(kComponent, "stop failed, continuing: " + out.reason);
  }
  out.output = std::move(r.output);

  removeLegacyContainers();
  return out;
}

void LifecycleDriver::removeLegacyContainers() {
  for (const auto& name : settings_.legacyContainers) {
    auto r = compose_.removeContainer(name);
    if (r.ok || r.nothingToDo) {
      log_.debug(kComponent, "legacy container " + name + " cleared");
      continue;
    }
    log_.warn(kComponent, "could not remove legacy container " + name + ": " + firstLine(r.output));
  }
}

StageOutcome LifecycleDriver::fatalStage(LifecycleStage stage, const io::ComposeResult& r) {
  StageOutcome out{ stage, StageStatus::Failed };
  out.reason = std::string(toString(stage)) + " exited with " + std::to_string(r.exitCode);
  if (auto line = firstLine(r.output); !line.empty())
    out.reason += ": " + line;
  out.output = r.output;

  log_.error(kComponent, out.reason);
  errorMonitor_->notifyFailure(out.reason,
                               stage == LifecycleStage::Build
                                   ? "fix the image build error shown above, then re-run the deploy"
                                   : "inspect the service logs above; check port conflicts and "
                                     "values in " +
                                         settings_.envFile);
  return out;
}

StageOutcome LifecycleDriver::build() {
  auto r = compose_.build(settings_.stackName);
  if (!r.ok)
    return fatalStage(LifecycleStage::Build, r);
  log_.info(kComponent, "images built");
  return { LifecycleStage::Build, StageStatus::Succeeded, {}, std::move(r.output) };
}

StageOutcome LifecycleDriver::start() {
  auto r = compose_.up(settings_.stackName, true);
  if (!r.ok)
    return fatalStage(LifecycleStage::Start, r);
  log_.info(kComponent, "stack started (detached)");
  return { LifecycleStage::Start, StageStatus::Succeeded, {}, std::move(r.output) };
}

void LifecycleDriver::run(DeploymentOutcome& outcome, const Observer& observer) {
  using Step = StageOutcome (LifecycleDriver::*)();
  constexpr Step steps[] = { &LifecycleDriver::stop, &LifecycleDriver::build,
                             &LifecycleDriver::start };

  for (std::size_t i = 0; i < std::size(steps); ++i) {
    const auto stage = static_cast<LifecycleStage>(i);
    if (observer.onBegin)
      observer.onBegin(stage);

    StageOutcome& slot = outcome.stage(stage);
    slot = (this->*steps[i])();
    if (observer.onEnd)
      observer.onEnd(slot);

    if (slot.status == StageStatus::Failed && stage != LifecycleStage::Stop) {
      for (std::size_t j = i + 1; j < std::size(steps); ++j) {
        auto& rest = outcome.stage(static_cast<LifecycleStage>(j));
        rest.status = StageStatus::Skipped;
        rest.reason = std::string(toString(stage)) + " failed";
      }
      throw LifecycleError(stage, slot.reason, slot.output);
    }
  }
}
