/* @file main.cpp
 * @brief `keel` - one-shot deploy of the compose stack in the current directory
 *
 * Usage:
 *   keel [deploy] [-y] [-C DIR] [-s SETTINGS.json] [-t SECONDS] [-v]
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Keel headers
#include "core/CommandLine.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DeployCoordinator.hpp"
#include "core/DeployErrors.hpp"
#include "core/DeploySettings.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ExitCodes.hpp"
#include "core/Logger.hpp"
#include "core/Reporter.hpp"
#include "io/ComposeClient.hpp"
#include "io/Console.hpp"
#include "io/HostEnvironment.hpp"
#include "io/HttpProbe.hpp"
#include "io/ProcessRunner.hpp"

using namespace keel;

namespace {
  constexpr const char* kLogFile = "logs/keel-deploy.log";
} // namespace

int main(int argc, char** argv) {
  auto opts = core::parseArgs(std::vector<std::string>(argv + 1, argv + argc), std::cerr);
  if (!opts) {
    core::usage(std::cerr);
    return core::toInt(core::ExitCode::kUsage);
  }
  if (opts->help) {
    core::usage(std::cout);
    return core::toInt(core::ExitCode::kSuccess);
  }

  try {
    core::DeploySettings settings = opts->settingsPath
                                        ? core::ConfigLoader(*opts->settingsPath).loadSettings()
                                        : core::DeploySettings::defaults();
    if (opts->projectDir)
      settings.projectDir = *opts->projectDir;
    if (opts->timeoutSeconds)
      settings.health.maxWait = std::chrono::seconds(*opts->timeoutSeconds);

    core::Logger log;
    log.setConsoleLevel(opts->verbose ? core::LogLevel::Debug : core::LogLevel::Warn);
    const auto logPath = std::filesystem::path(settings.projectDir) / kLogFile;
    std::error_code ec;
    if (std::filesystem::is_directory(logPath.parent_path(), ec))
      log.startNewRun(logPath.string());

    auto errors = std::make_shared<core::ErrorMonitor>();
    errors->registerEscalation(
        [&log](const core::Failure& f) { log.error("ErrorMonitor", f.message); });

    io::ProcessRunner runner;
    io::HostEnvironment host(runner);
    const auto flavor =
        io::DockerCompose::detectFlavor(runner).value_or(protocols::ComposeFlavor::Plugin);
    io::DockerCompose compose(runner, settings.projectDir, flavor, settings.commandTimeout);
    io::HttpProbe probe;
    io::Console console(std::cin, std::cout);

    core::Reporter reporter(std::cout, settings,
                            flavor == protocols::ComposeFlavor::Plugin ? "docker compose"
                                                                       : "docker-compose");
    core::DeployCoordinator coordinator(settings, { host, compose, probe, console }, reporter, log,
                                        errors);

    core::RunOptions runOptions;
    runOptions.assumeYes = opts->assumeYes;
    auto outcome = coordinator.run(runOptions);

    log.finishRun();
    return outcome.exitCode;
  } catch (const core::ConfigError& e) {
    std::cerr << "keel: " << e.what() << '\n';
  } catch (const std::exception& e) {
    std::cerr << "keel: fatal: " << e.what() << '\n';
  }
  return core::toInt(core::ExitCode::kFailure);
}
