/* @file ComposeClient.cpp
 * @brief docker compose CLI driver
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <system_error>

// Keel headers
#include "io/ComposeClient.hpp"

using namespace keel::io;
using keel::protocols::Command;
using keel::protocols::ComposeFlavor;
using keel::protocols::Response;

DockerCompose::DockerCompose(ProcessRunner& runner, std::string projectDir, ComposeFlavor flavor,
                             std::chrono::milliseconds timeout)
    : runner_(runner), projectDir_(std::move(projectDir)), flavor_(flavor), timeout_(timeout) {}

std::optional<ComposeFlavor> DockerCompose::detectFlavor(ProcessRunner& runner) {
  try {
    if (runner.run({ "docker", "compose", "version" }, kQueryTimeout).ok())
      return ComposeFlavor::Plugin;
    if (runner.run({ "docker-compose", "version" }, kQueryTimeout).ok())
      return ComposeFlavor::Legacy;
  } catch (const std::system_error& e) {
    std::cerr << "[DockerCompose] compose probe failed: " << e.what() << '\n';
  }
  return std::nullopt;
}

Command DockerCompose::command(const std::string& stack, std::string verb) const {
  Command cmd;
  cmd.flavor = flavor_;
  cmd.project = stack;
  cmd.verb = std::move(verb);
  return cmd;
}

ComposeResult DockerCompose::exec(const Command& cmd, std::chrono::milliseconds timeout) {
  ComposeResult r;
  ProcessResult pr;
  try {
    pr = runner_.run(cmd.toArgv(), timeout, projectDir_);
  } catch (const std::system_error& e) {
    r.output = std::string("failed to launch '") + cmd.toString() + "': " + e.what();
    return r;
  }

  r.exitCode = pr.exitCode;
  r.output = std::move(pr.output);
  r.ok = pr.ok();
  if (pr.timedOut)
    r.output += "\n'" + cmd.toString() + "' timed out after " +
                std::to_string(timeout.count() / 1000) + "s";
  return r;
}

ComposeResult DockerCompose::down(const std::string& stack) {
  auto cmd = command(stack, "down");
  cmd.args = { "--remove-orphans" };
  auto r = exec(cmd, kQueryTimeout * 4);

  // compose exits 0 with no container lines, or warns, when nothing was up
  if (r.ok && (r.output.find("No resource found") != std::string::npos ||
               r.output.find_first_not_of(" \t\r\n") == std::string::npos))
    r.nothingToDo = true;
  return r;
}

ComposeResult DockerCompose::build(const std::string& stack) {
  return exec(command(stack, "build"), timeout_);
}

ComposeResult DockerCompose::up(const std::string& stack, bool detached) {
  auto cmd = command(stack, "up");
  if (detached)
    cmd.args.push_back("-d");
  return exec(cmd, timeout_);
}

std::optional<Response> DockerCompose::ps(const std::string& stack) {
  auto cmd = command(stack, "ps");
  cmd.args = { "--all", "--format", "json" };
  auto r = exec(cmd, kQueryTimeout);
  if (!r.ok) {
    std::cerr << "[DockerCompose] ps failed: " << r.output << '\n';
    return std::nullopt;
  }
  return Response::fromWire(r.output);
}

std::string DockerCompose::logs(const std::string& stack, std::size_t tail) {
  auto cmd = command(stack, "logs");
  cmd.args = { "--no-color", "--tail", std::to_string(tail) };
  auto r = exec(cmd, kQueryTimeout);
  return r.output;
}

ComposeResult DockerCompose::removeContainer(const std::string& name) {
  ComposeResult r;
  try {
    auto pr = runner_.run({ "docker", "rm", "-f", name }, kQueryTimeout);
    r.exitCode = pr.exitCode;
    r.ok = pr.ok();
    r.output = std::move(pr.output);
    r.nothingToDo = !r.ok && r.output.find("No such container") != std::string::npos;
  } catch (const std::system_error& e) {
    r.output = e.what();
  }
  return r;
}
