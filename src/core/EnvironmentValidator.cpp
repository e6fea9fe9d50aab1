/* @file EnvironmentValidator.cpp
 * @brief platform / config file / tools / group / required-key checks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// Keel headers
#include "core/EnvironmentValidator.hpp"
#include "io/HostEnvironment.hpp"

using namespace keel::core;
using keel::io::FileAccess;

namespace {

  std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  CheckResult pass(std::string name, std::string message) {
    return { std::move(name), CheckStatus::Pass, std::move(message), {} };
  }

  CheckResult fail(std::string name, std::string message, std::string hint) {
    return { std::move(name), CheckStatus::Fail, std::move(message), std::move(hint) };
  }

} // namespace

EnvironmentValidator::EnvironmentValidator(const io::HostEnvironment& host,
                                           const DeploySettings& settings)
    : host_(host), settings_(settings) {}

PreflightResult EnvironmentValidator::run(const ConfigSource* config) const {
  PreflightResult result;
  result.add(checkPlatform());
  result.add(checkConfigFile());
  for (auto& r : checkTools())
    result.add(std::move(r));
  result.add(checkGroup());
  for (auto& r : checkKeys(config))
    result.add(std::move(r));
  return result;
}

CheckResult EnvironmentValidator::checkPlatform() const {
  const std::string os = host_.osFamily();
  if (lower(os) == lower(settings_.expectedOs))
    return pass("platform", "running on " + os);
  return fail("platform", "unsupported platform '" + os + "'",
              "run the deployment on a " + settings_.expectedOs + " host");
}

CheckResult EnvironmentValidator::checkConfigFile() const {
  const std::string path = settings_.envFilePath();
  switch (host_.fileAccess(path)) {
  case FileAccess::Readable:
    return pass("config-file", path + " found");
  case FileAccess::Unreadable:
    return fail("config-file", path + " exists but is not readable",
                "fix its permissions, e.g. chmod 600 " + path + " as the deploying user");
  case FileAccess::Missing:
  default:
    return fail("config-file", path + " not found",
                "copy " + settings_.envExample + " to " + settings_.envFile +
                    " and fill in the values");
  }
}

std::vector<CheckResult> EnvironmentValidator::checkTools() const {
  std::vector<CheckResult> out;
  bool haveDocker = false;

  for (const auto& tool : settings_.requiredTools) {
    const std::string name = "tool:" + tool;
    if (auto where = host_.findExecutable(tool)) {
      out.push_back(pass(name, tool + " at " + *where));
      if (tool == "docker")
        haveDocker = true;
    } else {
      out.push_back(fail(name, tool + " not found on PATH",
                         tool == "docker" ? "install Docker Engine: https://docs.docker.com/engine/install/"
                                          : "install " + tool + " and make sure it is on PATH"));
    }
  }

  // compose comes either as a docker plugin or as a standalone binary
  if (haveDocker) {
    if (host_.composeAvailable())
      out.push_back(pass("tool:compose", "compose available"));
    else
      out.push_back(fail("tool:compose", "neither 'docker compose' nor 'docker-compose' works",
                         "install the Docker Compose plugin (docker-compose-plugin package)"));
  }
  return out;
}

CheckResult EnvironmentValidator::checkGroup() const {
  const std::string& group = settings_.runtimeGroup;
  const std::string name = "group:" + group;
  if (group.empty() || host_.inGroup(group))
    return pass(name, "user may talk to the container runtime");
  return { name, CheckStatus::Warn, "current user is not in the '" + group + "' group",
           "sudo usermod -aG " + group + " $USER, then log out and back in" };
}

std::vector<CheckResult> EnvironmentValidator::checkKeys(const ConfigSource* config) const {
  std::vector<CheckResult> out;
  out.reserve(settings_.requiredKeys.size());

  for (const auto& key : settings_.requiredKeys) {
    const std::string name = "key:" + key.name;
    const std::string what = key.hint.empty() ? "" : " (" + key.hint + ")";

    if (!config) {
      out.push_back(fail(name, key.name + " cannot be checked, config file not loaded",
                         "create " + settings_.envFile + " and set " + key.name + what));
      continue;
    }

    auto value = config->get(key.name);
    if (!value || value->empty()) {
      out.push_back(fail(name, key.name + " is not set",
                         "set " + key.name + " in " + settings_.envFile + what));
    } else if (isPlaceholder(*value, key)) {
      out.push_back(fail(name, key.name + " still has the placeholder value '" + *value + "'",
                         "replace the template value of " + key.name + " in " +
                             settings_.envFile + what));
    } else {
      out.push_back(pass(name, key.name + " is set"));
    }
  }
  return out;
}

bool EnvironmentValidator::isPlaceholder(const std::string& value, const RequiredKey& key) {
  if (!key.placeholder.empty() && value == key.placeholder)
    return true;

  const std::string v = lower(value);
  const bool templ = v.find("your-") != std::string::npos || v.find("your_") != std::string::npos;
  const bool here = v.ends_with("-here") || v.ends_with("_here");
  return templ && here;
}
