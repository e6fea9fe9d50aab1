/* @file DeploySettings.cpp
 * @brief Built-in stack description and JSON overlay.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Keel headers
#include "core/DeployErrors.hpp"
#include "core/DeploySettings.hpp"

using namespace keel::core;
using nlohmann::json;

namespace {

  std::chrono::milliseconds secondsField(const json& j, const char* key,
                                         std::chrono::milliseconds fallback) {
    if (!j.contains(key))
      return fallback;
    const auto& v = j.at(key);
    const double maxSeconds = static_cast<double>(kMaxDuration.count());
    if (!v.is_number() || v.get<double>() < 0 || v.get<double>() > maxSeconds)
      throw ConfigError(std::string("[DeploySettings] '") + key +
                        "' must be a number of seconds between 0 and " +
                        std::to_string(kMaxDuration.count()));
    return std::chrono::milliseconds(static_cast<long long>(v.get<double>() * 1000.0));
  }

  template <typename T> void readField(const json& j, const char* key, T& out) {
    if (!j.contains(key))
      return;
    try {
      out = j.at(key).get<T>();
    } catch (const json::exception& e) {
      throw ConfigError(std::string("[DeploySettings] bad value for '") + key + "': " + e.what());
    }
  }

} // namespace

DeploySettings DeploySettings::defaults() {
  DeploySettings s;

  s.requiredKeys = {
    { "OPENAI_API_KEY", "sk-your-openai-api-key-here", "OpenAI API key used by the extraction nodes" },
    { "AWS_ACCESS_KEY_ID", "your-aws-access-key-id", "IAM access key for S3/SQS/Textract" },
    { "AWS_SECRET_ACCESS_KEY", "your-aws-secret-access-key", "IAM secret for S3/SQS/Textract" },
    { "AWS_REGION", "", "AWS region, e.g. us-east-1" },
    { "DB_HOST", "your-db-host", "PostgreSQL host" },
    { "DB_NAME", "your-db-name", "PostgreSQL database name" },
    { "DB_USER", "your-db-user", "PostgreSQL user" },
    { "DB_PASSWORD", "your-db-password", "PostgreSQL password" },
  };

  s.directories = {
    "outputs",        "Nodes/outputs", "Nodes/outputs/temp_tamper_check", "cross_validation/reports",
    "result",         "logs",
  };

  s.legacyContainers = {
    "lendingwise-api",
    "lendingwise-sqs-worker",
    "lendingwise-cross-validation-watcher",
    "lendingwise-all-in-one",
  };

  s.endpoints = {
    { "API", "http://localhost:8000" },
    { "API Docs", "http://localhost:8000/docs" },
    { "SQS Worker", "background" },
    { "Cross-Validation", "background" },
  };

  return s;
}

void DeploySettings::applyJson(const json& j) {
  if (!j.is_object())
    throw ConfigError("[DeploySettings] settings root must be a JSON object");

  readField(j, "stack_name", stackName);
  readField(j, "project_dir", projectDir);
  readField(j, "env_file", envFile);
  readField(j, "env_example", envExample);
  readField(j, "expected_os", expectedOs);
  readField(j, "runtime_group", runtimeGroup);
  readField(j, "required_tools", requiredTools);
  readField(j, "directories", directories);
  readField(j, "legacy_containers", legacyContainers);
  readField(j, "log_tail_lines", logTailLines);
  commandTimeout = secondsField(j, "command_timeout_s", commandTimeout);

  if (j.contains("required_keys")) {
    const auto& keys = j.at("required_keys");
    if (!keys.is_array())
      throw ConfigError("[DeploySettings] 'required_keys' must be an array");
    requiredKeys.clear();
    for (const auto& k : keys) {
      RequiredKey rk;
      if (k.is_string()) {
        rk.name = k.get<std::string>();
      } else if (k.is_object() && k.contains("name")) {
        readField(k, "name", rk.name);
        readField(k, "placeholder", rk.placeholder);
        readField(k, "hint", rk.hint);
      } else {
        throw ConfigError("[DeploySettings] required_keys entries need a 'name'");
      }
      requiredKeys.push_back(std::move(rk));
    }
  }

  if (j.contains("endpoints")) {
    const auto& eps = j.at("endpoints");
    if (!eps.is_array())
      throw ConfigError("[DeploySettings] 'endpoints' must be an array");
    endpoints.clear();
    for (const auto& e : eps) {
      ServiceEndpoint ep;
      readField(e, "label", ep.label);
      readField(e, "location", ep.location);
      endpoints.push_back(std::move(ep));
    }
  }

  if (j.contains("health")) {
    const auto& h = j.at("health");
    if (!h.is_object())
      throw ConfigError("[DeploySettings] 'health' must be an object");
    readField(h, "url", health.url);
    health.settleWindow = secondsField(h, "settle_window_s", health.settleWindow);
    health.pollInterval = secondsField(h, "poll_interval_s", health.pollInterval);
    health.maxWait = secondsField(h, "max_wait_s", health.maxWait);
    health.probeTimeout = secondsField(h, "probe_timeout_s", health.probeTimeout);
    if (health.pollInterval.count() == 0)
      throw ConfigError("[DeploySettings] 'poll_interval_s' must be greater than zero");
  }

  if (stackName.empty())
    throw ConfigError("[DeploySettings] 'stack_name' must not be empty");
}

std::string DeploySettings::envFilePath() const {
  return (std::filesystem::path(projectDir) / envFile).string();
}
