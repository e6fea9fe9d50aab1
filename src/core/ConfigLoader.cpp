/* @file ConfigLoader.cpp
 * @brief JSON settings file reader.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Keel headers
#include "core/ConfigLoader.hpp"
#include "core/DeployErrors.hpp"
#include "core/DeploySettings.hpp"

using namespace keel::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw ConfigError("[ConfigLoader] cannot open settings file " + path_);

  try {
    return nlohmann::json::parse(in, nullptr, true, true); // allow comments
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

DeploySettings ConfigLoader::loadSettings() const {
  DeploySettings s = DeploySettings::defaults();
  s.applyJson(load());
  return s;
}
