/* @file DirectoryBootstrapper.cpp
 * @brief mkdir -p for every configured output directory
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <system_error>

#include "core/DeployErrors.hpp"
#include "core/DirectoryBootstrapper.hpp"

using namespace keel::core;
namespace fs = std::filesystem;

DirectoryBootstrapper::DirectoryBootstrapper(std::string baseDir, std::vector<std::string> paths)
    : base_(std::move(baseDir)), paths_(std::move(paths)) {}

BootstrapReport DirectoryBootstrapper::ensure() const {
  BootstrapReport report;

  for (const auto& rel : paths_) {
    const fs::path target = fs::path(base_) / rel;
    std::error_code ec;

    if (fs::exists(target, ec)) {
      if (!fs::is_directory(target, ec))
        throw BootstrapError(target.string(), "exists but is not a directory");
      report.existing.push_back(rel);
      continue;
    }

    if (!fs::create_directories(target, ec) && ec)
      throw BootstrapError(target.string(), ec.message());
    report.created.push_back(rel);
  }
  return report;
}
