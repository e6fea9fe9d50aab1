#pragma once
/** @file  DirectoryBootstrapper.hpp
 *  @brief Idempotent create-if-missing for the stack's output directories.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

namespace keel::core {

  struct BootstrapReport {
    std::vector<std::string> created;
    std::vector<std::string> existing;
  };

  /**
 * @class DirectoryBootstrapper
 * @brief Ensures each relative path exists under a base directory.
 *
 *  * Intermediate segments are created as needed.
 *  * Throws BootstrapError on the first path that cannot be made a directory.
 */
  class DirectoryBootstrapper {
  public:
    DirectoryBootstrapper(std::string baseDir, std::vector<std::string> paths);

    BootstrapReport ensure() const;

  private:
    std::string base_;
    std::vector<std::string> paths_;
  };

} // namespace keel::core
