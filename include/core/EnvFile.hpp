#pragma once
/** @file  EnvFile.hpp
 *  @brief Parser for docker-compose style `.env` files.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "core/ConfigSource.hpp"

namespace keel::core {

  /**
 * @class EnvFile
 * @brief Reads KEY=VALUE lines into a ConfigSource.
 *
 *  * `#` comments and blank lines are ignored, an `export ` prefix is allowed.
 *  * Matching single or double quotes around a value are stripped.
 *  * Lines without `=` are skipped (compose does the same).
 */
  class EnvFile {
  public:
    explicit EnvFile(std::string path);

    /// Parse the file or throw `std::runtime_error` if it cannot be opened.
    ConfigSource load() const;

    /// Parse already-read text.
    static ConfigSource parse(const std::string& text);

  private:
    std::string path_;
  };

} // namespace keel::core
