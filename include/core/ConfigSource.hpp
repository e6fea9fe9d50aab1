#pragma once
/** @file  ConfigSource.hpp
 *  @brief Read-only key/value view over the stack's environment file.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <optional>
#include <string>

namespace keel {
  namespace core {

    /**
 * @class ConfigSource
 * @brief Immutable snapshot of configuration values for one run.
 *
 *  * Loaded once at run start, passed explicitly to whoever needs it.
 *  * Never consults the process environment.
 */
    class ConfigSource {
    public:
      ConfigSource() = default;
      explicit ConfigSource(std::map<std::string, std::string> values)
          : values_(std::move(values)) {}

      /// @returns the value for \p key or std::nullopt when absent.
      std::optional<std::string> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end())
          return std::nullopt;
        return it->second;
      }

      bool contains(const std::string& key) const { return values_.count(key) != 0; }
      std::size_t size() const { return values_.size(); }

    private:
      std::map<std::string, std::string> values_;
    };

  } // namespace core
} // namespace keel
