#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time settings (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "core/Value.hpp"

namespace labsim::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON settings file and hands the parsed
 *        object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * All schema validation lives in the calling layer (loadFeatureFlags).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a JSON object or throw `ConfigurationError`.
    Value load() const;

    const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
  };

} // namespace labsim::core
