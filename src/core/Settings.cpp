/* @file Settings.cpp
 * @brief feature flag resolution (settings file + environment) and log level names
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdlib>

// spdlog headers
#include <spdlog/spdlog.h>

// labsim headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/Settings.hpp"

namespace labsim::core {
  namespace {

    std::string toLower(std::string s) {
      std::transform(s.begin(), s.end(), s.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return s;
    }

    bool settingWithEnvOverride(const Value& settings, const std::string& key) {
      bool value = false;
      if (auto it = settings.find(key); it != settings.end() && !it->is_null()) {
        if (!it->is_boolean())
          throw ConfigurationError("setting '" + key + "' must be a boolean");
        value = it->get<bool>();
      }

      const std::string envName = kFeatureFlagEnvPrefix + key;
      if (const char* raw = std::getenv(envName.c_str())) {
        const std::string env = toLower(raw);
        if (env == "true" || env == "1")
          value = true;
        else if (env == "false" || env == "0")
          value = false;
        else
          throw ConfigurationError(envName + "='" + raw + "' is not a boolean");
        diagnostics()->debug("[Settings] {} overridden by {}", key, envName);
      }
      return value;
    }

  } // namespace

  FeatureFlags loadFeatureFlags(const Value& settings) {
    if (!settings.is_null() && !settings.is_object())
      throw ConfigurationError("feature flag settings must be a JSON object");

    const Value& source = settings.is_null() ? Value::object() : settings;
    FeatureFlags flags;
    flags.useProtocolApiV2 = settingWithEnvOverride(source, kUseProtocolApi2Key);
    flags.enableApi1Backcompat = settingWithEnvOverride(source, kEnableApi1BackcompatKey);
    return flags;
  }

  FeatureFlags loadFeatureFlags(const ConfigLoader& loader) { return loadFeatureFlags(loader.load()); }

  std::optional<Severity> parseLogLevel(const std::string& name) {
    const std::string level = toLower(name);
    if (level == "none")
      return std::nullopt;
    if (level == "debug")
      return Severity::Debug;
    if (level == "info")
      return Severity::Info;
    if (level == "warning")
      return Severity::Warning;
    if (level == "error")
      return Severity::Error;
    if (level == "critical")
      return Severity::Critical;

    diagnostics()->warn("[Settings] unknown log level '{}', capturing warnings and above", name);
    return Severity::Warning;
  }

} // namespace labsim::core
