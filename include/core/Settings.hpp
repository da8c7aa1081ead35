#pragma once
/** @file  Settings.hpp
 *  @brief Global feature flags and per-call simulation options.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include "core/LogRecord.hpp"
#include "core/Value.hpp"

namespace labsim::core {

  class ConfigLoader;

  inline constexpr const char* kUseProtocolApi2Key = "useProtocolApi2";
  inline constexpr const char* kEnableApi1BackcompatKey = "enableApi1BackCompat";
  /// `LABSIM_FF_<key>` overrides the settings file for that key.
  inline constexpr const char* kFeatureFlagEnvPrefix = "LABSIM_FF_";

  /// The only global inputs to engine selection.
  struct FeatureFlags {
    bool useProtocolApiV2{ false };
    bool enableApi1Backcompat{ false };
  };

  /**
 * Read both flags from \p settings (missing key = false), then apply any
 * environment override. Throws ConfigurationError for a non-boolean setting
 * or an override that is not true/false/1/0.
 */
  FeatureFlags loadFeatureFlags(const Value& settings);
  FeatureFlags loadFeatureFlags(const ConfigLoader& loader);

  struct SimulateOptions {
    std::string logLevel{ "warning" }; ///< debug | info | warning | error | none
    bool propagateLogs{ false };
  };

  /// "none" → nullopt (no log capture); unknown names fall back to Warning.
  std::optional<Severity> parseLogLevel(const std::string& name);

} // namespace labsim::core
