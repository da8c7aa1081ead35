#pragma once
/** @file  ProtocolDispatcher.hpp
 *  @brief Picks the execution engine for a protocol, traces the run, bundles it.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <optional>
#include <string>
#include <vector>

// labsim headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/RunLog.hpp"
#include "core/Settings.hpp"
#include "protocols/ProtocolDescriptor.hpp"

namespace labsim::protocols {
  class ProtocolEngine;
  class LegacyEngine;
} // namespace labsim::protocols

namespace labsim {
  namespace core {

    enum class EngineVariant { Current, Legacy };

    inline const char* toString(EngineVariant e) {
      switch (e) {
      case EngineVariant::Current:
        return "current";
      case EngineVariant::Legacy:
        return "legacy";
      default:
        return "unknown";
      }
    }

    struct SimulationResult {
      RunLog runLog;
      std::optional<protocols::BundleContents> bundle; ///< current engine + unbundled source only
      EngineVariant engine{ EngineVariant::Current };
    };

    /**
 * @class ProtocolDispatcher
 * @brief Owns the decision table from (descriptor, flags) to engine, and the
 *        tracer attach/detach around the engine call.
 *
 *  * The engine is chosen once, before anything is attached, and never
 *    re-branched on.
 *  * Fatal errors are reported to the ErrorMonitor (if any) and re-thrown.
 *  * An engine failure surfaces as ExecutionError carrying the partial RunLog.
 */
    class ProtocolDispatcher {
    public:
      ProtocolDispatcher(protocols::ProtocolEngine& current, protocols::LegacyEngine& legacy,
                         std::shared_ptr<ErrorMonitor> errorMonitor = nullptr);
      ~ProtocolDispatcher() = default;

      //---public API------------------------------------------------------
      /// Decision table only; throws ConfigurationError for v1 under v2 without backcompat.
      static EngineVariant selectEngine(const protocols::ProtocolDescriptor& protocol,
                                        const FeatureFlags& flags);

      SimulationResult simulate(const protocols::ProtocolDescriptor& protocol,
                                const FeatureFlags& flags, const SimulateOptions& options,
                                Logger& logger);

      /// Resolve external labware/data, parse \p contents, then simulate().
      SimulationResult simulateFile(const std::string& contents, const std::string& filename,
                                    const std::vector<std::string>& labwarePaths,
                                    const std::vector<std::string>& dataPaths,
                                    const FeatureFlags& flags, const SimulateOptions& options,
                                    Logger& logger);

    private:
      SimulationResult runCurrent(const protocols::ProtocolDescriptor& protocol,
                                  const SimulateOptions& options, Logger& logger);
      SimulationResult runLegacy(const protocols::ProtocolDescriptor& protocol,
                                 const SimulateOptions& options, Logger& logger);
      void report(const SimulationError& error) const;

      protocols::ProtocolEngine& current_;
      protocols::LegacyEngine& legacy_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
    };

  } // namespace core
} // namespace labsim
