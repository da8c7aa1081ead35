/* @file ProtocolDispatcher.cpp
 * @brief engine selection, scoped tracing of one simulation run, post-run bundling
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <string>

// spdlog headers
#include <spdlog/spdlog.h>

// labsim headers
#include "core/BundleAssembler.hpp"
#include "core/Errors.hpp"
#include "core/EventBus.hpp"
#include "core/ProtocolDispatcher.hpp"
#include "core/SpanTracer.hpp"
#include "protocols/ExecutionContext.hpp"
#include "protocols/ProtocolEngine.hpp"
#include "protocols/ProtocolParser.hpp"
#include "protocols/ResourceLoader.hpp"

using namespace labsim::core;
using labsim::protocols::ProtocolDescriptor;
using labsim::protocols::ProtocolKind;

namespace {

  /// Run \p body under \p tracer; any escape becomes an ExecutionError holding the partial log.
  template <typename Body>
  RunLog traced(SpanTracer& tracer, const ProtocolDescriptor& protocol, Body&& body) {
    try {
      body();
    } catch (const ExecutionError& e) {
      throw ExecutionError(e.what(), tracer.takeRunLog());
    } catch (const std::exception& e) {
      throw ExecutionError("[ProtocolDispatcher] " + protocol.filename + " failed: " + e.what(),
                           tracer.takeRunLog());
    }
    return tracer.takeRunLog();
  }

} // namespace

ProtocolDispatcher::ProtocolDispatcher(protocols::ProtocolEngine& current,
                                       protocols::LegacyEngine& legacy,
                                       std::shared_ptr<ErrorMonitor> errorMonitor)
    : current_(current), legacy_(legacy), errorMonitor_(std::move(errorMonitor)) {}

EngineVariant ProtocolDispatcher::selectEngine(const ProtocolDescriptor& protocol,
                                               const FeatureFlags& flags) {
  if (!flags.useProtocolApiV2)
    return EngineVariant::Legacy;

  if (protocol.declaredApiLevel && protocol.declaredApiLevel->major == 1 &&
      !flags.enableApi1Backcompat) {
    throw ConfigurationError(
        "This protocol targets Protocol API V1, but the simulator is set to Protocol API V2. "
        "If this is actually a V2 protocol, please set the 'apiLevel' to '2' in the metadata. "
        "If you do not want to be on API V2, please disable the 'useProtocolApi2' feature "
        "flag.");
  }
  return EngineVariant::Current;
}

SimulationResult ProtocolDispatcher::simulate(const ProtocolDescriptor& protocol,
                                              const FeatureFlags& flags,
                                              const SimulateOptions& options, Logger& logger) {
  EngineVariant engine;
  try {
    engine = selectEngine(protocol, flags);
  } catch (const ConfigurationError& e) {
    report(e);
    throw;
  }

  diagnostics()->debug("[ProtocolDispatcher] {} ({}) -> {} engine", protocol.filename,
                       protocols::toString(protocol.kind), toString(engine));
  // propagation forwards only what the tracer would capture
  if (auto level = parseLogLevel(options.logLevel))
    logger.setLevel(*level);
  logger.setPropagate(options.propagateLogs);

  try {
    return engine == EngineVariant::Current ? runCurrent(protocol, options, logger)
                                            : runLegacy(protocol, options, logger);
  } catch (const ExecutionError& e) {
    report(e);
    throw;
  }
}

SimulationResult ProtocolDispatcher::simulateFile(const std::string& contents,
                                                  const std::string& filename,
                                                  const std::vector<std::string>& labwarePaths,
                                                  const std::vector<std::string>& dataPaths,
                                                  const FeatureFlags& flags,
                                                  const SimulateOptions& options,
                                                  Logger& logger) {
  ProtocolDescriptor protocol;
  try {
    auto labware = labwarePaths.empty() ? protocols::LabwareMap{}
                                        : protocols::labwareFromPaths(labwarePaths);
    auto data = dataPaths.empty() ? protocols::DataMap{} : protocols::datafilesFromPaths(dataPaths);
    protocol = protocols::parseProtocol(contents, filename, std::move(labware), std::move(data));
  } catch (const ParseError& e) {
    report(e);
    throw;
  } catch (const ResourceError& e) {
    report(e);
    throw;
  }
  return simulate(protocol, flags, options, logger);
}

SimulationResult ProtocolDispatcher::runCurrent(const ProtocolDescriptor& protocol,
                                                const SimulateOptions& options, Logger& logger) {
  protocols::ExecutionContext ctx(logger, protocol);
  ctx.home();

  SpanTracer tracer(ctx.bus(), kCommandTopic, logger, parseLogLevel(options.logLevel));
  SimulationResult result;
  result.engine = EngineVariant::Current;
  result.runLog = traced(tracer, protocol, [&] { current_.run(protocol, ctx); });

  if (protocol.kind == ProtocolKind::PythonSource && !protocol.bundledLabware)
    result.bundle = assembleBundle(protocol, ctx);
  return result;
}

SimulationResult ProtocolDispatcher::runLegacy(const ProtocolDescriptor& protocol,
                                               const SimulateOptions& options, Logger& logger) {
  protocols::LegacyContext ctx(logger);
  ctx.disconnect();

  SpanTracer tracer(ctx.bus(), kCommandTopic, logger, parseLogLevel(options.logLevel));
  SimulationResult result;
  result.engine = EngineVariant::Legacy;
  result.runLog = traced(tracer, protocol, [&] {
    if (protocol.kind == ProtocolKind::JsonInstructions)
      legacy_.executeInstructions(protocol, ctx);
    else
      legacy_.evaluateSource(protocol, ctx);
  });
  return result;
}

void ProtocolDispatcher::report(const SimulationError& error) const {
  diagnostics()->error("[ProtocolDispatcher] {}", error.what());
  if (errorMonitor_)
    errorMonitor_->notifyFailure(error.what());
}
