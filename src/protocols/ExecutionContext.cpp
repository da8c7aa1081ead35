/* @file ExecutionContext.cpp
 * @brief resource registry + labware resolution for the current-generation engine
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// labsim headers
#include "core/Errors.hpp"
#include "protocols/ExecutionContext.hpp"
#include "protocols/ResourceLoader.hpp"

using namespace labsim::protocols;

ExecutionContext::ExecutionContext(core::Logger& logger, const ProtocolDescriptor& descriptor)
    : logger_(logger) {
  if (descriptor.bundledLabware) {
    available_ = *descriptor.bundledLabware;
    restricted_ = true;
  } else {
    available_ = descriptor.extraLabware;
  }
  data_ = descriptor.bundledData ? *descriptor.bundledData : descriptor.extraData;
}

void ExecutionContext::home() {
  homed_ = true;
  tipAttached_ = false;
  logger_.log(core::Severity::Debug, "execution_context", "homed all axes");
}

LoadedLabware ExecutionContext::loadLabware(const std::string& uri, std::string slot) {
  auto it = available_.find(uri);
  if (it == available_.end()) {
    throw core::ExecutionError(restricted_ ? "labware " + uri + " is not part of the bundle"
                                           : "unknown labware " + uri);
  }
  registry_.push_back(LoadedLabware{ uri, it->second, std::move(slot) });
  return registry_.back();
}

LoadedLabware ExecutionContext::loadLabwareDefinition(const LabwareDefinition& definition,
                                                      std::string slot) {
  auto uri = labwareUri(definition);
  if (!uri)
    throw core::ExecutionError("labware definition has no namespace/loadName/version");
  if (restricted_ && !available_.count(*uri))
    throw core::ExecutionError("labware " + *uri + " is not part of the bundle");

  registry_.push_back(LoadedLabware{ *uri, definition, std::move(slot) });
  return registry_.back();
}
