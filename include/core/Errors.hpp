#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy for parsing, dispatch, execution and rendering.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>
#include <utility>

#include "core/RunLog.hpp"

namespace labsim::core {

  /// Common base so callers can catch every simulator failure in one place.
  class SimulationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// Malformed protocol descriptor content.
  class ParseError : public SimulationError {
  public:
    using SimulationError::SimulationError;
  };

  /// Incompatible version/flag combination or invalid bundle destination.
  class ConfigurationError : public SimulationError {
  public:
    using SimulationError::SimulationError;
  };

  /// Missing or unreadable external labware / data path.
  class ResourceError : public SimulationError {
  public:
    using SimulationError::SimulationError;
  };

  /// Template substitution failure while rendering a run log.
  class FormatError : public SimulationError {
  public:
    using SimulationError::SimulationError;
  };

  /**
 * @class ExecutionError
 * @brief Engine failure after the tracer was attached.
 *
 *  * Carries whatever RunLog had been traced when the engine failed.
 */
  class ExecutionError : public SimulationError {
  public:
    explicit ExecutionError(const std::string& what, RunLog partial = {})
        : SimulationError(what), partial_(std::move(partial)) {}

    const RunLog& partialRunLog() const noexcept { return partial_; }

  private:
    RunLog partial_;
  };

} // namespace labsim::core
