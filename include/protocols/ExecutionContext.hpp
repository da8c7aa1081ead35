#pragma once
/** @file  ExecutionContext.hpp
 *  @brief Per-run, hardware-free state handed to an execution engine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// labsim headers
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "protocols/ProtocolDescriptor.hpp"

namespace labsim::protocols {

  /// One entry of the resource registry: a labware instance as it was loaded.
  struct LoadedLabware {
    std::string uri;
    LabwareDefinition definition;
    std::string slot;
  };

  /**
 * @class ExecutionContext
 * @brief What a current-generation engine runs against.
 *
 *  * Owns the bus the run's commands are published on.
 *  * Records every labware load, in load order, for later bundling.
 *  * When the protocol came with bundled labware, only that labware may be
 *    loaded by URI; otherwise the caller's extra labware is available.
 */
  class ExecutionContext {
  public:
    ExecutionContext(core::Logger& logger, const ProtocolDescriptor& descriptor);
    ~ExecutionContext() = default;

    core::EventBus& bus() noexcept { return bus_; }
    core::Logger& logger() noexcept { return logger_; }

    /// Reset to the deterministic home state (homed, no tip, nothing in motion).
    void home();
    bool homed() const noexcept { return homed_; }
    bool tipAttached() const noexcept { return tipAttached_; }
    void setTipAttached(bool attached) noexcept { tipAttached_ = attached; }

    /// Load a definition the context knows by URI; core::ExecutionError if unknown.
    /// Returns a copy: the registry grows with every load.
    LoadedLabware loadLabware(const std::string& uri, std::string slot);

    /// Load a definition the engine supplies itself (e.g. from its own library).
    LoadedLabware loadLabwareDefinition(const LabwareDefinition& definition, std::string slot);

    /// Resource registry in load order; reloads of the same URI appear again.
    const std::vector<LoadedLabware>& loadedLabware() const noexcept { return registry_; }

    const LabwareMap& availableLabware() const noexcept { return available_; }
    const DataMap& bundledData() const noexcept { return data_; }
    bool restrictedToBundle() const noexcept { return restricted_; }

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

  private:
    core::Logger& logger_;
    core::EventBus bus_;
    LabwareMap available_;
    DataMap data_;
    bool restricted_{ false };
    std::vector<LoadedLabware> registry_;
    bool homed_{ false };
    bool tipAttached_{ false };
  };

  /**
 * @class LegacyContext
 * @brief Explicit per-run stand-in for the legacy engine's robot connection.
 */
  class LegacyContext {
  public:
    explicit LegacyContext(core::Logger& logger) : logger_(logger) {}

    core::EventBus& bus() noexcept { return bus_; }
    core::Logger& logger() noexcept { return logger_; }

    void connect() noexcept { connected_ = true; }
    /// Discard any connection state left over from a previous run.
    void disconnect() noexcept { connected_ = false; }
    bool connected() const noexcept { return connected_; }

    LegacyContext(const LegacyContext&) = delete;
    LegacyContext& operator=(const LegacyContext&) = delete;

  private:
    core::Logger& logger_;
    core::EventBus bus_;
    bool connected_{ false };
  };

} // namespace labsim::protocols
