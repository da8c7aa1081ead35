#pragma once
/** @file  ProtocolEngine.hpp
 *  @brief Abstract interfaces for the two execution engine generations.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace labsim::protocols { // forward decls only
  struct ProtocolDescriptor;
  class ExecutionContext;
  class LegacyContext;
} // namespace labsim::protocols

namespace labsim::protocols {

  /**
 * @class ProtocolEngine
 * @brief Current-generation interpreter.
 *
 *  * Runs synchronously on the caller’s thread.
 *  * Owns no hardware; publishes each command on `ctx.bus()`.
 *  * Logs through `ctx.logger()`.
 *  * Reports domain failures by throwing (core::ExecutionError preferred).
 */
  class ProtocolEngine {
  public:
    virtual ~ProtocolEngine() = default;

    virtual void run(const ProtocolDescriptor& protocol, ExecutionContext& ctx) = 0;
  };

  /**
 * @class LegacyEngine
 * @brief Previous-generation interpreter, one entry point per protocol form.
 */
  class LegacyEngine {
  public:
    virtual ~LegacyEngine() = default;

    /// Structured-instruction (JSON) protocols.
    virtual void executeInstructions(const ProtocolDescriptor& protocol, LegacyContext& ctx) = 0;

    /// Source-form protocols, evaluated directly.
    virtual void evaluateSource(const ProtocolDescriptor& protocol, LegacyContext& ctx) = 0;
  };

} // namespace labsim::protocols
