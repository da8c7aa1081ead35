#pragma once
/** @file  Commands.hpp
 *  @brief Closed set of command kinds, their payload contracts, and the
 *         scoped before/after publisher engines wrap each command in.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// labsim headers
#include "core/EventBus.hpp"
#include "core/Value.hpp"

namespace labsim::protocols {

  enum class CommandKind {
    PickUpTip,
    DropTip,
    Aspirate,
    Dispense,
    Transfer,
    Distribute,
    Consolidate,
    Mix,
    Delay,
    TouchTip,
    BlowOut,
    AirGap,
    Home,
    Comment,
  };

  /// Wire name, e.g. "command.ASPIRATE".
  const char* toString(CommandKind kind);
  std::optional<CommandKind> commandKindFromString(const std::string& name);

  /// Fields every payload of \p kind must carry (besides `text`).
  const std::vector<std::string>& requiredKeys(CommandKind kind);

  /// Template used when the caller does not supply its own `text`.
  const char* defaultText(CommandKind kind);

  /**
 * Build a payload for \p kind from \p fields: fills `text` with the default
 * template when absent, then checks that every required key is present and
 * that every `{placeholder}` in `text` names a field of the payload.
 * Throws std::invalid_argument when the contract is not met.
 */
  core::Value makePayload(CommandKind kind, core::Value fields);

  /**
 * @class CommandScope
 * @brief Publishes a command's Before on construction and its After on
 *        destruction.
 *
 *  * Unwinding because of an exception publishes no After: the aborted
 *    command stays open in any trace built from the bus.
 *  * Nest scopes to express compound commands (a transfer's children are
 *    scopes opened while the transfer's scope is alive).
 */
  class CommandScope {
  public:
    CommandScope(core::EventBus& bus, CommandKind kind, core::Value fields);
    ~CommandScope();

    const core::Value& payload() const noexcept { return payload_; }

    CommandScope(const CommandScope&) = delete;
    CommandScope& operator=(const CommandScope&) = delete;

  private:
    core::EventBus& bus_;
    CommandKind kind_;
    core::Value payload_;
    int uncaught_;
  };

} // namespace labsim::protocols
