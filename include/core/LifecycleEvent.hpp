#pragma once
/** @file  LifecycleEvent.hpp
 *  @brief Command before/after boundary message and its bus wire shape.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include "core/Value.hpp"

namespace labsim::core {

  enum class Phase { Before, After };

  /**
 * @struct LifecycleEvent
 * @brief Published once per command invocation boundary.
 *
 *  Wire shape on the bus: `{"$": "before"|"after", "name": kind, "payload": {...}}`.
 */
  struct LifecycleEvent {
    Phase phase{ Phase::Before };
    std::string commandKind;
    Value payload = Value::object();

    Value toMessage() const;

    /// std::nullopt if \p message does not have the wire shape above.
    static std::optional<LifecycleEvent> fromMessage(const Value& message);
  };

} // namespace labsim::core
