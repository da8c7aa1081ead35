/* @file LifecycleEvent.cpp
 * @brief (de)serialisation of command lifecycle messages
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/LifecycleEvent.hpp"

namespace labsim::core {

  Value LifecycleEvent::toMessage() const {
    Value message = Value::object();
    message["$"] = phase == Phase::Before ? "before" : "after";
    message["name"] = commandKind;
    message["payload"] = payload;
    return message;
  }

  std::optional<LifecycleEvent> LifecycleEvent::fromMessage(const Value& message) {
    if (!message.is_object())
      return std::nullopt;

    auto phase = message.find("$");
    auto payload = message.find("payload");
    if (phase == message.end() || !phase->is_string() || payload == message.end() ||
        !payload->is_object())
      return std::nullopt;

    LifecycleEvent event;
    const auto& tag = phase->get_ref<const std::string&>();
    if (tag == "before")
      event.phase = Phase::Before;
    else if (tag == "after")
      event.phase = Phase::After;
    else
      return std::nullopt;

    if (auto name = message.find("name"); name != message.end() && name->is_string())
      event.commandKind = name->get<std::string>();
    event.payload = *payload;
    return event;
  }

} // namespace labsim::core
