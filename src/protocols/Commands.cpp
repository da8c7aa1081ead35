/* @file Commands.cpp
 * @brief command payload contracts and scoped lifecycle publishing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <exception>
#include <stdexcept>

// spdlog headers
#include <spdlog/spdlog.h>

// labsim headers
#include "core/Errors.hpp"
#include "core/LifecycleEvent.hpp"
#include "core/Logger.hpp"
#include "core/RunLogFormatter.hpp"
#include "protocols/Commands.hpp"

namespace labsim::protocols {
  namespace {

    struct CommandContract {
      CommandKind kind;
      const char* name;
      const char* text;
      std::vector<std::string> required;
    };

    const std::array<CommandContract, 14>& contracts() {
      static const std::array<CommandContract, 14> table{ {
          { CommandKind::PickUpTip, "command.PICK_UP_TIP", "Picking up tip {location}",
            { "location" } },
          { CommandKind::DropTip, "command.DROP_TIP", "Dropping tip {location}", { "location" } },
          { CommandKind::Aspirate, "command.ASPIRATE",
            "Aspirating {volume} uL from {location} at {rate} speed",
            { "volume", "location", "rate" } },
          { CommandKind::Dispense, "command.DISPENSE", "Dispensing {volume} uL into {location}",
            { "volume", "location", "rate" } },
          { CommandKind::Transfer, "command.TRANSFER", "Transferring {volume} from {source} to {dest}",
            { "volume", "source", "dest" } },
          { CommandKind::Distribute, "command.DISTRIBUTE",
            "Distributing {volume} from {source} to {dest}", { "volume", "source", "dest" } },
          { CommandKind::Consolidate, "command.CONSOLIDATE",
            "Consolidating {volume} from {source} to {dest}", { "volume", "source", "dest" } },
          { CommandKind::Mix, "command.MIX", "Mixing {repetitions} times with a volume of {volume} ul",
            { "repetitions", "volume", "location" } },
          { CommandKind::Delay, "command.DELAY", "Delaying for {minutes}m {seconds}s",
            { "minutes", "seconds" } },
          { CommandKind::TouchTip, "command.TOUCH_TIP", "Touching tip", {} },
          { CommandKind::BlowOut, "command.BLOW_OUT", "Blowing out at {location}", { "location" } },
          { CommandKind::AirGap, "command.AIR_GAP", "Air gap of {volume} uL at height {height}",
            { "volume", "height" } },
          { CommandKind::Home, "command.HOME", "Homing pipette plunger on mount {mount}",
            { "mount" } },
          { CommandKind::Comment, "command.COMMENT", "{msg}", { "msg" } },
      } };
      return table;
    }

    const CommandContract& contractFor(CommandKind kind) {
      for (const auto& contract : contracts()) {
        if (contract.kind == kind)
          return contract;
      }
      throw std::out_of_range("[Commands] unknown command kind");
    }

  } // namespace

  const char* toString(CommandKind kind) { return contractFor(kind).name; }

  std::optional<CommandKind> commandKindFromString(const std::string& name) {
    for (const auto& contract : contracts()) {
      if (name == contract.name)
        return contract.kind;
    }
    return std::nullopt;
  }

  const std::vector<std::string>& requiredKeys(CommandKind kind) { return contractFor(kind).required; }

  const char* defaultText(CommandKind kind) { return contractFor(kind).text; }

  core::Value makePayload(CommandKind kind, core::Value fields) {
    if (fields.is_null())
      fields = core::Value::object();
    if (!fields.is_object())
      throw std::invalid_argument(std::string("[Commands] ") + toString(kind) +
                                  " payload must be an object");

    const auto& contract = contractFor(kind);
    if (!fields.contains("text"))
      fields["text"] = contract.text;
    else if (!fields["text"].is_string())
      throw std::invalid_argument(std::string("[Commands] ") + contract.name +
                                  " payload text must be a string");

    for (const auto& key : contract.required) {
      if (!fields.contains(key))
        throw std::invalid_argument(std::string("[Commands] ") + contract.name +
                                    " payload is missing '" + key + "'");
    }

    std::vector<std::string> keys;
    try {
      keys = core::templateKeys(fields["text"].get<std::string>());
    } catch (const core::FormatError& e) {
      throw std::invalid_argument(std::string("[Commands] ") + contract.name + ": " + e.what());
    }
    for (const auto& key : keys) {
      if (!fields.contains(key))
        throw std::invalid_argument(std::string("[Commands] ") + contract.name + " text references '" +
                                    key + "' which the payload does not carry");
    }
    return fields;
  }

  //---CommandScope------------------------------------------------------

  CommandScope::CommandScope(core::EventBus& bus, CommandKind kind, core::Value fields)
      : bus_(bus), kind_(kind), payload_(makePayload(kind, std::move(fields))),
        uncaught_(std::uncaught_exceptions()) {
    bus_.publish(core::kCommandTopic,
                 core::LifecycleEvent{ core::Phase::Before, toString(kind_), payload_ }.toMessage());
  }

  CommandScope::~CommandScope() {
    if (std::uncaught_exceptions() > uncaught_)
      return; // aborted: leave the span open

    try {
      bus_.publish(core::kCommandTopic,
                   core::LifecycleEvent{ core::Phase::After, toString(kind_), payload_ }.toMessage());
    } catch (const std::exception& e) {
      core::diagnostics()->error("[CommandScope] publishing after-event for {} failed: {}",
                                 toString(kind_), e.what());
    }
  }

} // namespace labsim::protocols
