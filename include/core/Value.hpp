#pragma once
/** @file  Value.hpp
 *  @brief Structured value type shared by payloads, log args and labware documents.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <nlohmann/json.hpp>

namespace labsim::core {

  /// Insertion-ordered JSON so payloads and definitions keep their authored key order.
  using Value = nlohmann::ordered_json;

} // namespace labsim::core
