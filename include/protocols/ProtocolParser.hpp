#pragma once
/** @file  ProtocolParser.hpp
 *  @brief Raw protocol text (or extracted bundle) → ProtocolDescriptor.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include "protocols/ProtocolDescriptor.hpp"

namespace labsim::protocols {

  /**
 * Classify and validate \p contents by \p filename's extension.
 *
 *  * `.py`   → PythonSource; must define `run(`; `metadata['apiLevel']` is
 *              '1' or '2[.minor]', absent means v1.
 *  * `.json` → JsonInstructions; object with integer `schemaVersion` 1..3 and
 *              its `commands` (v3) or `procedure` (v1/v2) section.
 *
 * Throws core::ParseError for anything else.
 */
  ProtocolDescriptor parseProtocol(const std::string& contents, const std::string& filename,
                                   LabwareMap extraLabware = {}, DataMap extraData = {});

  /// A bundle whose archive has already been extracted into \p contents.
  ProtocolDescriptor parseBundle(const BundleContents& contents, const std::string& filename);

  /// `metadata = {... 'apiLevel': 'X' ...}` lookup; nullopt if not declared.
  std::optional<ApiLevel> declaredApiLevel(const std::string& source);

} // namespace labsim::protocols
