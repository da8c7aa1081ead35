#pragma once
/** @file  ProtocolDescriptor.hpp
 *  @brief Parsed protocol + the external resources it may reference.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// labsim headers
#include "core/Value.hpp"

namespace labsim::protocols {

  using Bytes = std::vector<std::uint8_t>;

  /// Opaque labware document; identity is its URI (see labwareUri()).
  using LabwareDefinition = core::Value;

  /// uri → definition. Ordered so anything derived from it is deterministic.
  using LabwareMap = std::map<std::string, LabwareDefinition>;

  /// bare filename → contents.
  using DataMap = std::map<std::string, Bytes>;

  enum class ProtocolKind { PythonSource, JsonInstructions, BundleArchive };

  inline const char* toString(ProtocolKind k) {
    switch (k) {
    case ProtocolKind::PythonSource:
      return "PythonSource";
    case ProtocolKind::JsonInstructions:
      return "JsonInstructions";
    case ProtocolKind::BundleArchive:
      return "BundleArchive";
    default:
      return "Unknown";
    }
  }

  /// Protocol API generation a protocol declares it targets.
  struct ApiLevel {
    int major{ 1 };
    int minor{ 0 };

    bool operator==(const ApiLevel&) const = default;
    std::string toString() const { return std::to_string(major) + "." + std::to_string(minor); }
  };

  inline constexpr ApiLevel kApiV1{ 1, 0 };

  /**
 * @struct BundleContents
 * @brief Logical content of a portable protocol bundle.
 *
 *  * `bundledAuxiliaryModules` is reserved and always empty.
 */
  struct BundleContents {
    std::string protocolSourceText;
    DataMap bundledData;
    LabwareMap bundledLabware;
    std::map<std::string, std::string> bundledAuxiliaryModules;

    bool operator==(const BundleContents&) const = default;
  };

  struct ProtocolDescriptor {
    ProtocolKind kind{ ProtocolKind::PythonSource };
    std::optional<ApiLevel> declaredApiLevel; ///< empty for JSON instructions
    std::string rawText;
    std::string filename;
    core::Value document; ///< parsed JSON for JsonInstructions, null otherwise

    LabwareMap extraLabware; ///< from caller-supplied search directories
    DataMap extraData;       ///< from caller-supplied data paths

    /// Resources shipped inside a bundle; set only for BundleArchive.
    std::optional<LabwareMap> bundledLabware;
    std::optional<DataMap> bundledData;
  };

} // namespace labsim::protocols
