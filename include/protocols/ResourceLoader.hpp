#pragma once
/** @file  ResourceLoader.hpp
 *  @brief Collects external labware definitions and data files for a run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

#include "protocols/ProtocolDescriptor.hpp"

namespace labsim::protocols {

  /// `<namespace>/<parameters.loadName>/<version>`, or nullopt if \p def is not labware.
  std::optional<std::string> labwareUri(const LabwareDefinition& def);

  /**
 * Load every `*.json` labware definition directly inside each of \p dirs
 * (children are not searched). Files that are not labware are skipped.
 * Throws core::ResourceError if a directory is missing or unreadable, or if two
 * files define the same URI.
 */
  LabwareMap labwareFromPaths(const std::vector<std::string>& dirs);

  /**
 * Files named in \p paths plus the regular files directly inside any
 * directories named there, keyed by bare filename. A later path wins a
 * filename collision. Throws core::ResourceError for a missing path.
 */
  DataMap datafilesFromPaths(const std::vector<std::string>& paths);

} // namespace labsim::protocols
