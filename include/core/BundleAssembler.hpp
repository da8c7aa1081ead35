#pragma once
/** @file  BundleAssembler.hpp
 *  @brief Post-run snapshot of a protocol plus every resource it touched.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "protocols/ProtocolDescriptor.hpp"

namespace labsim::protocols {
  class ExecutionContext;
} // namespace labsim::protocols

namespace labsim::core {

  /// Bundle request that means "derive the name from the protocol file".
  inline constexpr const char* kDefaultBundleKey = "PROTOCOL.ot2.zip";

  /**
 * Walk \p ctx's registry in load order copying each URI's definition the first
 * time it is seen; take the run's data files and \p protocol's source text.
 * Same load order + same inputs ⇒ identical BundleContents.
 */
  protocols::BundleContents assembleBundle(const protocols::ProtocolDescriptor& protocol,
                                           const protocols::ExecutionContext& ctx);

  /**
 * Archive path → bytes, as a bundle writer lays them out:
 * `protocol.ot2.py`, `labware/<n>.json` (URI order), `data/<bare filename>`.
 */
  std::map<std::string, protocols::Bytes> bundleArchiveEntries(
      const protocols::BundleContents& contents);

  /**
 * Where to write the bundle for \p protocolFilename.
 *
 *  * empty \p requested → no bundle (nullopt).
 *  * kDefaultBundleKey  → `<workingDir>/<protocol stem>.ot2.zip` (`.ot2.py` is
 *    stripped as a whole).
 *  * otherwise          → \p requested as given.
 *
 * Throws ConfigurationError if the destination is the protocol file itself.
 */
  std::optional<std::filesystem::path> bundleDestination(const std::string& requested,
                                                         const std::string& protocolFilename,
                                                         const std::filesystem::path& workingDir);

} // namespace labsim::core
