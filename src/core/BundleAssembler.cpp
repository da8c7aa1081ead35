/* @file BundleAssembler.cpp
 * @brief deduplicated, deterministic bundle capture after a simulation run
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// labsim headers
#include "core/BundleAssembler.hpp"
#include "core/Errors.hpp"
#include "protocols/ExecutionContext.hpp"

namespace labsim::core {
  namespace {

    protocols::Bytes toBytes(const std::string& s) { return protocols::Bytes(s.begin(), s.end()); }

  } // namespace

  protocols::BundleContents assembleBundle(const protocols::ProtocolDescriptor& protocol,
                                           const protocols::ExecutionContext& ctx) {
    protocols::BundleContents contents;
    contents.protocolSourceText = protocol.rawText;
    contents.bundledData = ctx.bundledData();

    for (const auto& loaded : ctx.loadedLabware()) {
      // first load of a URI wins; later reloads are the same definition
      contents.bundledLabware.try_emplace(loaded.uri, loaded.definition);
    }
    return contents;
  }

  std::map<std::string, protocols::Bytes> bundleArchiveEntries(
      const protocols::BundleContents& contents) {
    std::map<std::string, protocols::Bytes> entries;
    entries.emplace("protocol.ot2.py", toBytes(contents.protocolSourceText));

    std::size_t index = 0;
    for (const auto& [uri, definition] : contents.bundledLabware)
      entries.emplace("labware/" + std::to_string(index++) + ".json", toBytes(definition.dump()));

    for (const auto& [name, bytes] : contents.bundledData)
      entries.emplace("data/" + name, bytes);

    return entries;
  }

  std::optional<std::filesystem::path> bundleDestination(const std::string& requested,
                                                         const std::string& protocolFilename,
                                                         const std::filesystem::path& workingDir) {
    namespace fs = std::filesystem;

    if (requested.empty())
      return std::nullopt;
    if (requested == protocolFilename)
      throw ConfigurationError("Bundle path and input path must be different");

    if (requested != kDefaultBundleKey)
      return fs::path(requested);

    // `.ot2.py` is stripped whole; otherwise only the last extension is replaced
    const fs::path protoPath(protocolFilename);
    fs::path name = protoPath.filename();
    if (name.string().ends_with(".ot2.py"))
      name = name.stem().stem();
    else
      name = name.stem();

    fs::path dest = workingDir / name.replace_extension(".ot2.zip");
    if (dest.lexically_normal() == fs::path(protocolFilename).lexically_normal())
      throw ConfigurationError("Bundle path and input path must be different");
    return dest;
  }

} // namespace labsim::core
