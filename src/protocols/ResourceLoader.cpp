/* @file ResourceLoader.cpp
 * @brief non-recursive labware / data discovery on the host filesystem
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

// spdlog headers
#include <spdlog/spdlog.h>

// labsim headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "protocols/ResourceLoader.hpp"

namespace fs = std::filesystem;

namespace labsim::protocols {
  namespace {

    Bytes readFile(const fs::path& path) {
      std::ifstream in(path, std::ios::binary);
      if (!in)
        throw core::ResourceError("cannot read '" + path.string() + "'");
      Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
      if (in.bad())
        throw core::ResourceError("error while reading '" + path.string() + "'");
      return bytes;
    }

    /// Directory entries sorted by name so results never depend on readdir order.
    std::vector<fs::path> listFiles(const fs::path& dir) {
      std::error_code ec;
      fs::directory_iterator it(dir, ec);
      if (ec)
        throw core::ResourceError("cannot list '" + dir.string() + "': " + ec.message());

      std::vector<fs::path> files;
      for (const auto& entry : it) {
        if (entry.is_regular_file(ec))
          files.push_back(entry.path());
      }
      std::sort(files.begin(), files.end());
      return files;
    }

  } // namespace

  std::optional<std::string> labwareUri(const LabwareDefinition& def) {
    if (!def.is_object())
      return std::nullopt;

    auto ns = def.find("namespace");
    auto version = def.find("version");
    auto params = def.find("parameters");
    if (ns == def.end() || !ns->is_string() || version == def.end() ||
        !version->is_number_integer() || params == def.end() || !params->is_object())
      return std::nullopt;

    auto loadName = params->find("loadName");
    if (loadName == params->end() || !loadName->is_string())
      return std::nullopt;

    return ns->get<std::string>() + "/" + loadName->get<std::string>() + "/" +
           std::to_string(version->get<int>());
  }

  LabwareMap labwareFromPaths(const std::vector<std::string>& dirs) {
    LabwareMap labware;
    std::map<std::string, std::string> origin; // uri → file it came from

    for (const auto& dir : dirs) {
      const fs::path root(dir);
      std::error_code ec;
      if (!fs::is_directory(root, ec))
        throw core::ResourceError("labware path '" + dir + "' is not a directory");

      for (const auto& file : listFiles(root)) {
        if (file.extension() != ".json")
          continue;

        const Bytes raw = readFile(file);
        LabwareDefinition def = LabwareDefinition::parse(raw.begin(), raw.end(), nullptr, false);
        auto uri = def.is_discarded() ? std::nullopt : labwareUri(def);
        if (!uri) {
          core::diagnostics()->info("[ResourceLoader] {} is not a labware definition", file.string());
          continue;
        }

        if (auto seen = origin.find(*uri); seen != origin.end())
          throw core::ResourceError("labware " + *uri + " is defined by both '" + seen->second +
                                    "' and '" + file.string() + "'");
        origin.emplace(*uri, file.string());
        labware.emplace(*uri, std::move(def));
      }
    }
    return labware;
  }

  DataMap datafilesFromPaths(const std::vector<std::string>& paths) {
    DataMap data;
    auto put = [&data](const fs::path& file) {
      const std::string name = file.filename().string();
      if (data.count(name))
        core::diagnostics()->warn("[ResourceLoader] data file {} replaces an earlier file of the "
                                  "same name",
                                  file.string());
      data[name] = readFile(file);
    };

    for (const auto& p : paths) {
      const fs::path path(p);
      std::error_code ec;
      if (fs::is_directory(path, ec)) {
        for (const auto& file : listFiles(path))
          put(file);
      } else if (fs::is_regular_file(path, ec)) {
        put(path);
      } else {
        throw core::ResourceError("data path '" + p + "' does not exist");
      }
    }
    return data;
  }

} // namespace labsim::protocols
