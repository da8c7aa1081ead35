/* @file ProtocolParser.cpp
 * @brief protocol classification, metadata extraction and structural checks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <charconv>
#include <regex>
#include <string>
#include <system_error>

// labsim headers
#include "core/Errors.hpp"
#include "protocols/ProtocolParser.hpp"

namespace labsim::protocols {
  namespace {

    bool endsWith(const std::string& s, const std::string& suffix) { return s.ends_with(suffix); }

    ApiLevel parseApiLevel(const std::string& raw) {
      static const std::regex pattern(R"(^(\d+)(?:\.(\d+))?$)");
      std::smatch m;
      if (!std::regex_match(raw, m, pattern))
        throw core::ParseError("apiLevel '" + raw + "' is not a version");

      auto number = [&raw](const std::ssub_match& part) {
        const std::string digits = part.str();
        int value = 0;
        const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc() || end != digits.data() + digits.size())
          throw core::ParseError("apiLevel '" + raw + "' is not a version");
        return value;
      };
      ApiLevel level{ number(m[1]), m[2].matched ? number(m[2]) : 0 };
      if (level.major != 1 && level.major != 2)
        throw core::ParseError("apiLevel '" + raw + "' is not supported (expected 1 or 2)");
      if (level.major == 1 && level.minor != 0)
        throw core::ParseError("apiLevel '" + raw + "' is not supported (expected 1 or 2)");
      return level;
    }

    ProtocolDescriptor parsePython(const std::string& contents, const std::string& filename) {
      static const std::regex runDef(R"((^|\n)def\s+run\s*\()");
      if (!std::regex_search(contents, runDef))
        throw core::ParseError(filename + ": no top-level run() function defined");

      ProtocolDescriptor d;
      d.kind = ProtocolKind::PythonSource;
      d.declaredApiLevel = declaredApiLevel(contents).value_or(kApiV1);
      return d;
    }

    ProtocolDescriptor parseJson(const std::string& contents, const std::string& filename) {
      core::Value doc;
      try {
        doc = core::Value::parse(contents);
      } catch (const core::Value::parse_error& e) {
        throw core::ParseError(filename + ": invalid JSON: " + e.what());
      }
      if (!doc.is_object())
        throw core::ParseError(filename + ": JSON protocol must be an object");

      int schema = 1;
      if (auto it = doc.find("schemaVersion"); it != doc.end()) {
        if (!it->is_number_integer())
          throw core::ParseError(filename + ": schemaVersion must be an integer");
        schema = it->get<int>();
      } else if (!doc.contains("protocol-schema")) {
        // schema 1 protocols carry "protocol-schema": "1.0.0" instead
        throw core::ParseError(filename + ": missing schemaVersion");
      }
      if (schema < 1 || schema > 3)
        throw core::ParseError(filename + ": unsupported schemaVersion " + std::to_string(schema));

      const char* section = schema >= 3 ? "commands" : "procedure";
      if (!doc.contains(section) || !doc.at(section).is_array())
        throw core::ParseError(filename + ": schema " + std::to_string(schema) +
                               " protocol needs a '" + section + "' array");

      ProtocolDescriptor d;
      d.kind = ProtocolKind::JsonInstructions;
      d.document = std::move(doc);
      return d;
    }

  } // namespace

  std::optional<ApiLevel> declaredApiLevel(const std::string& source) {
    static const std::regex metadataBlock(R"(metadata\s*=\s*\{([^}]*)\})");
    static const std::regex apiLevelEntry(R"(['"]apiLevel['"]\s*:\s*['"]([^'"]*)['"])");

    std::smatch block;
    if (!std::regex_search(source, block, metadataBlock))
      return std::nullopt;

    const std::string body = block[1].str();
    std::smatch entry;
    if (!std::regex_search(body, entry, apiLevelEntry))
      return std::nullopt;
    return parseApiLevel(entry[1].str());
  }

  ProtocolDescriptor parseProtocol(const std::string& contents, const std::string& filename,
                                   LabwareMap extraLabware, DataMap extraData) {
    if (contents.empty())
      throw core::ParseError(filename + ": protocol is empty");

    ProtocolDescriptor d;
    if (endsWith(filename, ".json"))
      d = parseJson(contents, filename);
    else if (endsWith(filename, ".py"))
      d = parsePython(contents, filename);
    else
      throw core::ParseError(filename + ": unknown protocol type (expected .py or .json)");

    d.rawText = contents;
    d.filename = filename;
    d.extraLabware = std::move(extraLabware);
    d.extraData = std::move(extraData);
    return d;
  }

  ProtocolDescriptor parseBundle(const BundleContents& contents, const std::string& filename) {
    if (contents.protocolSourceText.empty())
      throw core::ParseError(filename + ": bundle has no protocol source");
    if (!contents.bundledAuxiliaryModules.empty())
      throw core::ParseError(filename + ": bundled python modules are not supported");

    ProtocolDescriptor d = parsePython(contents.protocolSourceText, filename);
    d.kind = ProtocolKind::BundleArchive;
    d.rawText = contents.protocolSourceText;
    d.filename = filename;
    d.bundledLabware = contents.bundledLabware;
    d.bundledData = contents.bundledData;
    return d;
  }

} // namespace labsim::protocols
