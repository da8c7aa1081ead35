/* @file RunLogFormatter.cpp
 * @brief restricted flat-key templating + run log text layout
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <functional>
#include <sstream>

// fmt headers
#include <fmt/format.h>

// labsim headers
#include "core/Errors.hpp"
#include "core/RunLogFormatter.hpp"

namespace labsim::core {
  namespace {

    /// Walk \p text, calling \p onLiteral for literal runs and \p onKey per placeholder.
    void scanTemplate(const std::string& text, const std::function<void(char)>& onLiteral,
                      const std::function<void(const std::string&)>& onKey) {
      std::size_t i = 0;
      while (i < text.size()) {
        const char c = text[i];
        if (c == '{') {
          if (i + 1 < text.size() && text[i + 1] == '{') {
            onLiteral('{');
            i += 2;
            continue;
          }
          const auto close = text.find('}', i + 1);
          if (close == std::string::npos)
            throw FormatError("unterminated placeholder in template: " + text);
          const std::string key = text.substr(i + 1, close - i - 1);
          if (key.empty() || key.find('{') != std::string::npos)
            throw FormatError("malformed placeholder '{" + key + "}' in template: " + text);
          onKey(key);
          i = close + 1;
        } else if (c == '}') {
          if (i + 1 < text.size() && text[i + 1] == '}') {
            onLiteral('}');
            i += 2;
            continue;
          }
          throw FormatError("single '}' in template: " + text);
        } else {
          onLiteral(c);
          ++i;
        }
      }
    }

    std::string renderValue(const Value& v) {
      if (v.is_string())
        return v.get<std::string>();
      return v.dump();
    }

  } // namespace

  std::string renderTemplate(const std::string& text, const Value& fields) {
    std::string out;
    out.reserve(text.size());
    scanTemplate(
        text, [&out](char c) { out.push_back(c); },
        [&](const std::string& key) {
          if (!fields.is_object() || !fields.contains(key))
            throw FormatError("template references '" + key + "' which is not in the payload");
          out += renderValue(fields.at(key));
        });
    return out;
  }

  std::vector<std::string> templateKeys(const std::string& text) {
    std::vector<std::string> keys;
    scanTemplate(
        text, [](char) {}, [&keys](const std::string& key) { keys.push_back(key); });
    return keys;
  }

  std::string formatRunLog(const RunLog& runLog) {
    std::ostringstream out;
    bool first = true;
    auto line = [&](const std::string& indent, const std::string& content) {
      if (!first)
        out << '\n';
      first = false;
      out << indent << content;
    };

    for (const auto& span : runLog) {
      const std::string indent(span.level, '\t');

      std::string text;
      if (auto it = span.payload.find("text"); it != span.payload.end()) {
        if (!it->is_string())
          throw FormatError("payload 'text' must be a string template");
        text = renderTemplate(it->get<std::string>(), span.payload);
      }
      line(indent, text);

      if (span.logs.empty())
        continue;
      line(indent, kLogsHeader);
      for (const auto& record : span.logs) {
        std::string message;
        try {
          message = renderMessage(record);
        } catch (const fmt::format_error& e) {
          throw FormatError("cannot apply args to log message '" + record.message + "': " +
                            e.what());
        }
        line(indent, fmt::format("{} ({}): {}", toString(record.severity), record.moduleName,
                                 message));
      }
    }
    return out.str();
  }

} // namespace labsim::core
