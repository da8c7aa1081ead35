#pragma once
/** @file  RunLogFormatter.hpp
 *  @brief Pure RunLog → human-readable text rendering.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include "core/RunLog.hpp"
#include "core/Value.hpp"

namespace labsim::core {

  /// Header line placed above a span's log records.
  inline constexpr const char* kLogsHeader = "Logs from this command:";

  /**
 * Substitute `{key}` placeholders in \p text from the flat top-level fields of
 * \p fields. `{{` and `}}` are literal braces. Unknown keys, unbalanced braces,
 * and empty placeholders throw FormatError; nothing is ever left unresolved.
 */
  std::string renderTemplate(const std::string& text, const Value& fields);

  /// Keys referenced by \p text, in order of appearance (FormatError if malformed).
  std::vector<std::string> templateKeys(const std::string& text);

  /**
 * One line per span, indented with one tab per nesting level. Spans with
 * logs get a `kLogsHeader` line and one `"<SEVERITY> (<module>): <message>"`
 * line per record. Lines are joined with '\n'. Throws FormatError; the
 * RunLog itself is never touched.
 */
  std::string formatRunLog(const RunLog& runLog);

} // namespace labsim::core
