#pragma once
/** @file  LogRecord.hpp
 *  @brief Unformatted diagnostic log record + severity scale.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>
#include <vector>

// labsim headers
#include "core/Value.hpp"

namespace labsim {
  namespace core {

    enum class Severity : std::uint8_t { Debug, Info, Warning, Error, Critical };

    inline const char* toString(Severity s) {
      switch (s) {
      case Severity::Debug:
        return "DEBUG";
      case Severity::Info:
        return "INFO";
      case Severity::Warning:
        return "WARNING";
      case Severity::Error:
        return "ERROR";
      case Severity::Critical:
        return "CRITICAL";
      default:
        return "UNKNOWN";
      }
    }

    /**
 * @struct LogRecord
 * @brief One diagnostic message as emitted, before any formatting.
 *
 *  * `message` is an fmt-style template (`{}` placeholders).
 *  * `args` are applied only when the record is rendered.
 */
    struct LogRecord {
      Severity severity{ Severity::Info };
      std::string moduleName;
      std::string message;
      std::vector<Value> args;
    };

    /// Apply `args` to `message`; throws `fmt::format_error` on a bad template.
    std::string renderMessage(const LogRecord& record);

  } // namespace core
} // namespace labsim
